#ifndef COMMON_HPP
#define COMMON_HPP

#include "Config.hpp"

#include <cstddef>
#include <stdint.h>

#define MB(n) ((n) * 1024 * 1024)
#define KB(n) ((n) * 1024)

#define ARRAY_SIZE(a) (sizeof((a)) / sizeof((a)[0]))

#if ENABLED(CHECKED_BUILD)
#define CHECK(expr) \
do { if (!(expr)) ::hs::CroakAbort("%s(%d): check failure %s", __FILE__, __LINE__, #expr); } while(0)
#else
#define CHECK(expr) do {} while(0)
#endif

#define HS_PRINTF_LIKE(fmt_index) __attribute__((format(printf, fmt_index, fmt_index + 1)))

namespace hs
{

// Fatal errors. These print to stderr and exit(1); CroakAbort aborts
// instead so a debugger or core dump catches the failed CHECK.
void NORETURN Croak(const char* fmt, ...) HS_PRINTF_LIKE(1);
void NORETURN CroakErrno(const char* fmt, ...) HS_PRINTF_LIKE(1);
void NORETURN CroakError(int error_code, const char* fmt, ...) HS_PRINTF_LIKE(2);
void NORETURN CroakAbort(const char* fmt, ...) HS_PRINTF_LIKE(1);

enum LogLevel
{
  kError        = 1 << 0,
  kWarning      = 1 << 1,
  kInfo         = 1 << 2,
  kDebug        = 1 << 3,
  kSpam         = 1 << 4
};

// Bitmask of LogLevel values that reach stderr. Errors and warnings by default.
void SetLogFlags(int log_flags);

void Log(LogLevel level, const char* fmt, ...) HS_PRINTF_LIKE(2);

// DJB-2 over the bytes of `str`. Never returns zero.
uint32_t Djb2Hash(const char* str);

// ASCII-only case folding; bytes >= 0x80 compare as they are.
bool StrEqualNoCase(const char* a, const char* b);
bool StrHasPrefixNoCase(const char* str, const char* prefix);
void StrLowerInPlace(char* str);

// Microsecond timer for durations.
uint64_t TimerGet();
double TimerToSeconds(uint64_t t);
double TimerDiffSeconds(uint64_t start, uint64_t end);

enum
{
  kTimestampStringSize = 21 // YYYY-MM-DDTHH:MM:SSZ + nul
};

// ISO-8601 UTC, e.g. 2023-11-14T22:13:20Z.
void FormatUtcTimestamp(char (&buffer)[kTimestampStringSize], uint64_t epoch_seconds);

// Seconds since the epoch.
uint64_t WallClockNow();

int GetCpuCount();

}

#endif
