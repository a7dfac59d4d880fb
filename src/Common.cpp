#include "Common.hpp"

#include <cstdio>
#include <cstdarg>
#include <cstdlib>
#include <cstring>

#include <errno.h>
#include <sys/time.h>
#include <time.h>
#include <unistd.h>

namespace hs
{

// error_code < 0 means there is no OS error to append.
static void PrintFatal(int error_code, const char* fmt, va_list args)
{
  fputs("hashsig: fatal: ", stderr);
  vfprintf(stderr, fmt, args);
  if (error_code >= 0)
    fprintf(stderr, ": %s (%d)", strerror(error_code), error_code);
  fputc('\n', stderr);
  fflush(stderr);
}

void NORETURN Croak(const char* fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  PrintFatal(-1, fmt, args);
  va_end(args);
  exit(1);
}

void NORETURN CroakErrno(const char* fmt, ...)
{
  int error_code = errno;
  va_list args;
  va_start(args, fmt);
  PrintFatal(error_code, fmt, args);
  va_end(args);
  exit(1);
}

void NORETURN CroakError(int error_code, const char* fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  PrintFatal(error_code, fmt, args);
  va_end(args);
  exit(1);
}

void NORETURN CroakAbort(const char* fmt, ...)
{
  va_list args;
  va_start(args, fmt);
  PrintFatal(-1, fmt, args);
  va_end(args);
  abort();
}

static int s_LogFlags = kError | kWarning;

void SetLogFlags(int log_flags)
{
  s_LogFlags = log_flags;
}

static const char* LogLevelName(LogLevel level)
{
  switch (level)
  {
    case kError:   return "error";
    case kWarning: return "warning";
    case kInfo:    return "info";
    case kDebug:   return "debug";
    case kSpam:    return "spam";
  }
  return "?";
}

void Log(LogLevel level, const char* fmt, ...)
{
  if (0 == (s_LogFlags & level))
    return;

  // One fputs per message keeps lines from worker threads whole.
  char line[2048];
  int len = snprintf(line, sizeof line, "hashsig: %s: ", LogLevelName(level));

  va_list args;
  va_start(args, fmt);
  vsnprintf(line + len, sizeof line - len - 1, fmt, args);
  va_end(args);

  strcat(line, "\n");
  fputs(line, stderr);
}

uint32_t Djb2Hash(const char* str)
{
  uint32_t hash = 5381;
  for (const uint8_t* p = (const uint8_t*) str; *p; ++p)
    hash = hash * 33 + *p;
  return hash ? hash : 1;
}

static inline int AsciiLower(int ch)
{
  return (ch >= 'A' && ch <= 'Z') ? ch + ('a' - 'A') : ch;
}

bool StrEqualNoCase(const char* a, const char* b)
{
  const uint8_t* l = (const uint8_t*) a;
  const uint8_t* r = (const uint8_t*) b;

  while (*l && AsciiLower(*l) == AsciiLower(*r))
  {
    ++l;
    ++r;
  }

  return AsciiLower(*l) == AsciiLower(*r);
}

bool StrHasPrefixNoCase(const char* str, const char* prefix)
{
  size_t len = strlen(prefix);
  for (size_t i = 0; i < len; ++i)
  {
    if (AsciiLower((uint8_t) str[i]) != AsciiLower((uint8_t) prefix[i]))
      return false;
  }
  return true;
}

void StrLowerInPlace(char* str)
{
  for (; *str; ++str)
    *str = (char) AsciiLower((uint8_t) *str);
}

uint64_t TimerGet()
{
  struct timespec ts;
  if (0 != clock_gettime(CLOCK_MONOTONIC, &ts))
    CroakErrno("clock_gettime failed");
  return uint64_t(ts.tv_sec) * 1000000 + uint64_t(ts.tv_nsec) / 1000;
}

double TimerToSeconds(uint64_t t)
{
  return t / 1000000.0;
}

double TimerDiffSeconds(uint64_t start, uint64_t end)
{
  return TimerToSeconds(end - start);
}

void FormatUtcTimestamp(char (&buffer)[kTimestampStringSize], uint64_t epoch_seconds)
{
  time_t t = (time_t) epoch_seconds;
  struct tm utc;

  if (nullptr == gmtime_r(&t, &utc) ||
      0 == strftime(buffer, sizeof buffer, "%Y-%m-%dT%H:%M:%SZ", &utc))
  {
    // Out of range for struct tm.
    strcpy(buffer, "1970-01-01T00:00:00Z");
  }
}

uint64_t WallClockNow()
{
  struct timeval tv;
  if (0 != gettimeofday(&tv, nullptr))
    CroakErrno("gettimeofday failed");
  return uint64_t(tv.tv_sec);
}

int GetCpuCount()
{
  long count = sysconf(_SC_NPROCESSORS_ONLN);
  if (count < 0)
    CroakErrno("couldn't get CPU count");
  return count > 0 ? int(count) : 1;
}

}
