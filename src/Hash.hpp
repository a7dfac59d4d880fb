#ifndef HASH_HPP
#define HASH_HPP

#include "Common.hpp"

#include <stdio.h>

struct evp_md_ctx_st;

namespace hs
{

namespace HashAlgorithm
{
  enum Enum
  {
    kMd5,
    kSha1,
    kSha256,
    kSha512,
    kCount
  };

  extern const char* const Names[kCount];
}

enum
{
  kAllHashAlgorithms = (1 << HashAlgorithm::kCount) - 1,
  kMaxDigestHexSize  = 2 * 64 + 1     // SHA-512 plus terminator
};

inline uint32_t HashAlgorithmBit(HashAlgorithm::Enum algorithm)
{
  return 1u << algorithm;
}

inline bool HashAlgorithmInSet(uint32_t algorithms, HashAlgorithm::Enum algorithm)
{
  return 0 != (algorithms & HashAlgorithmBit(algorithm));
}

int HashAlgorithmCount(uint32_t algorithms);

// Number of hex characters in a digest of this kind.
size_t HashAlgorithmHexLength(HashAlgorithm::Enum algorithm);

// Accepts the canonical names in any case, and the dashed spellings (SHA-256).
bool HashAlgorithmFromName(const char* name, HashAlgorithm::Enum* out);

// Parse a comma separated list such as "MD5,SHA256" into a bit set. An
// unknown name fails with a message naming it.
bool HashAlgorithmParseList(const char* list, uint32_t* algorithms_out, char* error, size_t error_size);

// Uppercase hex digests for the algorithms in m_Algorithms.
struct DigestResult
{
  uint32_t m_Algorithms;
  uint64_t m_BytesHashed;
  char     m_Hex[HashAlgorithm::kCount][kMaxDigestHexSize];
};

inline const char* DigestResultGet(const DigestResult* result, HashAlgorithm::Enum algorithm)
{
  return HashAlgorithmInSet(result->m_Algorithms, algorithm) ? result->m_Hex[algorithm] : nullptr;
}

// One accumulator per requested algorithm, all fed from the same buffers.
struct DigestEngine
{
  uint32_t        m_Algorithms;
  uint64_t        m_BytesHashed;
  evp_md_ctx_st*  m_Contexts[HashAlgorithm::kCount];
};

bool DigestEngineInit(DigestEngine* engine, uint32_t algorithms, char* error, size_t error_size);
void DigestEngineDestroy(DigestEngine* engine);

bool DigestEngineUpdate(DigestEngine* engine, const void* data, size_t size, char* error, size_t error_size);

// The engine can't be updated again after finalizing.
bool DigestEngineFinalize(DigestEngine* engine, DigestResult* result, char* error, size_t error_size);

void DigestToHex(const uint8_t* data, size_t size, char* out);

namespace DigestStatus
{
  enum Enum
  {
    kOk,
    kIoError,
    kCancelled
  };

  extern const char* const Names[];
}

// Polled between buffers; returning false abandons the digest.
typedef bool (*DigestKeepGoingFn)(void* user_data);

DigestStatus::Enum DigestStream(
    FILE*             stream,
    uint32_t          algorithms,
    DigestResult*     result,
    char*             error,
    size_t            error_size,
    DigestKeepGoingFn keep_going = nullptr,
    void*             keep_going_data = nullptr);

DigestStatus::Enum DigestFile(
    const char*       path,
    uint32_t          algorithms,
    DigestResult*     result,
    char*             error,
    size_t            error_size,
    DigestKeepGoingFn keep_going = nullptr,
    void*             keep_going_data = nullptr);

}

#endif
