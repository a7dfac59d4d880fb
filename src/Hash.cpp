#include "Hash.hpp"

#include <openssl/evp.h>
#include <openssl/err.h>

#include <errno.h>
#include <string.h>

namespace hs
{

const char* const HashAlgorithm::Names[HashAlgorithm::kCount] =
{
  "MD5",
  "SHA1",
  "SHA256",
  "SHA512"
};

const char* const DigestStatus::Names[] =
{
  "ok",
  "io error",
  "cancelled"
};

static const EVP_MD* GetEvpDigest(HashAlgorithm::Enum algorithm)
{
  switch (algorithm)
  {
    case HashAlgorithm::kMd5:    return EVP_md5();
    case HashAlgorithm::kSha1:   return EVP_sha1();
    case HashAlgorithm::kSha256: return EVP_sha256();
    case HashAlgorithm::kSha512: return EVP_sha512();
    default:                     return nullptr;
  }
}

static void FormatOpenSslError(char* error, size_t error_size, const char* what)
{
  char reason[256];
  unsigned long code = ERR_get_error();

  if (code)
    ERR_error_string_n(code, reason, sizeof reason);
  else
    snprintf(reason, sizeof reason, "unknown error");

  snprintf(error, error_size, "%s: %s", what, reason);
}

int HashAlgorithmCount(uint32_t algorithms)
{
  int count = 0;
  for (int i = 0; i < HashAlgorithm::kCount; ++i)
  {
    if (algorithms & (1u << i))
      ++count;
  }
  return count;
}

size_t HashAlgorithmHexLength(HashAlgorithm::Enum algorithm)
{
  static const size_t lengths[HashAlgorithm::kCount] = { 32, 40, 64, 128 };
  return lengths[algorithm];
}

bool HashAlgorithmFromName(const char* name, HashAlgorithm::Enum* out)
{
  // Drop dashes so "SHA-256" reads as "SHA256".
  char compact[16];
  size_t len = 0;
  for (const char* p = name; *p; ++p)
  {
    if (*p == '-')
      continue;
    if (len + 1 >= sizeof compact)
      return false;
    compact[len++] = *p;
  }
  compact[len] = '\0';

  for (int i = 0; i < HashAlgorithm::kCount; ++i)
  {
    if (StrEqualNoCase(compact, HashAlgorithm::Names[i]))
    {
      *out = HashAlgorithm::Enum(i);
      return true;
    }
  }

  return false;
}

bool HashAlgorithmParseList(const char* list, uint32_t* algorithms_out, char* error, size_t error_size)
{
  uint32_t algorithms = 0;
  const char* p = list;

  for (;;)
  {
    const char* end = strchr(p, ',');
    size_t len = end ? size_t(end - p) : strlen(p);

    // Trim surrounding blanks.
    while (len > 0 && (*p == ' ' || *p == '\t'))
    {
      ++p;
      --len;
    }
    while (len > 0 && (p[len - 1] == ' ' || p[len - 1] == '\t'))
      --len;

    char name[64];
    if (len >= sizeof name)
    {
      snprintf(error, error_size, "unsupported hash algorithm: %.*s", (int) len, p);
      return false;
    }

    memcpy(name, p, len);
    name[len] = '\0';

    if (len > 0)
    {
      HashAlgorithm::Enum algorithm;
      if (!HashAlgorithmFromName(name, &algorithm))
      {
        snprintf(error, error_size, "unsupported hash algorithm: %s", name);
        return false;
      }
      algorithms |= HashAlgorithmBit(algorithm);
    }

    if (!end)
      break;

    p = end + 1;
  }

  if (0 == algorithms)
  {
    snprintf(error, error_size, "no hash algorithms given");
    return false;
  }

  *algorithms_out = algorithms;
  return true;
}

void DigestToHex(const uint8_t* data, size_t size, char* out)
{
  static const char digits[] = "0123456789ABCDEF";

  for (size_t i = 0; i < size; ++i)
  {
    *out++ = digits[data[i] >> 4];
    *out++ = digits[data[i] & 15];
  }

  *out = '\0';
}

bool DigestEngineInit(DigestEngine* engine, uint32_t algorithms, char* error, size_t error_size)
{
  engine->m_Algorithms  = algorithms;
  engine->m_BytesHashed = 0;

  for (int i = 0; i < HashAlgorithm::kCount; ++i)
    engine->m_Contexts[i] = nullptr;

  for (int i = 0; i < HashAlgorithm::kCount; ++i)
  {
    HashAlgorithm::Enum algorithm = HashAlgorithm::Enum(i);

    if (!HashAlgorithmInSet(algorithms, algorithm))
      continue;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    engine->m_Contexts[i] = ctx;

    if (!ctx || 1 != EVP_DigestInit_ex(ctx, GetEvpDigest(algorithm), nullptr))
    {
      FormatOpenSslError(error, error_size, HashAlgorithm::Names[i]);
      DigestEngineDestroy(engine);
      return false;
    }
  }

  return true;
}

void DigestEngineDestroy(DigestEngine* engine)
{
  for (int i = 0; i < HashAlgorithm::kCount; ++i)
  {
    EVP_MD_CTX_free(engine->m_Contexts[i]);
    engine->m_Contexts[i] = nullptr;
  }
}

bool DigestEngineUpdate(DigestEngine* engine, const void* data, size_t size, char* error, size_t error_size)
{
  for (int i = 0; i < HashAlgorithm::kCount; ++i)
  {
    EVP_MD_CTX* ctx = engine->m_Contexts[i];
    if (ctx && 1 != EVP_DigestUpdate(ctx, data, size))
    {
      FormatOpenSslError(error, error_size, HashAlgorithm::Names[i]);
      return false;
    }
  }

  engine->m_BytesHashed += size;
  return true;
}

bool DigestEngineFinalize(DigestEngine* engine, DigestResult* result, char* error, size_t error_size)
{
  memset(result, 0, sizeof *result);
  result->m_Algorithms  = engine->m_Algorithms;
  result->m_BytesHashed = engine->m_BytesHashed;

  for (int i = 0; i < HashAlgorithm::kCount; ++i)
  {
    EVP_MD_CTX* ctx = engine->m_Contexts[i];
    if (!ctx)
      continue;

    uint8_t      digest[EVP_MAX_MD_SIZE];
    unsigned int digest_size = 0;

    if (1 != EVP_DigestFinal_ex(ctx, digest, &digest_size))
    {
      FormatOpenSslError(error, error_size, HashAlgorithm::Names[i]);
      return false;
    }

    CHECK(2 * digest_size == HashAlgorithmHexLength(HashAlgorithm::Enum(i)));
    DigestToHex(digest, digest_size, result->m_Hex[i]);
  }

  return true;
}

DigestStatus::Enum DigestStream(
    FILE*             stream,
    uint32_t          algorithms,
    DigestResult*     result,
    char*             error,
    size_t            error_size,
    DigestKeepGoingFn keep_going,
    void*             keep_going_data)
{
  DigestEngine engine;
  if (!DigestEngineInit(&engine, algorithms, error, error_size))
    return DigestStatus::kIoError;

  DigestStatus::Enum status = DigestStatus::kOk;
  uint8_t buffer[KB(64)];

  for (;;)
  {
    if (keep_going && !keep_going(keep_going_data))
    {
      status = DigestStatus::kCancelled;
      break;
    }

    size_t nbytes = fread(buffer, 1, sizeof buffer, stream);

    if (nbytes > 0 && !DigestEngineUpdate(&engine, buffer, nbytes, error, error_size))
    {
      status = DigestStatus::kIoError;
      break;
    }

    if (nbytes < sizeof buffer)
    {
      if (ferror(stream))
      {
        snprintf(error, error_size, "read failed after %llu bytes: %s",
            (unsigned long long) engine.m_BytesHashed, strerror(errno));
        status = DigestStatus::kIoError;
      }
      break;
    }
  }

  if (DigestStatus::kOk == status && !DigestEngineFinalize(&engine, result, error, error_size))
    status = DigestStatus::kIoError;

  DigestEngineDestroy(&engine);
  return status;
}

DigestStatus::Enum DigestFile(
    const char*       path,
    uint32_t          algorithms,
    DigestResult*     result,
    char*             error,
    size_t            error_size,
    DigestKeepGoingFn keep_going,
    void*             keep_going_data)
{
  FILE* f = fopen(path, "rb");
  if (!f)
  {
    snprintf(error, error_size, "couldn't open: %s", strerror(errno));
    return DigestStatus::kIoError;
  }

  DigestStatus::Enum status = DigestStream(f, algorithms, result, error, error_size, keep_going, keep_going_data);
  fclose(f);
  return status;
}

}
