#ifndef REPOSITORY_HPP
#define REPOSITORY_HPP

#include "Common.hpp"
#include "HttpClient.hpp"
#include "RunContext.hpp"
#include "OutputTable.hpp"

namespace hs
{

struct MemAllocHeap;
struct MemAllocLinear;
struct JsonValue;
struct SignatureRecord;

struct RepositoryOptions
{
  const char*   m_RootUri;                // digest is appended verbatim
  uint32_t      m_Algorithms;
  int           m_MaxRequests;
  double        m_RequestTimeoutSeconds;
  uint64_t      m_MaxResponseBytes;
  HttpTransport m_Transport;
};

void RepositoryOptionsInit(RepositoryOptions* options);

// Turn one match object into Repository<Key> attributes allocated from
// `alloc`. Strings are kept as is, numbers keep their literal text and
// nested values become compact JSON. Returns false for a non-object.
bool RepositoryFlattenMatch(
    const JsonValue*   match,
    MemAllocLinear*    alloc,
    OutputAttribute**  attributes_out,
    size_t*            count_out);

// Queries the repository once per record and requested algorithm that has a
// digest. Rows for every match come first, in query order, followed by the
// records that found nothing. Request failures only demote a pair to the
// no-match rows.
RunResult::Enum LookupRepository(
    RunContext*                   run,
    MemAllocHeap*                 heap,
    const SignatureRecord* const* signatures,
    size_t                        signature_count,
    const RepositoryOptions&      options,
    OutputTable*                  out);

}

#endif
