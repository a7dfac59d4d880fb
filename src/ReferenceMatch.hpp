#ifndef REFERENCEMATCH_HPP
#define REFERENCEMATCH_HPP

#include "Common.hpp"
#include "Hash.hpp"
#include "OutputTable.hpp"

namespace hs
{

struct SignatureRecord;

// Externally supplied truth for one file name. A null digest was not
// supplied; an empty string was supplied but empty.
struct ReferenceRecord
{
  const char* m_Filename;
  const char* m_Digests[HashAlgorithm::kCount];
};

// Compare a computed digest against a reference digest. Hex case is ignored.
MatchState::Enum MatchDigest(const char* computed, const char* reference);

// One row per signature, in input order, with a match state per algorithm.
// Filenames are compared case-sensitively; the first reference with a given
// name wins and later duplicates are reported once per name.
void VerifySignatures(
    const SignatureRecord* const* signatures,
    size_t                        signature_count,
    const ReferenceRecord*        references,
    size_t                        reference_count,
    const char*                   missing_placeholder,
    OutputTable*                  out);

// A record with every field present and blank, describing the columns a
// reference file may carry.
void ReferenceTemplate(ReferenceRecord* out);

}

#endif
