#include "ReferenceMatch.hpp"
#include "Signature.hpp"
#include "HashTable.hpp"

namespace hs
{

MatchState::Enum MatchDigest(const char* computed, const char* reference)
{
  if (!reference || !reference[0] || !computed)
    return MatchState::kMissing;

  return StrEqualNoCase(computed, reference) ? MatchState::kMatched : MatchState::kMismatched;
}

static bool HasUppercase(const char* str)
{
  for (; *str; ++str)
  {
    if (*str >= 'A' && *str <= 'Z')
      return true;
  }
  return false;
}

struct ReferenceIndexEntry
{
  uint32_t m_Index;
  bool     m_Reported;
};

void VerifySignatures(
    const SignatureRecord* const* signatures,
    size_t                        signature_count,
    const ReferenceRecord*        references,
    size_t                        reference_count,
    const char*                   missing_placeholder,
    OutputTable*                  out)
{
  HashTable<ReferenceIndexEntry> index;
  HashTableInit(&index, out->m_Heap);

  for (size_t i = 0; i < reference_count; ++i)
  {
    const char* name = references[i].m_Filename;
    if (!name)
      continue;

    ReferenceIndexEntry entry = { uint32_t(i), false };
    if (ReferenceIndexEntry* existing = HashTableInsertIfMissing(&index, name, entry))
    {
      if (!existing->m_Reported)
      {
        Log(kWarning, "reference data lists %s more than once; using the first entry", name);
        existing->m_Reported = true;
      }
    }
    else if (HasUppercase(name))
    {
      // Signature filenames are lowercase and matching is exact.
      Log(kWarning, "reference filename %s has uppercase letters and can never match", name);
    }
  }

  out->m_MissingPlaceholder = missing_placeholder;

  for (size_t i = 0; i < signature_count; ++i)
  {
    const SignatureRecord* sig = signatures[i];
    const ReferenceIndexEntry* entry = HashTableFind(&index, sig->m_Filename);
    const ReferenceRecord* ref = entry ? &references[entry->m_Index] : nullptr;

    OutputRow* row = OutputTableAddRow(out, sig);
    row->m_Flags |= OutputRow::kFlagHasMatchResults;

    for (int a = 0; a < HashAlgorithm::kCount; ++a)
    {
      MatchState::Enum state = ref ? MatchDigest(sig->m_Digests[a], ref->m_Digests[a]) : MatchState::kMissing;
      row->m_Match[a] = uint8_t(state);
    }

    Log(kDebug, "%s: %s", sig->m_Filename, ref ? "reference found" : "no reference");
  }

  HashTableDestroy(&index);
}

void ReferenceTemplate(ReferenceRecord* out)
{
  out->m_Filename = "";
  for (int a = 0; a < HashAlgorithm::kCount; ++a)
    out->m_Digests[a] = "";
}

}
