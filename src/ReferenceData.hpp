#ifndef REFERENCEDATA_HPP
#define REFERENCEDATA_HPP

#include "Common.hpp"
#include "Buffer.hpp"
#include "MemAllocLinear.hpp"
#include "ReferenceMatch.hpp"

namespace hs
{

struct MemAllocHeap;

// Reference records loaded for a verification run, in input order.
struct ReferenceSet
{
  MemAllocHeap*           m_Heap;
  MemAllocLinear          m_Allocator;
  Buffer<ReferenceRecord> m_Records;
};

void ReferenceSetInit(ReferenceSet* set, MemAllocHeap* heap);
void ReferenceSetDestroy(ReferenceSet* set);

// An array of objects keyed Filename, MD5, SHA1, SHA256 and SHA512. Absent
// keys and null values leave the digest unsupplied.
bool ReferenceSetLoadJson(ReferenceSet* set, const char* text, size_t length, char* error, size_t error_size);

// A header row naming the same columns, then one record per row. Columns
// not in the header are unsupplied; unknown columns are ignored.
bool ReferenceSetLoadCsv(ReferenceSet* set, const char* text, size_t length, char* error, size_t error_size);

// Picks the format from a .csv or .json extension, or from the first
// character of the file when the extension says neither.
bool ReferenceSetLoadFile(ReferenceSet* set, const char* path, char* error, size_t error_size);

}

#endif
