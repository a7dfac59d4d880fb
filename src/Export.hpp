#ifndef EXPORT_HPP
#define EXPORT_HPP

#include "Common.hpp"
#include "Buffer.hpp"

#include <stdio.h>

namespace hs
{

struct MemAllocHeap;
struct OutputTable;
struct ReferenceRecord;

namespace ExportFormat
{
  enum Enum
  {
    kCsv,
    kJson
  };

  extern const char* const Names[];
}

bool ExportFormatFromName(const char* name, ExportFormat::Enum* out);

// Append one CSV field, quoting it when it holds a separator, a quote, a line
// break or surrounding blanks.
void CsvAppendField(Buffer<char>* out, MemAllocHeap* heap, const char* value);

// Writes every row with the union of all columns. CSV leaves absent values
// empty; JSON writes them as null.
bool ExportTable(const OutputTable* table, ExportFormat::Enum format, FILE* out);

bool ExportReferenceRecords(
    MemAllocHeap*           heap,
    const ReferenceRecord*  records,
    size_t                  count,
    ExportFormat::Enum      format,
    FILE*                   out);

}

#endif
