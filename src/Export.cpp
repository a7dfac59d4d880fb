#include "Export.hpp"
#include "OutputTable.hpp"
#include "ReferenceMatch.hpp"
#include "JsonWriter.hpp"
#include "MemAllocHeap.hpp"
#include "MemAllocLinear.hpp"

#include <inttypes.h>
#include <string.h>

namespace hs
{

const char* const ExportFormat::Names[] =
{
  "csv",
  "json"
};

bool ExportFormatFromName(const char* name, ExportFormat::Enum* out)
{
  for (int i = 0; i < int(ARRAY_SIZE(ExportFormat::Names)); ++i)
  {
    if (StrEqualNoCase(name, ExportFormat::Names[i]))
    {
      *out = ExportFormat::Enum(i);
      return true;
    }
  }
  return false;
}

static bool CsvNeedsQuotes(const char* value)
{
  if (!value[0])
    return false;

  if (strpbrk(value, ",\"\r\n"))
    return true;

  size_t len = strlen(value);
  return ' ' == value[0] || '\t' == value[0] || ' ' == value[len - 1] || '\t' == value[len - 1];
}

void CsvAppendField(Buffer<char>* out, MemAllocHeap* heap, const char* value)
{
  if (!CsvNeedsQuotes(value))
  {
    BufferAppend(out, heap, value, strlen(value));
    return;
  }

  BufferAppendOne(out, heap, '"');
  for (const char* p = value; *p; ++p)
  {
    if ('"' == *p)
      BufferAppendOne(out, heap, '"');
    BufferAppendOne(out, heap, *p);
  }
  BufferAppendOne(out, heap, '"');
}

static void CsvEndRecord(Buffer<char>* out, MemAllocHeap* heap)
{
  BufferAppend(out, heap, "\r\n", 2);
}

static void CsvAppendCell(Buffer<char>* out, MemAllocHeap* heap, const OutputCell& cell)
{
  switch (cell.m_Type)
  {
    case CellType::kNull:
      break;
    case CellType::kString:
      CsvAppendField(out, heap, cell.m_String);
      break;
    case CellType::kInteger:
      BufferAppendFormat(out, heap, "%" PRIu64, cell.m_Integer);
      break;
    case CellType::kBoolean:
      CsvAppendField(out, heap, cell.m_Boolean ? "true" : "false");
      break;
  }
}

static void JsonWriteCell(JsonWriter* writer, const OutputCell& cell)
{
  switch (cell.m_Type)
  {
    case CellType::kNull:
      JsonWriteValueNull(writer);
      break;
    case CellType::kString:
      JsonWriteValueString(writer, cell.m_String);
      break;
    case CellType::kInteger:
      JsonWriteValueInteger(writer, int64_t(cell.m_Integer));
      break;
    case CellType::kBoolean:
      JsonWriteValueBool(writer, cell.m_Boolean);
      break;
  }
}

static bool WriteAll(FILE* out, const Buffer<char>& text)
{
  if (text.m_Size && fwrite(text.m_Storage, 1, text.m_Size, out) != text.m_Size)
    return false;
  return 0 == fflush(out);
}

static bool ExportTableCsv(const OutputTable* table, const OutputSchema& schema, FILE* out)
{
  MemAllocHeap* heap = table->m_Heap;
  Buffer<char>  text;
  BufferInit(&text);

  bool first = true;
  for (int c = 0; c < OutputColumn::kCount; ++c)
  {
    if (!schema.m_Columns[c])
      continue;
    if (!first)
      BufferAppendOne(&text, heap, ',');
    CsvAppendField(&text, heap, OutputColumn::Names[c]);
    first = false;
  }
  for (const char* key : schema.m_ExtensionKeys)
  {
    if (!first)
      BufferAppendOne(&text, heap, ',');
    CsvAppendField(&text, heap, key);
    first = false;
  }
  CsvEndRecord(&text, heap);

  for (const OutputRow& row : table->m_Rows)
  {
    first = true;
    for (int c = 0; c < OutputColumn::kCount; ++c)
    {
      if (!schema.m_Columns[c])
        continue;

      if (!first)
        BufferAppendOne(&text, heap, ',');
      first = false;

      OutputCell cell;
      OutputRowGetCell(table, row, OutputColumn::Enum(c), &cell);
      CsvAppendCell(&text, heap, cell);
    }

    for (const char* key : schema.m_ExtensionKeys)
    {
      if (!first)
        BufferAppendOne(&text, heap, ',');
      first = false;

      const OutputAttribute* attr = OutputRowFindExtension(row, key);
      if (attr && attr->m_Value)
        CsvAppendField(&text, heap, attr->m_Value);
    }

    CsvEndRecord(&text, heap);
  }

  bool ok = WriteAll(out, text);
  BufferDestroy(&text, heap);
  return ok;
}

static bool ExportTableJson(const OutputTable* table, const OutputSchema& schema, FILE* out)
{
  MemAllocLinear scratch;
  LinearAllocInit(&scratch, table->m_Heap, MB(1), "json export");

  JsonWriter writer;
  JsonWriteInit(&writer, &scratch);

  JsonWriteStartArray(&writer);

  for (const OutputRow& row : table->m_Rows)
  {
    JsonWriteNewline(&writer);
    JsonWriteStartObject(&writer);

    for (int c = 0; c < OutputColumn::kCount; ++c)
    {
      if (!schema.m_Columns[c])
        continue;

      OutputCell cell;
      OutputRowGetCell(table, row, OutputColumn::Enum(c), &cell);
      JsonWriteKeyName(&writer, OutputColumn::Names[c]);
      JsonWriteCell(&writer, cell);
    }

    for (const char* key : schema.m_ExtensionKeys)
    {
      const OutputAttribute* attr = OutputRowFindExtension(row, key);
      JsonWriteKeyName(&writer, key);
      if (attr && attr->m_Value)
        JsonWriteValueString(&writer, attr->m_Value);
      else
        JsonWriteValueNull(&writer);
    }

    JsonWriteEndObject(&writer);
  }

  if (table->m_Rows.m_Size)
    JsonWriteLineBreak(&writer);
  JsonWriteEndArray(&writer);
  JsonWriteLineBreak(&writer);

  bool ok = JsonWriteToFile(&writer, out) && 0 == fflush(out);

  LinearAllocDestroy(&scratch);
  return ok;
}

bool ExportTable(const OutputTable* table, ExportFormat::Enum format, FILE* out)
{
  OutputSchema schema;
  OutputSchemaBuild(&schema, table);

  Log(kDebug, "exporting %d rows with %d columns as %s",
      int(table->m_Rows.m_Size), int(schema.m_ColumnCount), ExportFormat::Names[format]);

  bool ok = ExportFormat::kCsv == format ? ExportTableCsv(table, schema, out) : ExportTableJson(table, schema, out);

  OutputSchemaDestroy(&schema, table->m_Heap);
  return ok;
}

bool ExportReferenceRecords(
    MemAllocHeap*           heap,
    const ReferenceRecord*  records,
    size_t                  count,
    ExportFormat::Enum      format,
    FILE*                   out)
{
  if (ExportFormat::kCsv == format)
  {
    Buffer<char> text;
    BufferInit(&text);

    CsvAppendField(&text, heap, "Filename");
    for (int a = 0; a < HashAlgorithm::kCount; ++a)
    {
      BufferAppendOne(&text, heap, ',');
      CsvAppendField(&text, heap, HashAlgorithm::Names[a]);
    }
    CsvEndRecord(&text, heap);

    for (size_t i = 0; i < count; ++i)
    {
      const ReferenceRecord& r = records[i];
      CsvAppendField(&text, heap, r.m_Filename ? r.m_Filename : "");
      for (int a = 0; a < HashAlgorithm::kCount; ++a)
      {
        BufferAppendOne(&text, heap, ',');
        if (r.m_Digests[a])
          CsvAppendField(&text, heap, r.m_Digests[a]);
      }
      CsvEndRecord(&text, heap);
    }

    bool ok = WriteAll(out, text);
    BufferDestroy(&text, heap);
    return ok;
  }

  MemAllocLinear scratch;
  LinearAllocInit(&scratch, heap, KB(64), "json export");

  JsonWriter writer;
  JsonWriteInit(&writer, &scratch);
  JsonWriteStartArray(&writer);

  for (size_t i = 0; i < count; ++i)
  {
    const ReferenceRecord& r = records[i];

    JsonWriteNewline(&writer);
    JsonWriteStartObject(&writer);
    JsonWriteKeyName(&writer, "Filename");
    JsonWriteValueString(&writer, r.m_Filename ? r.m_Filename : "");
    for (int a = 0; a < HashAlgorithm::kCount; ++a)
    {
      JsonWriteKeyName(&writer, HashAlgorithm::Names[a]);
      if (r.m_Digests[a])
        JsonWriteValueString(&writer, r.m_Digests[a]);
      else
        JsonWriteValueNull(&writer);
    }
    JsonWriteEndObject(&writer);
  }

  if (count)
    JsonWriteLineBreak(&writer);
  JsonWriteEndArray(&writer);
  JsonWriteLineBreak(&writer);

  bool ok = JsonWriteToFile(&writer, out) && 0 == fflush(out);
  LinearAllocDestroy(&scratch);
  return ok;
}

}
