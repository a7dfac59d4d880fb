#include "ReferenceData.hpp"
#include "JsonParse.hpp"
#include "MemAllocHeap.hpp"
#include "PathUtil.hpp"

#include <errno.h>
#include <stdio.h>
#include <string.h>

namespace hs
{

static const char* const s_FilenameKey = "Filename";

void ReferenceSetInit(ReferenceSet* set, MemAllocHeap* heap)
{
  set->m_Heap = heap;
  LinearAllocInit(&set->m_Allocator, heap, KB(128), "reference data");
  BufferInit(&set->m_Records);
}

void ReferenceSetDestroy(ReferenceSet* set)
{
  BufferDestroy(&set->m_Records, set->m_Heap);
  LinearAllocDestroy(&set->m_Allocator);
}

// Column index of a reference field: 0 for the filename, 1 + algorithm for digests.
static int ReferenceFieldFromName(const char* name)
{
  if (0 == strcmp(name, s_FilenameKey))
    return 0;

  for (int a = 0; a < HashAlgorithm::kCount; ++a)
  {
    if (0 == strcmp(name, HashAlgorithm::Names[a]))
      return 1 + a;
  }

  return -1;
}

static ReferenceRecord* AddRecord(ReferenceSet* set)
{
  return BufferAllocZero(&set->m_Records, set->m_Heap, 1);
}

bool ReferenceSetLoadJson(ReferenceSet* set, const char* text, size_t length, char* error, size_t error_size)
{
  MemAllocLinear scratch;
  LinearAllocInit(&scratch, set->m_Heap, KB(64), "json scratch");

  char json_error[1024];
  const JsonValue* root = JsonParseText(text, length, &set->m_Allocator, &scratch, json_error);

  LinearAllocDestroy(&scratch);

  if (!root)
  {
    snprintf(error, error_size, "invalid JSON: %s", json_error);
    return false;
  }

  const JsonArrayValue* array = root->AsArray();
  if (!array)
  {
    snprintf(error, error_size, "expected an array of reference records");
    return false;
  }

  for (size_t i = 0; i < array->m_Count; ++i)
  {
    const JsonObjectValue* obj = array->m_Values[i]->AsObject();
    if (!obj)
    {
      snprintf(error, error_size, "reference record %d is not an object", int(i));
      return false;
    }

    ReferenceRecord* record = AddRecord(set);

    for (size_t k = 0; k < obj->m_Count; ++k)
    {
      int field = ReferenceFieldFromName(obj->m_Names[k]);
      if (field < 0)
        continue;

      const JsonValue* value = obj->m_Values[k];
      if (JsonValue::kNull == value->m_Type)
        continue;

      const JsonStringValue* str = value->AsString();
      if (!str)
      {
        snprintf(error, error_size, "reference record %d: %s must be a string", int(i), obj->m_Names[k]);
        return false;
      }

      if (0 == field)
        record->m_Filename = str->m_String;
      else
        record->m_Digests[field - 1] = str->m_String;
    }

    if (!record->m_Filename)
    {
      snprintf(error, error_size, "reference record %d has no %s", int(i), s_FilenameKey);
      return false;
    }
  }

  Log(kDebug, "loaded %d reference records from JSON", int(set->m_Records.m_Size));
  return true;
}

struct CsvReader
{
  const char* m_Cursor;
  const char* m_End;
  int         m_Line;
};

// Reads one RFC 4180 record. Fields are copied into `alloc`. Returns false
// at end of input, or on malformed quoting with `error` set.
static bool CsvReadRecord(CsvReader* r, MemAllocLinear* alloc, MemAllocHeap* heap,
                          Buffer<const char*>* fields, char* error, size_t error_size, bool* malformed)
{
  *malformed = false;
  BufferClear(fields);

  if (r->m_Cursor >= r->m_End)
    return false;

  Buffer<char> field;
  BufferInit(&field);

  bool done = false;
  while (!done)
  {
    BufferClear(&field);

    if (r->m_Cursor < r->m_End && '"' == *r->m_Cursor)
    {
      int quote_line = r->m_Line;
      ++r->m_Cursor;
      for (;;)
      {
        if (r->m_Cursor >= r->m_End)
        {
          snprintf(error, error_size, "line %d: unterminated quoted field", quote_line);
          *malformed = true;
          BufferDestroy(&field, heap);
          return false;
        }

        char ch = *r->m_Cursor++;
        if ('"' == ch)
        {
          if (r->m_Cursor < r->m_End && '"' == *r->m_Cursor)
          {
            ++r->m_Cursor;
            BufferAppendOne(&field, heap, '"');
            continue;
          }
          break;
        }

        if ('\n' == ch)
          ++r->m_Line;

        BufferAppendOne(&field, heap, ch);
      }
    }

    while (r->m_Cursor < r->m_End && ',' != *r->m_Cursor && '\r' != *r->m_Cursor && '\n' != *r->m_Cursor)
      BufferAppendOne(&field, heap, *r->m_Cursor++);

    BufferAppendOne(fields, heap, StrDupN(alloc, field.m_Storage ? field.m_Storage : "", field.m_Size));

    if (r->m_Cursor >= r->m_End)
    {
      done = true;
    }
    else if (',' == *r->m_Cursor)
    {
      ++r->m_Cursor;
    }
    else
    {
      if ('\r' == *r->m_Cursor)
        ++r->m_Cursor;
      if (r->m_Cursor < r->m_End && '\n' == *r->m_Cursor)
        ++r->m_Cursor;
      ++r->m_Line;
      done = true;
    }
  }

  BufferDestroy(&field, heap);
  return true;
}

static bool IsBlankRecord(const Buffer<const char*>& fields)
{
  return 1 == fields.m_Size && '\0' == fields[0][0];
}

bool ReferenceSetLoadCsv(ReferenceSet* set, const char* text, size_t length, char* error, size_t error_size)
{
  MemAllocHeap* heap = set->m_Heap;

  CsvReader reader = { text, text + length, 1 };

  // Skip a UTF-8 byte order mark.
  if (length >= 3 && 0 == memcmp(text, "\xEF\xBB\xBF", 3))
    reader.m_Cursor += 3;

  Buffer<const char*> fields;
  Buffer<int>         columns;
  BufferInit(&fields);
  BufferInit(&columns);

  bool malformed = false;
  bool success   = true;

  if (!CsvReadRecord(&reader, &set->m_Allocator, heap, &fields, error, error_size, &malformed))
  {
    if (!malformed)
      snprintf(error, error_size, "missing header row");
    success = false;
  }
  else
  {
    bool have_filename = false;
    for (const char* name : fields)
    {
      int field = ReferenceFieldFromName(name);
      have_filename |= 0 == field;
      BufferAppendOne(&columns, heap, field);
    }

    if (!have_filename)
    {
      snprintf(error, error_size, "header has no %s column", s_FilenameKey);
      success = false;
    }
  }

  while (success && CsvReadRecord(&reader, &set->m_Allocator, heap, &fields, error, error_size, &malformed))
  {
    if (IsBlankRecord(fields))
      continue;

    ReferenceRecord* record = AddRecord(set);

    size_t count = fields.m_Size < columns.m_Size ? fields.m_Size : columns.m_Size;
    for (size_t i = 0; i < count; ++i)
    {
      int field = columns[i];
      if (0 == field)
        record->m_Filename = fields[i];
      else if (field > 0)
        record->m_Digests[field - 1] = fields[i];
    }

    // A short row leaves its trailing columns unsupplied.
    if (!record->m_Filename)
      record->m_Filename = "";
  }

  if (malformed)
    success = false;

  BufferDestroy(&columns, heap);
  BufferDestroy(&fields, heap);

  if (success)
    Log(kDebug, "loaded %d reference records from CSV", int(set->m_Records.m_Size));

  return success;
}

static bool ReadWholeFile(const char* path, MemAllocHeap* heap, Buffer<char>* out, char* error, size_t error_size)
{
  FILE* f = fopen(path, "rb");
  if (!f)
  {
    snprintf(error, error_size, "%s: %s", path, strerror(errno));
    return false;
  }

  char block[KB(16)];
  size_t n;
  while ((n = fread(block, 1, sizeof block, f)) > 0)
    BufferAppend(out, heap, block, n);

  bool ok = !ferror(f);
  if (!ok)
    snprintf(error, error_size, "%s: read failed", path);

  fclose(f);
  return ok;
}

static bool HasExtensionNoCase(const char* path, const char* ext)
{
  size_t path_len = strlen(path);
  size_t ext_len  = strlen(ext);
  return path_len >= ext_len && StrEqualNoCase(path + path_len - ext_len, ext);
}

bool ReferenceSetLoadFile(ReferenceSet* set, const char* path, char* error, size_t error_size)
{
  Buffer<char> text;
  BufferInit(&text);

  bool ok = ReadWholeFile(path, set->m_Heap, &text, error, error_size);

  if (ok)
  {
    const char* data = text.m_Storage ? text.m_Storage : "";
    bool        json;

    if (HasExtensionNoCase(path, ".json"))
    {
      json = true;
    }
    else if (HasExtensionNoCase(path, ".csv"))
    {
      json = false;
    }
    else
    {
      size_t i = 0;
      while (i < text.m_Size && data[i] && strchr(" \t\r\n", data[i]))
        ++i;
      json = i < text.m_Size && '[' == data[i];
    }

    Log(kInfo, "reading reference data from %s as %s", PathBaseName(path), json ? "JSON" : "CSV");

    char inner[512];
    ok = json ? ReferenceSetLoadJson(set, data, text.m_Size, inner, sizeof inner)
              : ReferenceSetLoadCsv(set, data, text.m_Size, inner, sizeof inner);

    if (!ok)
      snprintf(error, error_size, "%s: %s", path, inner);
  }

  BufferDestroy(&text, set->m_Heap);
  return ok;
}

}
