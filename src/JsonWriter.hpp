#ifndef JSONWRITER_HPP
#define JSONWRITER_HPP

#include <stdint.h>
#include <stdio.h>

namespace hs
{

struct MemAllocLinear;
struct JsonBlock;
struct JsonValue;

// Streams JSON text into a chain of blocks from a linear allocator. Commas
// between values are inserted automatically.
struct JsonWriter
{
  MemAllocLinear* m_Scratch;
  JsonBlock* m_Head;
  JsonBlock* m_Tail;
  uint8_t*   m_Write;
  bool m_PrependComma;
  uint64_t   m_TotalSize;
};

void JsonWriteInit(JsonWriter* writer, MemAllocLinear* scratch);

void JsonWriteStartObject(JsonWriter* writer);
void JsonWriteEndObject(JsonWriter* writer);

void JsonWriteStartArray(JsonWriter* writer);
void JsonWriteEndArray(JsonWriter* writer);

void JsonWriteKeyName(JsonWriter* writer, const char* key_name);

void JsonWriteValueString(JsonWriter* writer, const char* value);
void JsonWriteValueInteger(JsonWriter* writer, int64_t value);
void JsonWriteValueBool(JsonWriter* writer, bool value);
void JsonWriteValueNull(JsonWriter* writer);

// Re-serialize a parsed document in compact form.
void JsonWriteValue(JsonWriter* writer, const JsonValue* value);

// Emit a line break between values. A pending comma goes before it.
void JsonWriteNewline(JsonWriter* writer);

// A bare line break; the separator state is left alone.
void JsonWriteLineBreak(JsonWriter* writer);

bool JsonWriteToFile(JsonWriter* writer, FILE* fp);

// Copy the written text into `alloc` as a nul-terminated string.
char* JsonWriteToString(JsonWriter* writer, MemAllocLinear* alloc);

}

#endif
