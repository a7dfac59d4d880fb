#include "JsonWriter.hpp"
#include "JsonParse.hpp"
#include "MemAllocLinear.hpp"

#include <stdio.h>
#include <string.h>
#include <inttypes.h>

namespace hs
{

struct JsonBlock
{
  enum { kBlockSize = KB(4) - sizeof(JsonBlock*) };

  uint8_t m_Data[kBlockSize];
  JsonBlock* m_Next;
};

static JsonBlock* NewBlock(MemAllocLinear* scratch)
{
  JsonBlock* block = LinearAllocate<JsonBlock>(scratch);
  block->m_Next = nullptr;
  return block;
}

void JsonWriteInit(JsonWriter* writer, MemAllocLinear* scratch)
{
  writer->m_Scratch      = scratch;
  writer->m_Head         = writer->m_Tail = NewBlock(scratch);
  writer->m_Write        = writer->m_Head->m_Data;
  writer->m_TotalSize    = 0;
  writer->m_PrependComma = false;
}

static void JsonWrite(JsonWriter* writer, const char* ch, size_t count)
{
  while (count > 0)
  {
    size_t space = JsonBlock::kBlockSize - (writer->m_Write - writer->m_Tail->m_Data);

    if (space == 0)
    {
      writer->m_Tail->m_Next = NewBlock(writer->m_Scratch);
      writer->m_Tail  = writer->m_Tail->m_Next;
      writer->m_Write = writer->m_Tail->m_Data;
      space = JsonBlock::kBlockSize;
    }

    size_t write_size = space < count ? space : count;

    memcpy(writer->m_Write, ch, write_size);

    writer->m_Write     += write_size;
    writer->m_TotalSize += write_size;
    ch    += write_size;
    count -= write_size;
  }
}

static void JsonWriteChar(JsonWriter* writer, char ch)
{
  JsonWrite(writer, &ch, 1);
}

// Values written after another value at the same level need a comma first.
static void JsonBeginValue(JsonWriter* writer)
{
  if (writer->m_PrependComma)
    JsonWriteChar(writer, ',');
}

static void JsonOpen(JsonWriter* writer, char bracket)
{
  JsonBeginValue(writer);
  JsonWriteChar(writer, bracket);
  writer->m_PrependComma = false;
}

static void JsonClose(JsonWriter* writer, char bracket)
{
  JsonWriteChar(writer, bracket);
  writer->m_PrependComma = true;
}

void JsonWriteStartObject(JsonWriter* writer) { JsonOpen(writer, '{'); }
void JsonWriteEndObject(JsonWriter* writer)   { JsonClose(writer, '}'); }
void JsonWriteStartArray(JsonWriter* writer)  { JsonOpen(writer, '['); }
void JsonWriteEndArray(JsonWriter* writer)    { JsonClose(writer, ']'); }

void JsonWriteKeyName(JsonWriter* writer, const char* key_name)
{
  JsonWriteValueString(writer, key_name);
  JsonWriteChar(writer, ':');
  writer->m_PrependComma = false;
}

// Short escape letter for a control or quoting character, or 0.
static char JsonShortEscape(uint8_t ch)
{
  switch (ch)
  {
    case '"':  return '"';
    case '\\': return '\\';
    case '\n': return 'n';
    case '\r': return 'r';
    case '\t': return 't';
    case '\f': return 'f';
    case '\b': return 'b';
    default:   return 0;
  }
}

void JsonWriteValueString(JsonWriter* writer, const char* value)
{
  JsonBeginValue(writer);
  JsonWriteChar(writer, '"');

  const char* run = value;
  for (const char* p = value; ; ++p)
  {
    uint8_t ch = uint8_t(*p);
    if (ch >= 0x20 && ch != '"' && ch != '\\')
      continue;

    // Flush the plain run before the character that needs attention.
    JsonWrite(writer, run, size_t(p - run));
    run = p + 1;

    if (0 == ch)
      break;

    char esc[8];
    if (char letter = JsonShortEscape(ch))
    {
      esc[0] = '\\';
      esc[1] = letter;
      JsonWrite(writer, esc, 2);
    }
    else
    {
      snprintf(esc, sizeof esc, "\\u%04x", unsigned(ch));
      JsonWrite(writer, esc, 6);
    }
  }

  JsonWriteChar(writer, '"');
  writer->m_PrependComma = true;
}

void JsonWriteValueInteger(JsonWriter* writer, int64_t value)
{
  JsonBeginValue(writer);

  char buf[32];
  int len = snprintf(buf, sizeof buf, "%" PRId64, value);
  JsonWrite(writer, buf, size_t(len));

  writer->m_PrependComma = true;
}

void JsonWriteValueBool(JsonWriter* writer, bool value)
{
  JsonBeginValue(writer);
  if (value)
    JsonWrite(writer, "true", 4);
  else
    JsonWrite(writer, "false", 5);
  writer->m_PrependComma = true;
}

void JsonWriteValueNull(JsonWriter* writer)
{
  JsonBeginValue(writer);
  JsonWrite(writer, "null", 4);
  writer->m_PrependComma = true;
}

void JsonWriteValue(JsonWriter* writer, const JsonValue* value)
{
  switch (value->m_Type)
  {
    case JsonValue::kNull:
      JsonWriteValueNull(writer);
      break;

    case JsonValue::kBoolean:
      JsonWriteValueBool(writer, value->GetBoolean());
      break;

    case JsonValue::kString:
      JsonWriteValueString(writer, value->GetString());
      break;

    case JsonValue::kNumber:
    {
      const char* text = value->AsNumber()->m_Text;
      JsonBeginValue(writer);
      JsonWrite(writer, text, strlen(text));
      writer->m_PrependComma = true;
      break;
    }

    case JsonValue::kArray:
    {
      const JsonArrayValue* array = value->AsArray();
      JsonWriteStartArray(writer);
      for (size_t i = 0; i < array->m_Count; ++i)
        JsonWriteValue(writer, array->m_Values[i]);
      JsonWriteEndArray(writer);
      break;
    }

    case JsonValue::kObject:
    {
      const JsonObjectValue* obj = value->AsObject();
      JsonWriteStartObject(writer);
      for (size_t i = 0; i < obj->m_Count; ++i)
      {
        JsonWriteKeyName(writer, obj->m_Names[i]);
        JsonWriteValue(writer, obj->m_Values[i]);
      }
      JsonWriteEndObject(writer);
      break;
    }
  }
}

void JsonWriteNewline(JsonWriter* writer)
{
  JsonBeginValue(writer);
  JsonWriteChar(writer, '\n');
  writer->m_PrependComma = false;
}

void JsonWriteLineBreak(JsonWriter* writer)
{
  JsonWriteChar(writer, '\n');
}

// Calls fn(data, size) for each filled span of the block chain, stopping
// early when it returns false.
template <typename Fn>
static bool JsonVisitOutput(const JsonWriter* writer, Fn fn)
{
  uint64_t remaining = writer->m_TotalSize;
  for (const JsonBlock* block = writer->m_Head; remaining > 0; block = block->m_Next)
  {
    size_t size = remaining < JsonBlock::kBlockSize ? size_t(remaining) : size_t(JsonBlock::kBlockSize);
    if (!fn(block->m_Data, size))
      return false;
    remaining -= size;
  }
  return true;
}

bool JsonWriteToFile(JsonWriter* writer, FILE* fp)
{
  return JsonVisitOutput(writer, [fp](const uint8_t* data, size_t size) {
    return fwrite(data, 1, size, fp) == size;
  });
}

char* JsonWriteToString(JsonWriter* writer, MemAllocLinear* alloc)
{
  char* result = static_cast<char*>(LinearAllocate(alloc, size_t(writer->m_TotalSize) + 1, 1));
  char* out    = result;

  JsonVisitOutput(writer, [&out](const uint8_t* data, size_t size) {
    memcpy(out, data, size);
    out += size;
    return true;
  });

  *out = '\0';
  return result;
}

}
