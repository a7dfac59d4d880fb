#include "JsonParse.hpp"
#include "MemAllocLinear.hpp"

#include <stdarg.h>
#include <stddef.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

namespace hs
{

template <typename T>
static const T* JsonCast(const JsonValue* value, JsonValue::Type type)
{
  return value->m_Type == type ? static_cast<const T*>(value) : nullptr;
}

const JsonObjectValue* JsonValue::AsObject() const
{
  return JsonCast<JsonObjectValue>(this, kObject);
}

const JsonArrayValue* JsonValue::AsArray() const
{
  return JsonCast<JsonArrayValue>(this, kArray);
}

const JsonStringValue* JsonValue::AsString() const
{
  return JsonCast<JsonStringValue>(this, kString);
}

const JsonNumberValue* JsonValue::AsNumber() const
{
  return JsonCast<JsonNumberValue>(this, kNumber);
}

const JsonBooleanValue* JsonValue::AsBoolean() const
{
  return JsonCast<JsonBooleanValue>(this, kBoolean);
}

double JsonValue::GetNumber() const
{
  const JsonNumberValue* v = AsNumber();
  CHECK(v);
  return v->m_Number;
}

const char* JsonValue::GetString() const
{
  const JsonStringValue* v = AsString();
  CHECK(v);
  return v->m_String;
}

bool JsonValue::GetBoolean() const
{
  const JsonBooleanValue* v = AsBoolean();
  CHECK(v);
  return v->m_Boolean;
}

const JsonValue* JsonValue::Elem(size_t index) const
{
  const JsonArrayValue* array = AsArray();
  return array && index < array->m_Count ? array->m_Values[index] : nullptr;
}

const JsonValue* JsonValue::Find(const char* key) const
{
  if (const JsonObjectValue* obj = AsObject())
  {
    for (size_t i = 0; i < obj->m_Count; ++i)
    {
      if (0 == strcmp(obj->m_Names[i], key))
        return obj->m_Values[i];
    }
  }
  return nullptr;
}

enum
{
  // Repository responses come off the network; bound the recursion.
  kJsonMaxNesting = 64
};

struct JsonReader
{
  char*           m_Cursor;
  int             m_Line;
  int             m_Depth;
  MemAllocLinear* m_Allocator;
  MemAllocLinear* m_Scratch;
  char            m_Error[1024];
};

static std::nullptr_t JsonFail(JsonReader* r, const char* fmt, ...)
{
  int len = snprintf(r->m_Error, sizeof r->m_Error, "line %d: ", r->m_Line);
  va_list args;
  va_start(args, fmt);
  vsnprintf(r->m_Error + len, sizeof r->m_Error - len, fmt, args);
  va_end(args);
  return nullptr;
}

// Returns the next significant character without consuming it.
static char JsonSkipSpace(JsonReader* r)
{
  for (;;)
  {
    char ch = *r->m_Cursor;
    if ('\n' == ch)
      ++r->m_Line;
    else if (' ' != ch && '\t' != ch && '\r' != ch)
      return ch;
    ++r->m_Cursor;
  }
}

// Children of one array or object, gathered in scratch memory until the
// closing bracket tells us how many there are.
struct JsonItemBlock
{
  enum { kCapacity = 16 };
  const char*      m_Names[kCapacity];
  const JsonValue* m_Values[kCapacity];
  JsonItemBlock*   m_Next;
};

struct JsonItems
{
  MemAllocLinear* m_Scratch;
  JsonItemBlock*  m_First;
  JsonItemBlock*  m_Last;
  size_t          m_Count;
};

static void JsonItemsInit(JsonItems* items, MemAllocLinear* scratch)
{
  items->m_Scratch = scratch;
  items->m_First   = nullptr;
  items->m_Last    = nullptr;
  items->m_Count   = 0;
}

static void JsonItemsAppend(JsonItems* items, const char* name, const JsonValue* value)
{
  size_t slot = items->m_Count % JsonItemBlock::kCapacity;
  if (0 == slot)
  {
    JsonItemBlock* block = LinearAllocate<JsonItemBlock>(items->m_Scratch);
    block->m_Next = nullptr;
    if (items->m_Last)
      items->m_Last->m_Next = block;
    else
      items->m_First = block;
    items->m_Last = block;
  }

  items->m_Last->m_Names[slot]  = name;
  items->m_Last->m_Values[slot] = value;
  ++items->m_Count;
}

// Copies the gathered children into final storage. `names` may be null.
static void JsonItemsCopy(const JsonItems* items, const char** names, const JsonValue** values)
{
  size_t i = 0;
  for (const JsonItemBlock* block = items->m_First; block; block = block->m_Next)
  {
    for (int k = 0; k < JsonItemBlock::kCapacity && i < items->m_Count; ++k, ++i)
    {
      if (names)
        names[i] = block->m_Names[k];
      values[i] = block->m_Values[k];
    }
  }
}

static int HexDigitValue(char ch)
{
  if (ch >= '0' && ch <= '9') return ch - '0';
  if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
  if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
  return -1;
}

// Reads the four digits following "\u".
static bool ReadUtf16Unit(char** cursor, uint32_t* unit)
{
  uint32_t result = 0;
  for (int i = 0; i < 4; ++i)
  {
    int digit = HexDigitValue((*cursor)[i]);
    if (digit < 0)
      return false;
    result = (result << 4) | uint32_t(digit);
  }
  *cursor += 4;
  *unit    = result;
  return true;
}

static char* WriteUtf8(char* out, uint32_t cp)
{
  if (cp < 0x80)
  {
    *out++ = char(cp);
    return out;
  }

  int tail = cp < 0x800 ? 1 : cp < 0x10000 ? 2 : 3;
  static const uint8_t lead_bits[] = { 0, 0xc0, 0xe0, 0xf0 };

  *out++ = char(lead_bits[tail] | (cp >> (6 * tail)));
  for (int shift = 6 * (tail - 1); shift >= 0; shift -= 6)
    *out++ = char(0x80 | ((cp >> shift) & 0x3f));
  return out;
}

// Unescapes in place. The decoded text is never longer than the source, so
// the write cursor can trail the read cursor in the same buffer.
static const char* JsonReadString(JsonReader* r)
{
  char* src = r->m_Cursor + 1;
  char* dst = src;
  char* start = dst;

  for (;;)
  {
    char ch = *src++;

    if ('"' == ch)
      break;

    if ('\0' == ch)
      return JsonFail(r, "end of input inside string");

    if (uint8_t(ch) < 0x20)
      return JsonFail(r, "control character in string");

    if ('\\' != ch)
    {
      *dst++ = ch;
      continue;
    }

    char esc = *src++;
    switch (esc)
    {
      case '"':  *dst++ = '"';  break;
      case '\\': *dst++ = '\\'; break;
      case '/':  *dst++ = '/';  break;
      case 'b':  *dst++ = '\b'; break;
      case 'f':  *dst++ = '\f'; break;
      case 'n':  *dst++ = '\n'; break;
      case 'r':  *dst++ = '\r'; break;
      case 't':  *dst++ = '\t'; break;

      case 'u':
        {
          uint32_t cp;
          if (!ReadUtf16Unit(&src, &cp))
            return JsonFail(r, "\\u needs four hex digits");

          if (cp >= 0xdc00 && cp <= 0xdfff)
            return JsonFail(r, "unpaired low surrogate");

          if (cp >= 0xd800 && cp <= 0xdbff)
          {
            uint32_t low;
            if ('\\' != src[0] || 'u' != src[1])
              return JsonFail(r, "unpaired high surrogate");
            src += 2;
            if (!ReadUtf16Unit(&src, &low) || low < 0xdc00 || low > 0xdfff)
              return JsonFail(r, "bad low surrogate");
            cp = 0x10000 + ((cp - 0xd800) << 10) + (low - 0xdc00);
          }

          dst = WriteUtf8(dst, cp);
        }
        break;

      default:
        return JsonFail(r, "unknown escape '\\%c'", esc ? esc : '0');
    }
  }

  *dst = '\0';
  r->m_Cursor = src;
  return start;
}

static const char* SkipDigits(const char* p)
{
  while (*p >= '0' && *p <= '9')
    ++p;
  return p;
}

// Validates the JSON number grammar before handing the literal to strtod,
// which would otherwise accept hex, "inf" and friends.
static const JsonValue* JsonReadNumber(JsonReader* r)
{
  const char* start = r->m_Cursor;
  const char* p = start;

  if ('-' == *p)
    ++p;

  if ('0' == *p)
    ++p;
  else if (*p >= '1' && *p <= '9')
    p = SkipDigits(p);
  else
    return JsonFail(r, "bad number");

  if ('.' == *p)
  {
    const char* frac = p + 1;
    p = SkipDigits(frac);
    if (p == frac)
      return JsonFail(r, "bad number: missing fraction digits");
  }

  if ('e' == *p || 'E' == *p)
  {
    ++p;
    if ('+' == *p || '-' == *p)
      ++p;
    const char* exp = p;
    p = SkipDigits(exp);
    if (p == exp)
      return JsonFail(r, "bad number: missing exponent digits");
  }

  JsonNumberValue* v = LinearAllocate<JsonNumberValue>(r->m_Allocator);
  v->m_Type   = JsonValue::kNumber;
  v->m_Text   = StrDupN(r->m_Allocator, start, size_t(p - start));
  v->m_Number = strtod(v->m_Text, nullptr);

  r->m_Cursor += p - start;
  return v;
}

static bool MatchKeyword(JsonReader* r, const char* word)
{
  size_t len = strlen(word);
  if (0 != strncmp(r->m_Cursor, word, len))
    return false;

  char next = r->m_Cursor[len];
  if ((next >= 'a' && next <= 'z') || (next >= 'A' && next <= 'Z') || (next >= '0' && next <= '9'))
    return false;

  r->m_Cursor += len;
  return true;
}

static const JsonValue* JsonReadKeyword(JsonReader* r)
{
  if (MatchKeyword(r, "null"))
  {
    JsonValue* v = LinearAllocate<JsonValue>(r->m_Allocator);
    v->m_Type = JsonValue::kNull;
    return v;
  }

  bool truth = MatchKeyword(r, "true");
  if (truth || MatchKeyword(r, "false"))
  {
    JsonBooleanValue* v = LinearAllocate<JsonBooleanValue>(r->m_Allocator);
    v->m_Type    = JsonValue::kBoolean;
    v->m_Boolean = truth;
    return v;
  }

  if ('\0' == *r->m_Cursor)
    return JsonFail(r, "unexpected end of input");

  return JsonFail(r, "unexpected character '%c'", *r->m_Cursor);
}

static const JsonValue* JsonReadValue(JsonReader* r);

// Shared by arrays and objects: reads comma-separated members up to `close`.
// Object members are "name": value pairs.
static bool JsonReadMembers(JsonReader* r, char close, JsonItems* items)
{
  bool is_object = '}' == close;

  ++r->m_Cursor;

  if (close == JsonSkipSpace(r))
  {
    ++r->m_Cursor;
    return true;
  }

  for (;;)
  {
    const char* name = nullptr;

    if (is_object)
    {
      if ('"' != JsonSkipSpace(r))
        return JsonFail(r, "expected a quoted key"), false;

      if (nullptr == (name = JsonReadString(r)))
        return false;

      if (':' != JsonSkipSpace(r))
        return JsonFail(r, "expected ':' after key \"%s\"", name), false;
      ++r->m_Cursor;
    }

    const JsonValue* value = JsonReadValue(r);
    if (!value)
      return false;

    JsonItemsAppend(items, name, value);

    char ch = JsonSkipSpace(r);
    ++r->m_Cursor;

    if (close == ch)
      return true;

    if (',' != ch)
    {
      --r->m_Cursor;
      if ('\0' == ch)
        return JsonFail(r, "unexpected end of input, expected ',' or '%c'", close), false;
      return JsonFail(r, "expected ',' or '%c'", close), false;
    }
  }
}

static const JsonValue* JsonReadContainer(JsonReader* r, char close)
{
  if (++r->m_Depth > kJsonMaxNesting)
    return JsonFail(r, "nesting deeper than %d levels", kJsonMaxNesting);

  MemAllocLinearScope scratch_scope(r->m_Scratch);

  JsonItems items;
  JsonItemsInit(&items, r->m_Scratch);

  if (!JsonReadMembers(r, close, &items))
    return nullptr;

  --r->m_Depth;

  MemAllocLinear* alloc = r->m_Allocator;
  const JsonValue** values = LinearAllocateArray<const JsonValue*>(alloc, items.m_Count);

  if ('}' == close)
  {
    JsonObjectValue* obj = LinearAllocate<JsonObjectValue>(alloc);
    obj->m_Type   = JsonValue::kObject;
    obj->m_Count  = items.m_Count;
    obj->m_Names  = LinearAllocateArray<const char*>(alloc, items.m_Count);
    obj->m_Values = values;
    JsonItemsCopy(&items, obj->m_Names, values);
    return obj;
  }

  JsonArrayValue* array = LinearAllocate<JsonArrayValue>(alloc);
  array->m_Type   = JsonValue::kArray;
  array->m_Count  = items.m_Count;
  array->m_Values = values;
  JsonItemsCopy(&items, nullptr, values);
  return array;
}

static const JsonValue* JsonReadValue(JsonReader* r)
{
  switch (JsonSkipSpace(r))
  {
    case '{':
      return JsonReadContainer(r, '}');

    case '[':
      return JsonReadContainer(r, ']');

    case '"':
      {
        const char* str = JsonReadString(r);
        if (!str)
          return nullptr;
        JsonStringValue* v = LinearAllocate<JsonStringValue>(r->m_Allocator);
        v->m_Type   = JsonValue::kString;
        v->m_String = str;
        return v;
      }

    case '-':
    case '0': case '1': case '2': case '3': case '4':
    case '5': case '6': case '7': case '8': case '9':
      return JsonReadNumber(r);

    default:
      return JsonReadKeyword(r);
  }
}

const JsonValue* JsonParse(
    char* buffer,
    MemAllocLinear* allocator,
    MemAllocLinear* scratch,
    char (&error_message)[1024])
{
  JsonReader reader;
  reader.m_Cursor    = buffer;
  reader.m_Line      = 1;
  reader.m_Depth     = 0;
  reader.m_Allocator = allocator;
  reader.m_Scratch   = scratch;
  reader.m_Error[0]  = '\0';

  const JsonValue* root = JsonReadValue(&reader);

  if (root && '\0' != JsonSkipSpace(&reader))
    root = JsonFail(&reader, "unexpected data after document");

  snprintf(error_message, sizeof error_message, "%s", root ? "" : reader.m_Error);
  return root;
}

const JsonValue* JsonParseText(
    const char* text,
    size_t length,
    MemAllocLinear* allocator,
    MemAllocLinear* scratch,
    char (&error_message)[1024])
{
  if (memchr(text, '\0', length))
  {
    snprintf(error_message, sizeof error_message, "embedded nul byte in document");
    return nullptr;
  }

  return JsonParse(StrDupN(allocator, text, length), allocator, scratch, error_message);
}

}
