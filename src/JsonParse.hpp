#ifndef JSONPARSE_HPP
#define JSONPARSE_HPP

#include "Common.hpp"

namespace hs
{

struct MemAllocLinear;

struct JsonObjectValue;
struct JsonArrayValue;
struct JsonStringValue;
struct JsonNumberValue;
struct JsonBooleanValue;

// Parsed documents are immutable trees allocated from a linear allocator.
// Every node starts with its type tag; the As*() casts return null when the
// tag doesn't match.
struct JsonValue
{
  enum Type
  {
    kNull,
    kBoolean,
    kObject,
    kArray,
    kString,
    kNumber
  };

  Type m_Type;

  const JsonObjectValue*  AsObject() const;
  const JsonArrayValue*   AsArray() const;
  const JsonStringValue*  AsString() const;
  const JsonNumberValue*  AsNumber() const;
  const JsonBooleanValue* AsBoolean() const;

  // These CHECK the type; use the As*() forms for untrusted documents.
  double      GetNumber() const;
  const char* GetString() const;
  bool        GetBoolean() const;

  // Null when this isn't an array/object or the element is missing.
  const JsonValue* Elem(size_t index) const;
  const JsonValue* Find(const char* key) const;
};

struct JsonBooleanValue : JsonValue
{
  bool m_Boolean;
};

struct JsonNumberValue : JsonValue
{
  double      m_Number;
  const char* m_Text;       // literal as written, e.g. "1.50"
};

struct JsonStringValue : JsonValue
{
  const char* m_String;     // unescaped, UTF-8
};

struct JsonArrayValue : JsonValue
{
  size_t            m_Count;
  const JsonValue** m_Values;
};

struct JsonObjectValue : JsonValue
{
  size_t            m_Count;
  const char**      m_Names;  // in document order, duplicates kept
  const JsonValue** m_Values;
};

// Parses a nul-terminated document in place; string values point into
// `buffer` afterwards. On failure returns null and leaves a "line N: ..."
// message in `error_message`.
const JsonValue* JsonParse(
    char* buffer,
    MemAllocLinear* allocator,
    MemAllocLinear* scratch,
    char (&error_message)[1024]);

// Same, for text that may not be terminated (an HTTP body, a mapped file).
// The text is copied into `allocator` first.
const JsonValue* JsonParseText(
    const char* text,
    size_t length,
    MemAllocLinear* allocator,
    MemAllocLinear* scratch,
    char (&error_message)[1024]);

}

#endif
