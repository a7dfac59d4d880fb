#include "TestHarness.hpp"
#include "JsonParse.hpp"
#include "MemAllocLinear.hpp"
#include "MemAllocHeap.hpp"
#include "JsonWriter.hpp"

#include <stdio.h>
#include <string.h>

using namespace hs;

class JsonTest : public ::testing::Test
{
protected:
  MemAllocHeap heap;
  MemAllocLinear alloc;
  MemAllocLinear scratch;
  char error_msg[1024];

protected:
  void SetUp() override
  {
    HeapInit(&heap);
    LinearAllocInit(&alloc, &heap, MB(1), "json alloc");
    LinearAllocInit(&scratch, &heap, MB(1), "json scratch");
  }

  void TearDown() override
  {
    LinearAllocDestroy(&scratch);
    LinearAllocDestroy(&alloc);
    HeapDestroy(&heap);
  }

};

TEST_F(JsonTest, ReferenceRecordArray)
{
  char input[] =
    "[\n"
    "  { \"Filename\": \"setup.exe\", \"MD5\": \"900150983cd24fb0d6963f7d28e17f72\" },\n"
    "  { \"Filename\": \"readme.txt\", \"SHA1\": null }\n"
    "]\n";
  const JsonValue* v = JsonParse(input, &alloc, &scratch, error_msg);

  ASSERT_STREQ("", error_msg);
  ASSERT_NE(nullptr, v);

  const JsonArrayValue* records = v->AsArray();
  ASSERT_NE(nullptr, records);
  ASSERT_EQ(2u, records->m_Count);

  const JsonObjectValue* first = records->m_Values[0]->AsObject();
  ASSERT_NE(nullptr, first);
  ASSERT_EQ(2u, first->m_Count);
  EXPECT_STREQ("Filename", first->m_Names[0]);
  EXPECT_STREQ("MD5", first->m_Names[1]);
  EXPECT_STREQ("setup.exe", v->Elem(0)->Find("Filename")->GetString());
  EXPECT_STREQ("900150983cd24fb0d6963f7d28e17f72", v->Elem(0)->Find("MD5")->GetString());

  const JsonValue* sha1 = v->Elem(1)->Find("SHA1");
  ASSERT_NE(nullptr, sha1);
  EXPECT_EQ(JsonValue::kNull, sha1->m_Type);
  EXPECT_EQ(nullptr, sha1->AsString());
}

TEST_F(JsonTest, EmptyContainers)
{
  char input[] = "{ \"matches\": [], \"meta\": {} }";
  const JsonValue* v = JsonParse(input, &alloc, &scratch, error_msg);

  ASSERT_NE(nullptr, v) << error_msg;
  ASSERT_NE(nullptr, v->Find("matches")->AsArray());
  EXPECT_EQ(0u, v->Find("matches")->AsArray()->m_Count);
  ASSERT_NE(nullptr, v->Find("meta")->AsObject());
  EXPECT_EQ(0u, v->Find("meta")->AsObject()->m_Count);
}

TEST_F(JsonTest, LargeArraySpansScratchBlocks)
{
  char input[4096];
  int len = snprintf(input, sizeof input, "[");
  for (int i = 0; i < 100; ++i)
    len += snprintf(input + len, sizeof input - len, "%s%d", i ? "," : "", i);
  snprintf(input + len, sizeof input - len, "]");

  const JsonValue* v = JsonParse(input, &alloc, &scratch, error_msg);
  ASSERT_NE(nullptr, v) << error_msg;
  ASSERT_EQ(100u, v->AsArray()->m_Count);
  for (int i = 0; i < 100; ++i)
    EXPECT_EQ(double(i), v->Elem(i)->GetNumber());
}

TEST_F(JsonTest, RepositoryMatchValueKinds)
{
  char input[] = "[{\"size\": 1024, \"price\": 12.50, \"signed\": true, \"revoked\": false, "
                 "\"tags\": [\"a\", \"b\"], \"vendor\": {\"name\": \"x\"}}]";
  const JsonValue* v = JsonParse(input, &alloc, &scratch, error_msg);
  ASSERT_NE(nullptr, v) << error_msg;

  const JsonValue* match = v->Elem(0);
  EXPECT_DOUBLE_EQ(1024.0, match->Find("size")->GetNumber());
  EXPECT_STREQ("12.50", match->Find("price")->AsNumber()->m_Text);
  EXPECT_TRUE(match->Find("signed")->GetBoolean());
  EXPECT_FALSE(match->Find("revoked")->GetBoolean());
  EXPECT_EQ(2u, match->Find("tags")->AsArray()->m_Count);
  EXPECT_STREQ("x", match->Find("vendor")->Find("name")->GetString());
}

TEST_F(JsonTest, NumberForms)
{
  char input[] = "[0, -0.5, 1e3, 2E-2, 12345678901234567890, 1.50]";
  const JsonValue* v = JsonParse(input, &alloc, &scratch, error_msg);
  ASSERT_NE(nullptr, v) << error_msg;

  EXPECT_DOUBLE_EQ(0.0, v->Elem(0)->GetNumber());
  EXPECT_DOUBLE_EQ(-0.5, v->Elem(1)->GetNumber());
  EXPECT_DOUBLE_EQ(1000.0, v->Elem(2)->GetNumber());
  EXPECT_DOUBLE_EQ(0.02, v->Elem(3)->GetNumber());
  EXPECT_STREQ("12345678901234567890", v->Elem(4)->AsNumber()->m_Text);
  EXPECT_STREQ("1.50", v->Elem(5)->AsNumber()->m_Text);
}

TEST_F(JsonTest, StringEscapes)
{
  char input[] = "[\"C:\\\\Tools\\\\a.exe\", \"\\n\\r\\t\\f\\b\\/\\\"\", \"\\u0041\\u00e9\", \"\\ud83d\\ude00\"]";
  const JsonValue* v = JsonParse(input, &alloc, &scratch, error_msg);
  ASSERT_NE(nullptr, v) << error_msg;

  EXPECT_STREQ("C:\\Tools\\a.exe", v->Elem(0)->GetString());
  EXPECT_STREQ("\n\r\t\f\b/\"", v->Elem(1)->GetString());
  EXPECT_STREQ("A\xc3\xa9", v->Elem(2)->GetString());
  EXPECT_STREQ("\xf0\x9f\x98\x80", v->Elem(3)->GetString());
}

TEST_F(JsonTest, ErrorsCarryLineNumbers)
{
  struct Case { const char* m_Text; const char* m_Error; };
  static const Case cases[] =
  {
    { "",                        "line 1: unexpected end of input" },
    { "[1,\n 2",                 "line 2: unexpected end of input, expected ',' or ']'" },
    { "{\"a\" 1}",               "line 1: expected ':' after key \"a\"" },
    { "{1: 2}",                  "line 1: expected a quoted key" },
    { "[1]\n\n2",                "line 3: unexpected data after document" },
    { "[\"open",                 "line 1: end of input inside string" },
    { "[\"tab\there\"]",         "line 1: control character in string" },
    { "[\"\\x\"]",               "line 1: unknown escape '\\x'" },
    { "[\"\\ud800\"]",           "line 1: unpaired high surrogate" },
    { "[\"\\udc00\"]",           "line 1: unpaired low surrogate" },
    { "[\"\\u12\"]",             "line 1: \\u needs four hex digits" },
    { "[01]",                    "line 1: expected ',' or ']'" },
    { "[1.]",                    "line 1: bad number: missing fraction digits" },
    { "[1e+]",                   "line 1: bad number: missing exponent digits" },
    { "[-]",                     "line 1: bad number" },
    { "[0x10]",                  "line 1: expected ',' or ']'" },
    { "[nulls]",                 "line 1: unexpected character 'n'" },
    { "[True]",                  "line 1: unexpected character 'T'" },
  };

  for (const Case& c : cases)
  {
    const JsonValue* v = JsonParseText(c.m_Text, strlen(c.m_Text), &alloc, &scratch, error_msg);
    EXPECT_EQ(nullptr, v) << c.m_Text;
    EXPECT_STREQ(c.m_Error, error_msg) << c.m_Text;
  }
}

TEST_F(JsonTest, NestingIsBounded)
{
  char deep[200];
  memset(deep, '[', 65);
  memset(deep + 65, ']', 65);
  deep[130] = '\0';

  EXPECT_EQ(nullptr, JsonParse(deep, &alloc, &scratch, error_msg));
  EXPECT_STREQ("line 1: nesting deeper than 64 levels", error_msg);

  char ok[200];
  memset(ok, '[', 64);
  memset(ok + 64, ']', 64);
  ok[128] = '\0';

  EXPECT_NE(nullptr, JsonParse(ok, &alloc, &scratch, error_msg)) << error_msg;
}

TEST_F(JsonTest, EmbeddedNulRejected)
{
  const char text[] = "[\"a\"]\0[]";
  EXPECT_EQ(nullptr, JsonParseText(text, sizeof text - 1, &alloc, &scratch, error_msg));
  EXPECT_STREQ("embedded nul byte in document", error_msg);
}

TEST_F(JsonTest, ParseTextLeavesInputAlone)
{
  const char text[] = "{\"k\": \"a\\nb\"}";
  const JsonValue* v = JsonParseText(text, sizeof(text) - 1, &alloc, &scratch, error_msg);

  ASSERT_NE(nullptr, v);
  EXPECT_STREQ("a\nb", v->Find("k")->GetString());
  EXPECT_STREQ("{\"k\": \"a\\nb\"}", text);
}

TEST_F(JsonTest, FindAndElemOnWrongTypes)
{
  char input[] = "{\"a\": [1], \"a\": 2}";
  const JsonValue* v = JsonParse(input, &alloc, &scratch, error_msg);

  ASSERT_NE(nullptr, v);
  EXPECT_EQ(nullptr, v->Elem(0));
  EXPECT_EQ(nullptr, v->Find("missing"));
  EXPECT_EQ(nullptr, v->Find("a")->Find("a"));
  EXPECT_EQ(nullptr, v->Find("a")->Elem(1));
  // Duplicate keys are kept; Find returns the first.
  EXPECT_EQ(2u, v->AsObject()->m_Count);
  EXPECT_NE(nullptr, v->Find("a")->Elem(0));
}

TEST_F(JsonTest, WriterEscapesAndSeparators)
{
  JsonWriter writer;
  JsonWriteInit(&writer, &scratch);

  JsonWriteStartArray(&writer);
  JsonWriteStartObject(&writer);
  JsonWriteKeyName(&writer, "s");
  JsonWriteValueString(&writer, "q\"\\\n\x01");
  JsonWriteKeyName(&writer, "i");
  JsonWriteValueInteger(&writer, -7);
  JsonWriteKeyName(&writer, "b");
  JsonWriteValueBool(&writer, true);
  JsonWriteKeyName(&writer, "n");
  JsonWriteValueNull(&writer);
  JsonWriteEndObject(&writer);
  JsonWriteNewline(&writer);
  JsonWriteStartArray(&writer);
  JsonWriteEndArray(&writer);
  JsonWriteEndArray(&writer);

  ASSERT_STREQ("[{\"s\":\"q\\\"\\\\\\n\\u0001\",\"i\":-7,\"b\":true,\"n\":null},\n[]]",
               JsonWriteToString(&writer, &alloc));
}

TEST_F(JsonTest, WriterRoundTripsParsedValue)
{
  char input[] = " { \"a\" : [ 1.0, true, null ], \"b\" : { \"c\" : \"d\" } } ";
  const JsonValue* v = JsonParse(input, &alloc, &scratch, error_msg);
  ASSERT_NE(nullptr, v);

  JsonWriter writer;
  JsonWriteInit(&writer, &scratch);
  JsonWriteValue(&writer, v);

  ASSERT_STREQ("{\"a\":[1.0,true,null],\"b\":{\"c\":\"d\"}}", JsonWriteToString(&writer, &alloc));
}
