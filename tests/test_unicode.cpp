#include <lantern_json/lantern_json.hpp>
#include <gtest/gtest.h>
#include <string>

using namespace lantern::json;

static std::string parse_string_value(const std::string &json) {
  return parse(json).as_string();
}

TEST(Unicode, BasicMultilingualPlaneEscapes) {
  EXPECT_EQ(parse_string_value(R"("\u0041\u0024")"), "A$");
  EXPECT_EQ(parse_string_value(R"("\u00e9")"), "\xC3\xA9");
  EXPECT_EQ(parse_string_value(R"("\u20AC")"), "\xE2\x82\xAC");
  EXPECT_EQ(parse_string_value(R"("\u20ac")"), "\xE2\x82\xAC");
  EXPECT_EQ(parse_string_value(R"("\uFFFF")"), "\xEF\xBF\xBF");
}

TEST(Unicode, EscapedNulCharacter) {
  EXPECT_EQ(parse_string_value(R"("a\u0000b")"), std::string("a\0b", 3));
}

TEST(Unicode, SurrogatePairs) {
  // U+10437
  EXPECT_EQ(parse_string_value(R"("\uD801\uDC37")"), "\xF0\x90\x90\xB7");
  // U+1F639 U+1F48D
  EXPECT_EQ(parse_string_value(R"("\ud83d\ude39\ud83d\udc8d")"),
            "\xF0\x9F\x98\xB9\xF0\x9F\x92\x8D");
  // U+1D11E between plain text
  EXPECT_EQ(parse_string_value(R"("G \uD834\uDD1E clef")"),
            "G \xF0\x9D\x84\x9E clef");
}

TEST(Unicode, InvalidEscapesRejected) {
  const char *cases[] = {
      R"("\ud800\ud123")", // lead followed by another lead-range unit
      R"("\ud800")",       // lead at end of string
      R"("\ud800abc")",    // lead followed by plain text
      R"("\ud800\n")",     // lead followed by a different escape
      R"("\udc00")",       // trail without lead
      R"("\u12")",         // too short
      R"("\u12G4")",       // bad hex digit
      R"("\uZZZZ")",
      R"("\u")",
  };
  for (const char *json : cases) {
    try {
      parse(json);
      ADD_FAILURE() << "accepted " << json;
    } catch (const Error &e) {
      EXPECT_EQ(e.kind(), ErrorKind::Parse) << json;
      EXPECT_EQ(std::string(e.what()).rfind("Invalid unicode escape", 0), 0u)
          << json << ": " << e.what();
    }
  }
}

TEST(Unicode, UnpairedSurrogateOffsets) {
  try {
    parse(R"(["\udc00"])");
    FAIL();
  } catch (const Error &e) {
    EXPECT_STREQ(e.what(),
                 "Invalid unicode escape - unpaired trail surrogate at offset 4");
    EXPECT_EQ(e.offset(), 4u);
  }
  try {
    parse(R"("\uD800\u0041")");
    FAIL();
  } catch (const Error &e) {
    EXPECT_STREQ(
        e.what(),
        "Invalid unicode escape - expected trail surrogate at offset 9");
  }
  try {
    parse(R"("\u00G0")");
    FAIL();
  } catch (const Error &e) {
    EXPECT_STREQ(e.what(),
                 "Invalid unicode escape - unexpected G at offset 5");
  }
}

TEST(Unicode, TruncatedEscapeIsEndOfStream) {
  try {
    parse(R"(["\)");
    FAIL();
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::Parse);
    EXPECT_STREQ(e.what(), "Unexpected end of stream at offset 3");
  }
}

TEST(Unicode, RawUtf8PassesThrough) {
  const std::string text = "\xE2\x82\xAC \xF0\x9F\x98\xB9 \xC3\xA9";
  Value v = parse("[\"" + text + "\"]");
  EXPECT_EQ(v.get(0), Value(text));
  EXPECT_EQ(stringify(v), "[\"" + text + "\"]");
}

TEST(Unicode, EscapedKeys) {
  Value v = parse(R"({"\u006b\u0065\u0079":1})");
  EXPECT_EQ(v.get("key"), Value(1));
}
