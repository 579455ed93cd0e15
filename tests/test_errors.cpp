#include <lantern_json/lantern_json.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

using namespace lantern::json;

TEST(Errors, KindMessages) {
  EXPECT_STREQ(error_message(ErrorKind::Unknown), "Unknown error");
  EXPECT_STREQ(error_message(ErrorKind::Parse), "Parse error");
  EXPECT_STREQ(error_message(ErrorKind::Encoding), "Encoding error");
  EXPECT_STREQ(error_message(ErrorKind::Decoding), "Decoding error");
  EXPECT_STREQ(error_message(ErrorKind::Casting), "Casting error");
  EXPECT_STREQ(error_message(ErrorKind::Subscript), "Subscript error");
  EXPECT_STREQ(error_message(ErrorKind::DepthExceeded),
               "Maximum depth exceeded");
}

TEST(Errors, Defaults) {
  Error e("boom");
  EXPECT_EQ(e.kind(), ErrorKind::Unknown);
  EXPECT_FALSE(e.has_offset());
  EXPECT_EQ(e.offset(), Error::npos);
  EXPECT_STREQ(e.what(), "boom");
}

TEST(Errors, EmptyMessageGetsDefault) {
  Error e("");
  EXPECT_STREQ(e.what(), "The operation couldn't be completed.");
}

TEST(Errors, CapturesConstructionSite) {
  Error e("boom", ErrorKind::Parse, 3); const auto line = __LINE__;
  EXPECT_EQ(e.where().line(), static_cast<uint_least32_t>(line));
  EXPECT_NE(e.callsite().find("test_errors.cpp"), std::string::npos);
  EXPECT_TRUE(e.has_offset());
  EXPECT_EQ(e.offset(), 3u);
}

TEST(Errors, FormatIncludesKindAndMessage) {
  Error e("bad thing", ErrorKind::Decoding);
  const std::string text = e.format();
  EXPECT_EQ(text.rfind("Decoding error at ", 0), 0u);
  EXPECT_NE(text.find(e.callsite()), std::string::npos);
  EXPECT_EQ(text.substr(text.size() - std::string(" - bad thing").size()),
            " - bad thing");
}

TEST(Errors, ParseErrorsPointIntoLibrary) {
  try {
    parse("[x]");
    FAIL();
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::Parse);
    EXPECT_NE(e.callsite().find("lantern_json.hpp"), std::string::npos);
  }
}

TEST(Errors, CatchableAsStandardException) {
  try {
    parse("{");
    FAIL();
  } catch (const std::runtime_error &e) {
    EXPECT_STREQ(e.what(), "Unexpected end of stream at offset 1");
  }
}

TEST(Errors, EachKindIsReachable) {
  auto kind_of = [](auto &&fn) {
    try {
      fn();
    } catch (const Error &e) {
      return e.kind();
    }
    return ErrorKind::Unknown;
  };
  EXPECT_EQ(kind_of([] { parse("]"); }), ErrorKind::Parse);
  EXPECT_EQ(kind_of([] { stringify(Value(std::nan(""))); }),
            ErrorKind::Encoding);
  EXPECT_EQ(kind_of([] { decode<int>(Value("z")); }), ErrorKind::Decoding);
  EXPECT_EQ(kind_of([] { Value(1).as_string(); }), ErrorKind::Casting);
  EXPECT_EQ(kind_of([] { Value::array().try_get(0); }), ErrorKind::Subscript);
  EXPECT_EQ(kind_of([] { parse(std::string(2000, '[')); }),
            ErrorKind::DepthExceeded);
}

TEST(Errors, FileErrors) {
  EXPECT_THROW(load_file("/nonexistent/lantern/input.json"), Error);
  EXPECT_THROW(save_file(Value::object(), "/nonexistent/lantern/out.json"),
               Error);
}
