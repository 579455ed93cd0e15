#include <lantern_json/lantern_json.hpp>
#include <gtest/gtest.h>
#include <cstdint>
#include <string>

using namespace lantern::json;

static std::string nested_arrays(size_t depth) {
  return std::string(depth, '[') + std::string(depth, ']');
}

static std::string nested_objects(size_t depth) {
  std::string json;
  for (size_t i = 0; i < depth; ++i)
    json += "{\"k\":";
  json += "1";
  json += std::string(depth, '}');
  return json;
}

static void expect_depth_error(const std::string &json, bool bounded) {
  try {
    if (bounded)
      parse(json);
    else
      parse_unbounded(json);
    ADD_FAILURE() << "nesting of " << json.size() << " bytes accepted";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::DepthExceeded);
    EXPECT_TRUE(e.has_offset());
    EXPECT_EQ(std::string(e.what()).rfind("Maximum parse depth exceeded", 0),
              0u);
  }
}

TEST(Depth, BoundedAcceptsBelowLimit) {
  EXPECT_NO_THROW(parse(nested_arrays(1023)));
  EXPECT_NO_THROW(parse(nested_objects(1023)));
}

TEST(Depth, BoundedRejectsAtLimit) {
  expect_depth_error(nested_arrays(1024), true);
  expect_depth_error(nested_objects(1024), true);
}

TEST(Depth, UnboundedAcceptsHardLimit) {
  Value v;
  ASSERT_NO_THROW(v = parse_unbounded(nested_arrays(2048)));
  size_t depth = 0;
  const Value *cursor = &v;
  while (cursor->is_array() && !cursor->empty()) {
    cursor = &cursor->as_array()[0];
    ++depth;
  }
  EXPECT_EQ(depth, 2047u);
}

TEST(Depth, UnboundedRejectsBeyondHardLimit) {
  expect_depth_error(nested_arrays(2049), false);
  expect_depth_error(nested_arrays(4096), false);
}

TEST(Depth, ErrorOffsetPointsAtOpeningBracket) {
  try {
    parse(nested_arrays(1024));
    FAIL();
  } catch (const Error &e) {
    EXPECT_EQ(e.offset(), 1023u);
    EXPECT_STREQ(e.what(), "Maximum parse depth exceeded at offset 1023");
  }
}

// The limit applies before the closing brackets are seen.
TEST(Depth, TruncatedDeepInputReportsDepth) {
  expect_depth_error(std::string(1024, '['), true);
}

TEST(Depth, SiblingsDoNotAccumulate) {
  std::string json = "[";
  for (int i = 0; i < 3000; ++i)
    json += "[[1]],";
  json += "[]]";
  Value v = parse(json);
  EXPECT_EQ(v.size(), 3001u);
}

TEST(Depth, CustomParserLimit) {
  const std::string ok = "[[1]]";
  const std::string deep = "[[[1]]]";
  Parser shallow(reinterpret_cast<const uint8_t *>(ok.data()), ok.size(),
                 Options::Default, 3);
  EXPECT_EQ(shallow.parse(), Value::array({Value::array({1})}));

  Parser too_deep(reinterpret_cast<const uint8_t *>(deep.data()), deep.size(),
                  Options::Default, 3);
  EXPECT_THROW(too_deep.parse(), Error);
}

TEST(Depth, DefaultParserUsesHardLimit) {
  const std::string ok = nested_arrays(2048);
  Parser parser(reinterpret_cast<const uint8_t *>(ok.data()), ok.size());
  EXPECT_NO_THROW(parser.parse());

  const std::string deep = nested_arrays(2049);
  Parser too_deep(reinterpret_cast<const uint8_t *>(deep.data()), deep.size());
  try {
    too_deep.parse();
    FAIL();
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::DepthExceeded);
    EXPECT_EQ(e.offset(), 2048u);
  }
}

TEST(Depth, AsyncParseIsUnbounded) {
  EXPECT_NO_THROW(parse_async(nested_arrays(1500)).get());
}
