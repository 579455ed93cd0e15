#include <lantern_json/lantern_json.hpp>
#include <gtest/gtest.h>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

using namespace lantern::json;

static EncodingInfo detect(std::initializer_list<uint8_t> bytes) {
  std::vector<uint8_t> v(bytes);
  return detect_encoding(v.data(), v.size());
}

// Widens ASCII text to the given code unit layout.
static std::vector<uint8_t> encode_ascii(const std::string &text,
                                         Encoding encoding, bool with_bom) {
  std::vector<uint8_t> out;
  auto unit = [&](uint32_t c) {
    switch (encoding) {
    case Encoding::Utf8:
      out.push_back(static_cast<uint8_t>(c));
      break;
    case Encoding::Utf16LE:
      out.push_back(static_cast<uint8_t>(c & 0xFF));
      out.push_back(static_cast<uint8_t>(c >> 8));
      break;
    case Encoding::Utf16BE:
      out.push_back(static_cast<uint8_t>(c >> 8));
      out.push_back(static_cast<uint8_t>(c & 0xFF));
      break;
    case Encoding::Utf32LE:
      out.push_back(static_cast<uint8_t>(c & 0xFF));
      out.push_back(static_cast<uint8_t>((c >> 8) & 0xFF));
      out.push_back(static_cast<uint8_t>((c >> 16) & 0xFF));
      out.push_back(static_cast<uint8_t>(c >> 24));
      break;
    case Encoding::Utf32BE:
      out.push_back(static_cast<uint8_t>(c >> 24));
      out.push_back(static_cast<uint8_t>((c >> 16) & 0xFF));
      out.push_back(static_cast<uint8_t>((c >> 8) & 0xFF));
      out.push_back(static_cast<uint8_t>(c & 0xFF));
      break;
    }
  };
  if (with_bom) {
    if (encoding == Encoding::Utf8) {
      out = {0xEF, 0xBB, 0xBF};
    } else {
      unit(0xFEFF);
    }
  }
  for (char c : text)
    unit(static_cast<uint8_t>(c));
  return out;
}

TEST(EncodingDetector, ShortInputIsUtf8) {
  EXPECT_EQ(detect({}).encoding, Encoding::Utf8);
  EXPECT_EQ(detect({'1'}).encoding, Encoding::Utf8);
  EXPECT_EQ(detect({0x00}).encoding, Encoding::Utf8);
  EXPECT_EQ(detect({0x00}).bom_length, 0u);
}

TEST(EncodingDetector, ByteOrderMarks) {
  struct Case {
    std::vector<uint8_t> bytes;
    Encoding encoding;
    size_t bom;
  };
  std::vector<Case> cases = {
      {{0xEF, 0xBB, 0xBF, '{'}, Encoding::Utf8, 3},
      {{0xEF, 0xBB, 0xBF}, Encoding::Utf8, 3},
      {{0xFE, 0xFF, 0x00, '{'}, Encoding::Utf16BE, 2},
      {{0xFF, 0xFE, '{', 0x00}, Encoding::Utf16LE, 2},
      {{0xFF, 0xFE}, Encoding::Utf16LE, 2},
      {{0x00, 0x00, 0xFE, 0xFF}, Encoding::Utf32BE, 4},
      {{0xFF, 0xFE, 0x00, 0x00}, Encoding::Utf32LE, 4},
  };
  for (const auto &c : cases) {
    EncodingInfo info = detect_encoding(c.bytes.data(), c.bytes.size());
    EXPECT_EQ(info.encoding, c.encoding) << encoding_name(c.encoding);
    EXPECT_EQ(info.bom_length, c.bom) << encoding_name(c.encoding);
  }
}

TEST(EncodingDetector, NullBytePatterns) {
  EXPECT_EQ(detect({0x00, 0x00, 0x00, '{'}).encoding, Encoding::Utf32BE);
  EXPECT_EQ(detect({'{', 0x00, 0x00, 0x00}).encoding, Encoding::Utf32LE);
  EXPECT_EQ(detect({0x00, '{', 0x00, '"'}).encoding, Encoding::Utf16BE);
  EXPECT_EQ(detect({'{', 0x00, '"', 0x00}).encoding, Encoding::Utf16LE);
  EXPECT_EQ(detect({0x00, '1'}).encoding, Encoding::Utf16BE);
  EXPECT_EQ(detect({'1', 0x00}).encoding, Encoding::Utf16LE);
  EXPECT_EQ(detect({'{', '"', 'u', '"'}).encoding, Encoding::Utf8);
  EXPECT_EQ(detect({'{', '"', 'u', '"'}).bom_length, 0u);
}

TEST(EncodingDetector, StringViewOverload) {
  EXPECT_EQ(detect_encoding(std::string_view("\xEF\xBB\xBF[]")).bom_length,
            3u);
  EXPECT_EQ(detect_encoding(std::string_view("[]")).encoding,
            Encoding::Utf8);
}

TEST(EncodingDetector, ParserSkipsUtf8Bom) {
  EXPECT_EQ(parse("\xEF\xBB\xBF"
                  "0"),
            Value(0));
  EXPECT_EQ(parse(encode_ascii(R"({"u":8})", Encoding::Utf8, true)),
            Value::object({{"u", 8}}));
  EXPECT_THROW(parse("\xEF\xBB\xBF"), Error);
}

TEST(EncodingDetector, ParserRejectsWideEncodings) {
  const std::vector<Encoding> wide = {Encoding::Utf16LE, Encoding::Utf16BE,
                                      Encoding::Utf32LE, Encoding::Utf32BE};
  for (Encoding encoding : wide) {
    for (bool bom : {false, true}) {
      auto bytes = encode_ascii(R"({"u":16})", encoding, bom);
      EXPECT_EQ(detect_encoding(bytes.data(), bytes.size()).encoding, encoding)
          << encoding_name(encoding) << " bom=" << bom;
      try {
        parse(bytes);
        FAIL() << "accepted " << encoding_name(encoding) << " bom=" << bom;
      } catch (const Error &e) {
        EXPECT_EQ(e.kind(), ErrorKind::Parse);
        EXPECT_EQ(std::string(e.what()),
                  std::string("Unsupported string encoding (") +
                      encoding_name(encoding) + ")");
      }
    }
  }
}
