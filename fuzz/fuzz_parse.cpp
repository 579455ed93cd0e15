// fuzz_parse.cpp – libFuzzer target for the lantern::json parse() entry points.
//
// Feeds arbitrary bytes through the bounded and unbounded parsers under each
// option combination the parser honours. Every failure must surface as
// lantern::json::Error; anything else escaping is a finding.
//
// Build:
//   cmake -B build-fuzz \
//         -DLANTERN_JSON_BUILD_FUZZ=ON \
//         -DLANTERN_JSON_BUILD_TESTS=OFF \
//         -DCMAKE_CXX_COMPILER=clang++
//   cmake --build build-fuzz --target fuzz_parse
//
// Run (indefinitely):
//   ./build-fuzz/fuzz_parse fuzz/corpus/ -max_len=65536

#include <lantern_json/lantern_json.hpp>
#include <cstddef>
#include <cstdint>

using namespace lantern::json;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
  static const Options kOptionSets[] = {
      Options::Default,
      Options::None,
      Options::NullSkipsKey,
      Options::FragmentsAllowed | Options::NullSkipsKey,
  };

  for (Options options : kOptionSets) {
    try {
      Value v = parse(data, size, options);
      (void)v;
    } catch (const Error &) {
      // Expected for malformed input.
    }
  }

  try {
    Value v = parse_unbounded(data, size);
    (void)v;
  } catch (const Error &) {
  }

  return 0;
}
