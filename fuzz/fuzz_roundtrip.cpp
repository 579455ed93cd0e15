// fuzz_roundtrip.cpp – libFuzzer target checking that anything lantern::json
// accepts can be stringified under each output option and read back into an
// equal tree.
//
// Build:
//   cmake -B build-fuzz -DLANTERN_JSON_BUILD_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++
//   cmake --build build-fuzz --target fuzz_roundtrip

#include <lantern_json/lantern_json.hpp>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

using namespace lantern::json;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
  Value original;
  try {
    original = parse_unbounded(data, size);
  } catch (const Error &) {
    return 0;
  }

  for (Options options :
       {Options::Default, Options::Default | Options::PrettyPrinted,
        Options::Default | Options::WithoutEscapingSlashes}) {
    const std::string text = stringify(original, options);
    // Serializer output is always valid input; a throw here is a finding.
    const Value reparsed = parse_unbounded(text);
    if (reparsed != original)
      std::abort();
  }
  return 0;
}
