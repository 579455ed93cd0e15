// debug_diff.cpp - round-trip checker for lantern::json.
//
// Parses a file, stringifies it, re-parses the output and reports whether the
// value survived and whether a second stringify pass is byte-identical.
//
// Usage:
//   ./json_roundtrip_diff file.json [--pretty] [--sorted] [--null-skips-key]

#include <lantern_json/lantern_json.hpp>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <string>

using namespace lantern::json;

static void print_context(const char *label, const std::string &text,
                          size_t start, size_t end) {
  std::cout << label << "...";
  for (size_t j = start; j < end && j < text.size(); j++) {
    char c = text[j];
    if (c == '\n')
      std::cout << "\\n";
    else if (c == '\t')
      std::cout << "\\t";
    else if (c == ' ')
      std::cout << "·";
    else
      std::cout << c;
  }
  std::cout << "...\n";
}

static void report_first_difference(const std::string &first,
                                    const std::string &second) {
  size_t min_len = std::min(first.size(), second.size());
  for (size_t i = 0; i < min_len; i++) {
    if (first[i] != second[i]) {
      std::cout << "First difference at position " << i << ":\n";
      size_t start = (i > 50) ? i - 50 : 0;
      size_t end = std::min(i + 50, min_len);
      print_context("Pass 1: ", first, start, end);
      print_context("Pass 2: ", second, start, end);
      std::cout << "\nPass 1 char: '" << first[i] << "' (0x" << std::hex
                << (int)(unsigned char)first[i] << std::dec << ")\n";
      std::cout << "Pass 2 char: '" << second[i] << "' (0x" << std::hex
                << (int)(unsigned char)second[i] << std::dec << ")\n";
      break;
    }
  }
  if (first.size() != second.size()) {
    std::cout << "\nSize mismatch: " << first.size() << " vs "
              << second.size() << "\n";
  }
}

int main(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0]
              << " file.json [--pretty] [--sorted] [--null-skips-key]\n";
    return 2;
  }

  Options options = Options::Default;
  for (int i = 2; i < argc; ++i) {
    if (std::strcmp(argv[i], "--pretty") == 0)
      options |= Options::PrettyPrinted;
    else if (std::strcmp(argv[i], "--sorted") == 0)
      options |= Options::SortedKeys;
    else if (std::strcmp(argv[i], "--null-skips-key") == 0)
      options |= Options::NullSkipsKey;
    else {
      std::cerr << "unknown option: " << argv[i] << "\n";
      return 2;
    }
  }

  try {
    Value original = load_file(argv[1], options);
    std::string first = stringify(original, options);
    std::cout << "Serialized size: " << first.size() << " bytes\n";

    Value reparsed = parse_unbounded(first, options);
    std::cout << "Value match: " << (reparsed == original ? "YES" : "NO")
              << "\n";

    std::string second = stringify(reparsed, options);
    std::cout << "Stable text: " << (first == second ? "YES" : "NO") << "\n\n";
    if (first != second)
      report_first_difference(first, second);

    return (reparsed == original && first == second) ? 0 : 1;
  } catch (const Error &e) {
    std::cerr << error_message(e.kind()) << ": " << e.what() << "\n";
    if (e.has_offset())
      std::cerr << "  at input offset " << e.offset() << "\n";
    return 1;
  }
}
