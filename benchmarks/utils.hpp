#pragma once
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

namespace bench {

// Read entire file into string
inline std::string read_file(const char *path) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f.is_open()) {
    throw std::runtime_error(std::string("Failed to open file: ") + path);
  }
  std::streamsize size = f.tellg();
  f.seekg(0, std::ios::beg);
  std::string buffer(static_cast<size_t>(size), '\0');
  if (!f.read(&buffer[0], size)) {
    throw std::runtime_error(std::string("Failed to read file: ") + path);
  }
  return buffer;
}

class Timer {
public:
  using clock = std::chrono::steady_clock;

  void start() { start_ = clock::now(); }

  double elapsed_ns() const {
    return std::chrono::duration<double, std::nano>(clock::now() - start_)
        .count();
  }

private:
  clock::time_point start_;
};

// Per-iteration timings for one library on one input.
struct Result {
  std::string library;
  size_t input_bytes;
  double parse_time_ns;
  double serialize_time_ns;
  bool round_trip_ok;

  static double mb_per_s(size_t bytes, double ns) {
    return ns > 0 ? (bytes / (1024.0 * 1024.0)) / (ns / 1e9) : 0.0;
  }

  void print() const {
    std::cout << std::left << std::setw(12) << library << " | Parse: "
              << std::right << std::setw(10) << std::fixed
              << std::setprecision(2) << (parse_time_ns / 1000.0) << " us ("
              << std::setw(8) << mb_per_s(input_bytes, parse_time_ns)
              << " MB/s) | Serialize: " << std::setw(10)
              << (serialize_time_ns / 1000.0) << " us | round trip "
              << (round_trip_ok ? "PASS" : "FAIL") << "\n";
  }
};

inline void print_header(const std::string &benchmark_name) {
  std::cout << "\n=== " << benchmark_name << " ===\n";
  std::cout << std::string(80, '-') << "\n";
}

} // namespace bench
