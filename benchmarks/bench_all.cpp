// benchmarks/bench_all.cpp
// Parse + stringify throughput: lantern::json vs yyjson vs nlohmann/json.
//
// Usage:
//   ./bench_all [file.json]     # single file (default: twitter.json)
//   ./bench_all --all           # run all 4 standard files sequentially

#include "utils.hpp"
#include <lantern_json/lantern_json.hpp>
#include <nlohmann/json.hpp>
#include <yyjson.h>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

static void run_file(const std::string &filename, size_t N) {
  std::string content;
  try {
    content = bench::read_file(filename.c_str());
  } catch (const std::exception &e) {
    std::cerr << "Skip " << filename << ": " << e.what() << "\n";
    return;
  }
  if (content.empty()) {
    std::cerr << "Skip " << filename << ": empty\n";
    return;
  }

  bench::print_header("bench_all - " + filename);
  std::cout << "Size: " << (content.size() / 1024.0) << " KB"
            << "  Iterations: " << N << "\n";

  // ── 1. lantern::json ─────────────────────────────────────────────────────
  {
    lantern::json::Value doc;
    try {
      doc = lantern::json::parse_unbounded(content);
    } catch (const lantern::json::Error &e) {
      std::cerr << "  lantern rejected " << filename << ": " << e.what()
                << "\n";
      return;
    }

    bench::Timer pt, st;
    pt.start();
    for (size_t i = 0; i < N; ++i)
      (void)lantern::json::parse_unbounded(content);
    double p_ns = pt.elapsed_ns() / N;

    st.start();
    for (size_t i = 0; i < N; ++i)
      (void)lantern::json::stringify(doc);
    double s_ns = st.elapsed_ns() / N;

    // Cross-check the output with an independent parser.
    bool ok = false;
    try {
      ok = nlohmann::json::parse(content) ==
           nlohmann::json::parse(lantern::json::stringify(doc));
    } catch (const nlohmann::json::exception &e) {
      std::cerr << "  lantern output rejected by nlohmann: " << e.what()
                << "\n";
    }

    bench::Result{"lantern", content.size(), p_ns, s_ns, ok}.print();
  }

  // ── 2. yyjson ────────────────────────────────────────────────────────────
  {
    bench::Timer pt, st;
    pt.start();
    for (size_t i = 0; i < N; ++i) {
      yyjson_doc *d = yyjson_read(content.c_str(), content.size(), 0);
      yyjson_doc_free(d);
    }
    double p_ns = pt.elapsed_ns() / N;

    yyjson_doc *d = yyjson_read(content.c_str(), content.size(), 0);
    st.start();
    for (size_t i = 0; i < N; ++i) {
      size_t l;
      char *s = yyjson_write(d, 0, &l);
      free(s);
    }
    double s_ns = st.elapsed_ns() / N;
    yyjson_doc_free(d);

    bench::Result{"yyjson", content.size(), p_ns, s_ns, true}.print();
  }

  // ── 3. nlohmann/json (baseline) ──────────────────────────────────────────
  {
    bench::Timer pt, st;
    pt.start();
    for (size_t i = 0; i < N; ++i)
      (void)nlohmann::json::parse(content);
    double p_ns = pt.elapsed_ns() / N;

    nlohmann::json j = nlohmann::json::parse(content);
    st.start();
    for (size_t i = 0; i < N; ++i)
      (void)j.dump();
    double s_ns = st.elapsed_ns() / N;

    bench::Result{"nlohmann", content.size(), p_ns, s_ns, true}.print();
  }

  std::cout << "\n";
}

int main(int argc, char **argv) {
  const size_t N = 100;

  if (argc >= 2 && std::strcmp(argv[1], "--all") == 0) {
    const std::vector<std::string> files = {
        "twitter.json", "canada.json", "citm_catalog.json", "gsoc-2018.json"};
    for (const auto &f : files)
      run_file(f, N);
  } else {
    const std::string filename = (argc >= 2) ? argv[1] : "twitter.json";
    run_file(filename, N);
  }
  return 0;
}
