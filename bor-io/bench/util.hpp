#ifndef BUFFERED_OFFSET_READER_BENCH_UTIL_HPP
#define BUFFERED_OFFSET_READER_BENCH_UTIL_HPP

#include <benchmark/benchmark.h>
#include <fmt/format.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "bor/error.hpp"
#include "bor/io/file.hpp"

class ReadBenchmarkReporter : public benchmark::ConsoleReporter {
 public:
  bool ReportContext(const Context& context) override {
    bool result = ConsoleReporter::ReportContext(context);

    fmt::print("{}\n", std::string(60, '='));
    fmt::print("Positional Read Benchmark Results\n");
    fmt::print("{}\n", std::string(60, '='));

    return result;
  }

  void ReportRuns(const std::vector<Run>& reports) override {
    for (const auto& run : reports) {
      if (run.error_occurred) continue;

      fmt::print("{}\n", run.benchmark_name());
      fmt::print("{}\n", std::string(60, '-'));

      auto print_metric = [&](const char* name, const char* desc) {
        auto it = run.counters.find(name);
        if (it != run.counters.end()) {
          fmt::print("{:<14} {:>14.2f}    {}\n", name,
                     static_cast<double>(it->second), desc);
        }
      };

      print_metric("source_calls", "Underlying read_at calls per iteration");
      print_metric("hit_ratio", "Reads served from the window");
      print_metric("bytes_per_second", "Payload throughput");

      fmt::print("{:-^60}\n", "");
      fmt::print("Time: {:.2f} us / iteration\n",
                 run.GetAdjustedRealTime() / 1000.0);
    }
  }
};

/// @brief 64 bytes 一筆、共 1024 筆的臨時檔案
inline constexpr size_t kChunkSize = 64;
inline constexpr size_t kChunkCount = 1024;

/// @brief 建立測試檔案，內容為重複的 0..kChunkSize-1
/// @return 開啟的 File 與一筆 chunk 的內容
///
inline bor::Result<std::pair<bor::io::File, std::vector<std::byte>>>
make_chunked_file() {
  auto file = TRY(bor::io::File::create_temp("/tmp/bor-bench-XXXXXX"));
  ::unlink(file.path().c_str());

  std::vector<std::byte> chunk(kChunkSize);
  for (size_t i = 0; i < kChunkSize; ++i) {
    chunk[i] = static_cast<std::byte>(i);
  }

  for (size_t i = 0; i < kChunkCount; ++i) {
    ssize_t n = ::pwrite(file.fd(), chunk.data(), chunk.size(),
                         static_cast<off_t>(i * kChunkSize));
    if (n != static_cast<ssize_t>(chunk.size())) {
      return bor::fail(errno, "pwrite() failed");
    }
  }

  return std::pair{std::move(file), std::move(chunk)};
}

#endif
