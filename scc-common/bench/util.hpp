#ifndef SCC_COMMON_BENCH_UTIL_HPP
#define SCC_COMMON_BENCH_UTIL_HPP

#include <benchmark/benchmark.h>
#include <fmt/format.h>

#include <string>
#include <vector>

class ThroughputBenchmarkReporter : public benchmark::ConsoleReporter {
 public:
  bool ReportContext(const Context& context) override {
    bool result = ConsoleReporter::ReportContext(context);

    fmt::print("{}\n", std::string(60, '='));
    fmt::print("Money Arithmetic Benchmark Results\n");
    fmt::print("{}\n", std::string(60, '='));

    return result;
  }

  void ReportRuns(const std::vector<Run>& reports) override {
    for (const auto& run : reports) {
      if (run.error_occurred) continue;

      fmt::print("{}\n", run.benchmark_name());
      fmt::print("{}\n", std::string(60, '-'));

      double latency_ns = run.GetAdjustedRealTime();
      fmt::print("{:<10} {:>10.2f}ns    {}\n", "mean", latency_ns,
                 "Average latency");

      auto it = run.counters.find("items");
      if (it != run.counters.end()) {
        fmt::print("{:<10} {:>10.0f}      {}\n", "items",
                   static_cast<double>(it->second), "Values per iteration");
      }

      fmt::print("{:-^60}\n", "");

      // 公式: (1 sec / latency_ns) * 10^9 / 10^6 = 1000 / latency_ns
      if (latency_ns > 0) {
        fmt::print("Throughput: {:.2f} M ops/s\n", 1000.0 / latency_ns);
      }
    }
  }
};

#endif
