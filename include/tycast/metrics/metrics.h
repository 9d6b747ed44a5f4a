/***
 * Name: tycast::metrics::Metrics
 * Purpose: Process-wide metrics with a static registry. Query paths use ScopedTimer
 *   and the counter helpers to record what they did.
 * Inputs: Phase identifiers and named counters
 * Outputs: A static registry the CLI prints as text or JSON
 * Theory of Operation: All instances share a static Registry and enabled flag;
 *   recording is a no-op while disabled. Not synchronised: intended for the
 *   single-threaded command-line tool.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace tycast {

namespace metrics {

class Metrics {
 public:
  enum class Phase { RegistryLoad, Parse, CastCheck, Query };

  struct Registry {
    bool enabled{false};
    std::vector<std::pair<Phase, std::uint64_t>> durations_ns;
    std::map<std::string, std::uint64_t> counters;
  };

  class ScopedTimer {
   public:
    explicit ScopedTimer(Phase phase)
        : phase_(phase), start_(std::chrono::steady_clock::now()) {}
    ~ScopedTimer() noexcept {
      if (!reg_.enabled) return;
      auto end = std::chrono::steady_clock::now();
      auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_).count();
      reg_.durations_ns.emplace_back(phase_, static_cast<std::uint64_t>(ns));
    }

   private:
    Phase phase_;
    std::chrono::time_point<std::chrono::steady_clock> start_;
  };

  static void Enable(bool on) { reg_.enabled = on; }
  static Registry& GetRegistry() { return reg_; }
  static void Reset() { reg_ = Registry{}; }
  static void IncCounter(const std::string& key, std::uint64_t delta = 1) { if (reg_.enabled) reg_.counters[key] += delta; }
  static void SetCounter(const std::string& key, std::uint64_t value) { if (reg_.enabled) reg_.counters[key] = value; }

  static const char* PhaseName(Phase phase);
  static void PrintMetrics(const Registry& reg, std::ostream& out);
  static void PrintMetricsJson(const Registry& reg, std::ostream& out);

 protected:
  Metrics() = default;

 private:
  static Registry reg_;
};

}  // namespace metrics
}  // namespace tycast
