/***
 * Name: tycast::metrics::PrintMetrics
 * Purpose: Pretty-print collected metrics (durations and counters).
 * Inputs:
 *   - reg: metrics registry
 *   - out: destination stream
 * Outputs: None
 * Theory of Operation: Formats timings in milliseconds and lists counters in key order.
 */
#include "tycast/metrics/metrics.h"

#include <iomanip>
#include <ios>
#include <ostream>

namespace tycast::metrics {

auto Metrics::PrintMetrics(const Registry& reg, std::ostream& out) -> void {
  if (!reg.enabled) {
    return;
  }
  out << "== Metrics ==\n";
  for (const auto& entry : reg.durations_ns) {
    const double milliseconds = static_cast<double>(entry.second) / 1'000'000.0;
    out << "  " << PhaseName(entry.first) << ": " << std::fixed << std::setprecision(3) << milliseconds << " ms\n";
  }
  out << "  Counters (" << reg.counters.size() << "):\n";
  for (const auto& [key, value] : reg.counters) {
    out << "    " << key << " = " << value << "\n";
  }
}

}  // namespace tycast::metrics
