/***
 * Name: tycast::driver::ReportMetricsIfRequested
 * Purpose: Print metrics if enabled by CLI.
 * Inputs:
 *   - opts: CLI options containing metrics flags
 *   - out: destination stream (stderr from main, so answers on stdout stay clean)
 * Outputs: None
 * Theory of Operation: Reads Metrics registry and prints text or JSON.
 */
#include "tycast/driver/app.h"
#include "tycast/metrics/metrics.h"

#include <ostream>

namespace tycast::driver {

auto ReportMetricsIfRequested(const CliOptions& opts, std::ostream& out) -> void {
  if (!opts.metrics) {
    return;
  }
  const auto& reg = metrics::Metrics::GetRegistry();
  if (opts.metrics_format == CliOptions::MetricsFormat::Json) {
    metrics::Metrics::PrintMetricsJson(reg, out);
  } else {
    metrics::Metrics::PrintMetrics(reg, out);
  }
}

}  // namespace tycast::driver
