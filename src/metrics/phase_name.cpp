/***
 * Name: tycast::metrics::Metrics::PhaseName
 * Purpose: Stable display name for a phase, shared by the text and JSON printers.
 */
#include "tycast/metrics/metrics.h"

namespace tycast::metrics {

auto Metrics::PhaseName(Phase phase) -> const char* {
  switch (phase) {
    case Phase::RegistryLoad: return "RegistryLoad";
    case Phase::Parse: return "Parse";
    case Phase::CastCheck: return "CastCheck";
    case Phase::Query: return "Query";
  }
  return "Unknown";
}

}  // namespace tycast::metrics
