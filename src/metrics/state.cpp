/***
 * Name: tycast::metrics::Metrics::reg_
 * Purpose: Define the static metrics registry storage.
 * Inputs: N/A
 * Outputs: Singleton-style storage for metrics across queries.
 * Theory of Operation: One definition for the class-declared static member.
 */
#include "tycast/metrics/metrics.h"

namespace tycast {
namespace metrics {

Metrics::Registry Metrics::reg_{};

}  // namespace metrics
}  // namespace tycast
