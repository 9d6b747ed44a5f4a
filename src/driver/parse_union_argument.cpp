/***
 * Name: tycast::driver::ParseUnionArgument
 * Purpose: Parse a union operand, honouring --strict.
 */
#include "tycast/driver/app.h"

#include <ostream>
#include <vector>

#include "tycast/exceptions/type_parse_error.h"
#include "tycast/metrics/metrics.h"

namespace tycast::driver {

auto ParseUnionArgument(const std::string& text, const CliOptions& opts, std::ostream& err) -> types::UnionType {
  const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::Parse);
  std::vector<std::string> errs;
  types::UnionType result = types::UnionType::fromString(text, &errs);
  metrics::Metrics::IncCounter("parse.unions");
  if (errs.empty()) { return result; }
  metrics::Metrics::IncCounter("parse.invalid_segments", errs.size());
  if (opts.strict) { throw exceptions::TypeParseError(errs.front()); }
  for (const auto& msg : errs) { err << "tycast: warning: " << msg << " (treated as none)" << '\n'; }
  return result;
}

}  // namespace tycast::driver
