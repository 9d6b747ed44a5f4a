/***
 * Name: tycast::driver (app)
 * Purpose: Execute a parsed command and report metrics.
 * Inputs: Parsed CliOptions, output and diagnostic streams
 * Outputs: Process exit status
 * Theory of Operation: Commands read the process-wide builtin registry and the
 *   global type interner. Exit codes: 0 success or castable, 1 not castable or
 *   unknown builtin, 2 usage or (strict) parse error.
 */
#pragma once

#include <iosfwd>
#include <string>

#include "tycast/driver/cli.h"
#include "tycast/types/UnionType.h"

namespace tycast {
namespace driver {

int RunCommand(const CliOptions& opts, std::ostream& out, std::ostream& err);

/***
 * Name: tycast::driver::ParseUnionArgument
 * Purpose: Parse a union operand, honouring --strict.
 * Inputs:
 *   - text: operand text
 *   - opts: options (strict flag)
 *   - err: stream that receives one warning per unparsable segment in lenient mode
 * Outputs: The parsed union
 * Theory of Operation: In strict mode the first unparsable segment throws
 *   TypeParseError; otherwise segments fall back to `none` with a warning.
 */
types::UnionType ParseUnionArgument(const std::string& text, const CliOptions& opts, std::ostream& err);

void ReportMetricsIfRequested(const CliOptions& opts, std::ostream& out);

}  // namespace driver
}  // namespace tycast
