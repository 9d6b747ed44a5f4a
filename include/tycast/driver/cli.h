/***
 * Name: tycast::driver (cli)
 * Purpose: Declarations for CLI options, parsing, and usage printing.
 * Inputs: N/A (declarations only)
 * Outputs: Types and functions for CLI handling.
 * Theory of Operation: A small subcommand CLI for single type queries. Definitions
 *   live in .cpp files.
 */
#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace tycast {
namespace driver {

/***
 * Name: tycast::driver::CliOptions
 * Purpose: Hold parsed command-line options for a tycast invocation.
 * Inputs: Values are populated by ParseCli.
 * Outputs: Consumed by RunCommand.
 */
struct CliOptions {
  std::string command;              // cast, normalize, generic, array-of, non-generic, signature, property
  std::vector<std::string> args;    // command operands
  bool show_help = false;           // -h, --help
  bool strict = false;              // --strict
  bool metrics = false;             // --metrics
  enum class MetricsFormat { Text, Json };
  MetricsFormat metrics_format = MetricsFormat::Text; // --metrics[=json|text]
};

/***
 * Name: tycast::driver::CommandArity
 * Purpose: Number of operands a command takes; -1 if the command is unknown.
 */
int CommandArity(const std::string& command);

/***
 * Name: tycast::driver::ParseCli
 * Purpose: Parse command-line arguments into a CliOptions structure.
 * Inputs:
 *   - argc: Argument count
 *   - argv: Argument vector
 *   - dst: Output options structure to populate
 *   - err: Stream for diagnostics on parse errors
 * Outputs:
 *   - bool: true on successful parse, false if an error occurs
 * Theory of Operation: Options may appear anywhere before "--"; the first
 *   positional is the command and the rest are its operands, whose count must
 *   match CommandArity.
 */
bool ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err);

/***
 * Name: tycast::driver::PrintUsage
 * Purpose: Print CLI usage information for tycast.
 */
void PrintUsage(std::ostream& out, const char* argv0);

}  // namespace driver
}  // namespace tycast
