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
 * Theory of Operation:
 *   Supports -h/--help, --strict, --metrics[=json|text] and "--" to end option
 *   parsing. Operand counts are validated here so RunCommand can index args directly.
 */
#include "tycast/driver/cli.h"

#include <ostream>
#include <string>

namespace tycast::driver {

auto ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err) -> bool {
  // Reset to defaults
  dst = CliOptions{};
  std::vector<std::string> positional;

  for (int arg_index = 1; arg_index < argc; ++arg_index) {
    const std::string arg = argv[arg_index] ? argv[arg_index] : "";
    if (arg == "-h" || arg == "--help") {
      dst.show_help = true;
      return true;
    } else if (arg == "--strict") {
      dst.strict = true;
    } else if (arg == "--metrics") {
      dst.metrics = true;
      dst.metrics_format = CliOptions::MetricsFormat::Text;
    } else if (arg.rfind("--metrics=", 0) == 0) {
      dst.metrics = true;
      const std::string val = arg.substr(std::string("--metrics=").size());
      if (val == "json") {
        dst.metrics_format = CliOptions::MetricsFormat::Json;
      } else if (val == "text") {
        dst.metrics_format = CliOptions::MetricsFormat::Text;
      } else {
        err << "tycast: error: unknown metrics format '" << val << "' (expected json or text)" << '\n';
        return false;
      }
    } else if (arg == "--") {
      for (++arg_index; arg_index < argc; ++arg_index) {
        positional.emplace_back(argv[arg_index] ? argv[arg_index] : "");
      }
      break;
    } else if (arg.size() > 1 && arg[0] == '-') {
      err << "tycast: error: unknown option '" << arg << "'" << '\n';
      return false;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.empty()) {
    err << "tycast: error: no command given" << '\n';
    return false;
  }
  dst.command = positional.front();
  dst.args.assign(positional.begin() + 1, positional.end());

  const int arity = CommandArity(dst.command);
  if (arity < 0) {
    err << "tycast: error: unknown command '" << dst.command << "'" << '\n';
    return false;
  }
  if (static_cast<int>(dst.args.size()) != arity) {
    err << "tycast: error: '" << dst.command << "' expects " << arity << " argument(s), got " << dst.args.size()
        << '\n';
    return false;
  }
  return true;
}

}  // namespace tycast::driver
