/***
 * Name: tycast::driver::PrintUsage
 * Purpose: Print CLI usage information for tycast.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 */
#include "tycast/driver/cli.h"

#include <ostream>

namespace tycast::driver {

auto PrintUsage(std::ostream& out, const char* argv0) -> void {
  const char* prog = (argv0 != nullptr && *argv0 != '\0') ? argv0 : "tycast";
  out << "Usage: " << prog << " [options] <command> <args...>\n"
      << "Commands:\n"
      << "  cast <source> <target>     Check whether <source> may be used where <target> is expected\n"
      << "  normalize <union>          Print the canonical (sorted) form of a union type\n"
      << "  generic <union>            Print the element types of the array members\n"
      << "  array-of <union>           Print the array-of-each-member union\n"
      << "  non-generic <union>        Print the union without its array members\n"
      << "  signature <function>       Print a builtin function's return and parameter types\n"
      << "  property <class> <name>    Print a builtin class property's type\n"
      << "Options:\n"
      << "  -h, --help                 Show this help\n"
      << "  --strict                   Treat unparsable type names as errors\n"
      << "  --metrics[=text|json]      Print metrics to stderr after the command\n"
      << "  --                         End of options\n";
}

}  // namespace tycast::driver
