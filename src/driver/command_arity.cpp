/***
 * Name: tycast::driver::CommandArity
 * Purpose: Operand count per known command.
 */
#include "tycast/driver/cli.h"

namespace tycast::driver {

auto CommandArity(const std::string& command) -> int {
  if (command == "cast" || command == "property") { return 2; }
  if (command == "normalize" || command == "generic" || command == "array-of" || command == "non-generic" ||
      command == "signature") {
    return 1;
  }
  return -1;
}

}  // namespace tycast::driver
