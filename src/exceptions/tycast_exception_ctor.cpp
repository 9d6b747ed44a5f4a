/***
 * Name: tycast::exceptions::TycastException::TycastException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "tycast/exceptions/tycast_exception.h"

#include <utility>

namespace tycast {
namespace exceptions {

TycastException::TycastException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace tycast
