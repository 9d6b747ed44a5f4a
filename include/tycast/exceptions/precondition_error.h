/***
 * Name: tycast::exceptions::PreconditionError
 * Purpose: Exception for caller contract violations (e.g. a builtin registry
 *   lookup on a key the caller never checked with the matching exists query).
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from TycastException. Signals a bug in
 *   the caller; it is never used to report "no such builtin".
 */
#pragma once

#include <string>
#include <utility>

#include "tycast/exceptions/tycast_exception.h"

namespace tycast {
namespace exceptions {

class PreconditionError : public TycastException {
 public:
  explicit PreconditionError(std::string msg) noexcept : TycastException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace tycast
