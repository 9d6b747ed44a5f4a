/***
 * Name: tycast::exceptions::TypeParseError
 * Purpose: Exception for rejected type strings when the caller asks for strict parsing.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from TycastException.
 */
#pragma once

#include <string>
#include <utility>

#include "tycast/exceptions/tycast_exception.h"

namespace tycast {
namespace exceptions {

class TypeParseError : public TycastException {
 public:
  explicit TypeParseError(std::string msg) noexcept : TycastException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace tycast
