/***
 * Name: tycast::exceptions::TycastException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "tycast/exceptions/tycast_exception.h"

namespace tycast::exceptions {

const char* TycastException::what() const noexcept { return message_.c_str(); }

}  // namespace tycast::exceptions
