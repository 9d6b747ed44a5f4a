/***
 * Name: tycast::exceptions::TycastException
 * Purpose: Base class for all tycast exceptions; do not throw built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in tycast must use a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace tycast {
namespace exceptions {

class TycastException : public std::exception {
 public:
  virtual ~TycastException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit TycastException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace tycast
