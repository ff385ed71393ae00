#pragma once
/** @file  Errors.hpp
 *  @brief Exception types raised by action bodies.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>
#include <string>

namespace radflow::core {

  /// A configured item points at something that no longer exists or is disabled.
  class InvalidReferenceError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

} // namespace radflow::core
