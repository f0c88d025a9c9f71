#pragma once

#include <exception>
#include <string>

namespace conduit {

// Message of the std::exception held by 'error', or an empty string if 'error' is null.
inline std::string ExceptionMessage(const std::exception_ptr& error) {
  if (error) {
    try {
      std::rethrow_exception(error);
    } catch (const std::exception& ex) {
      return ex.what();
    }
  }
  return {};
}

}  // namespace conduit
