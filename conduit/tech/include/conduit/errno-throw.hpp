#pragma once

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <string_view>
#include <system_error>

namespace conduit {

// Capture errno immediately and throw std::system_error with a formatted message.
// Usage: throw_errno("epoll_ctl ADD failed for fd # {}", fd);
template <typename... Args>
[[noreturn]] void throw_errno(std::string_view fmt, Args&&... args) {
  const int savedErr = errno;
  std::error_code ec(savedErr, std::generic_category());
  throw std::system_error(ec, fmt::vformat(fmt, fmt::make_format_args(args...)));
}

}  // namespace conduit
