#pragma once

#include <utility>

#include "conduit/base-fd.hpp"

namespace conduit {

// Set a file descriptor to non-blocking mode.
// Returns true on success.
bool SetNonBlocking(int fd) noexcept;

// Retrieve the pending socket error (SO_ERROR).
// Returns the error code (0 means no error, >0 is errno).
int GetSocketError(int fd) noexcept;

// Create a connected pair of non-blocking, close-on-exec stream sockets.
// Throws std::system_error on failure.
std::pair<BaseFd, BaseFd> CreateSocketPair();

}  // namespace conduit
