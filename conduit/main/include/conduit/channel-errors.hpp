#pragma once

#include <stdexcept>
#include <string>

namespace conduit {

// Failure reported by the byte transport under a channel (peer reset, broken pipe...).
class TransportError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// A write could not be performed because its channel is closed.
class ChannelClosedError : public std::runtime_error {
 public:
  ChannelClosedError() : std::runtime_error("Channel is closed") {}

  using std::runtime_error::runtime_error;
};

}  // namespace conduit
