#pragma once

#include <cstdint>

namespace conduit {

// Producer side handle of a body stream subscription (request(n) credit protocol).
// Implementations must tolerate request() and cancel() calls from any thread, including after cancellation.
class Subscription {
 public:
  virtual ~Subscription() = default;

  // Grants 'n' more chunks to the producer.
  virtual void request(int64_t n) = 0;

  // Asks the producer to stop emitting. Chunks already in flight may still arrive.
  virtual void cancel() = 0;
};

}  // namespace conduit
