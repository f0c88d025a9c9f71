#pragma once

#include <atomic>
#include <cstdint>

namespace conduit {

// Counters of the responses served on one connection.
struct PipelineStats {
  uint64_t nbResponsesStarted{0};
  uint64_t nbResponsesCompleted{0};
  uint64_t nbResponsesFailed{0};
  // Responses sent with a computed Content-Length instead of chunked encoding.
  uint64_t nbLengthOptimized{0};
  uint64_t nbChunked{0};
  // Response bytes (heads, framed body chunks and terminal frames) handed to the channel.
  uint64_t nbBytesQueued{0};

  bool operator==(const PipelineStats&) const noexcept = default;
};

namespace internal {

class PipelineCounters {
 public:
  std::atomic<uint64_t> nbResponsesStarted{0};
  std::atomic<uint64_t> nbResponsesCompleted{0};
  std::atomic<uint64_t> nbResponsesFailed{0};
  std::atomic<uint64_t> nbLengthOptimized{0};
  std::atomic<uint64_t> nbChunked{0};
  std::atomic<uint64_t> nbBytesQueued{0};

  [[nodiscard]] PipelineStats snapshot() const noexcept {
    return {nbResponsesStarted.load(std::memory_order_relaxed),  nbResponsesCompleted.load(std::memory_order_relaxed),
            nbResponsesFailed.load(std::memory_order_relaxed),   nbLengthOptimized.load(std::memory_order_relaxed),
            nbChunked.load(std::memory_order_relaxed),           nbBytesQueued.load(std::memory_order_relaxed)};
  }
};

}  // namespace internal

}  // namespace conduit
