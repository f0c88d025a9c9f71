#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "conduit/ref-counted-buffer.hpp"

namespace conduit {

// Unit of response body data handed by a producer to a response session.
//
// A DataChunk owns one reference on each of its buffers. The owner must release it exactly once, once the bytes
// have been written; release() is atomic and idempotent so that concurrent callers race safely.
// A chunk destroyed without having been released is a leak: a warning is logged (once per process) and its
// buffers are force-released.
//
// A chunk with the flush flag and no data is a flush marker: it asks the session to flush what was written so far.
class DataChunk {
 public:
  // Creates a chunk taking over one reference on each given buffer.
  explicit DataChunk(std::vector<RefCountedBuffer*> buffers, bool flush = false);

  // Creates a chunk owning a heap copy of 'data'.
  [[nodiscard]] static DataChunk Copy(std::string_view data, bool flush = false);

  // Creates a chunk owning 'data'.
  [[nodiscard]] static DataChunk Of(std::string data, bool flush = false);

  [[nodiscard]] static DataChunk FlushMarker();

  DataChunk(const DataChunk&) = delete;
  DataChunk& operator=(const DataChunk&) = delete;

  // The moved-from chunk is left released.
  DataChunk(DataChunk&& other) noexcept;
  DataChunk& operator=(DataChunk&& other) noexcept;

  ~DataChunk();

  // Process-wide, strictly increasing identifier.
  [[nodiscard]] uint64_t id() const noexcept { return _id; }

  [[nodiscard]] bool flush() const noexcept { return _flush; }

  [[nodiscard]] bool isFlushMarker() const noexcept { return _flush && _remaining == 0; }

  // Views over the chunk's bytes, in order.
  // Throws std::logic_error if the chunk was released.
  [[nodiscard]] std::span<const std::string_view> data() const;

  // Total number of bytes. Throws std::logic_error if the chunk was released.
  [[nodiscard]] std::size_t remaining() const;

  [[nodiscard]] bool isReleased() const noexcept { return _released.load(std::memory_order_acquire); }

  // Returns the buffers' references. Only the first call has an effect. Thread safe.
  void release() noexcept;

  // Concatenated copy of the bytes, mostly useful for diagnostics and tests.
  [[nodiscard]] std::string toString() const;

 private:
  void releaseBuffers() noexcept;

  uint64_t _id;
  std::vector<RefCountedBuffer*> _buffers;
  std::vector<std::string_view> _views;
  std::size_t _remaining{0};
  std::atomic<bool> _released{false};
  bool _flush;
};

namespace internal {

// Process-wide record of chunks destroyed without having been released.
class ChunkLeakDetector {
 public:
  static ChunkLeakDetector& Instance();

  // Logs a warning on the first leak only, counts all of them.
  void report(uint64_t chunkId, std::size_t nbBytes) noexcept;

  [[nodiscard]] uint64_t nbLeaks() const noexcept { return _nbLeaks.load(std::memory_order_relaxed); }

 private:
  ChunkLeakDetector() noexcept = default;

  std::atomic<uint64_t> _nbLeaks{0};
  std::atomic<bool> _warned{false};
};

}  // namespace internal

}  // namespace conduit
