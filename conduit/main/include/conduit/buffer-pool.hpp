#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

#include "conduit/data-chunk.hpp"
#include "conduit/ref-counted-buffer.hpp"

namespace conduit {

namespace internal {
class BufferPoolState;
}

// Fixed capacity buffer handed out by a BufferPool.
// Returns to its pool's free list (or is freed) when its last reference is released.
class PooledBuffer final : public RefCountedBuffer {
 public:
  PooledBuffer(const PooledBuffer&) = delete;
  PooledBuffer(PooledBuffer&&) = delete;
  PooledBuffer& operator=(const PooledBuffer&) = delete;
  PooledBuffer& operator=(PooledBuffer&&) = delete;

  ~PooledBuffer() override = default;

  [[nodiscard]] std::string_view view() const noexcept override { return {_storage.get(), _size}; }

  void retain() noexcept override { _refCount.fetch_add(1, std::memory_order_relaxed); }

  bool release() noexcept override;

  [[nodiscard]] uint32_t refCount() const noexcept override { return _refCount.load(std::memory_order_relaxed); }

  // Writable storage, of capacity() bytes.
  [[nodiscard]] char* data() noexcept { return _storage.get(); }

  [[nodiscard]] std::size_t capacity() const noexcept { return _capacity; }

  // Sets the number of meaningful bytes. Clamped to capacity().
  void setSize(std::size_t size) noexcept { _size = size < _capacity ? size : _capacity; }

  [[nodiscard]] std::size_t size() const noexcept { return _size; }

 private:
  friend class internal::BufferPoolState;

  PooledBuffer(std::shared_ptr<internal::BufferPoolState> pool, std::size_t capacity);

  std::shared_ptr<internal::BufferPoolState> _pool;
  std::unique_ptr<char[]> _storage;
  std::size_t _capacity;
  std::size_t _size{0};
  std::atomic<uint32_t> _refCount{0};
};

// Thread safe pool of fixed size, reference counted buffers.
// Up to maxCached released buffers are kept for reuse, extra ones are freed.
// Buffers may outlive the pool: they are then freed on their last release.
class BufferPool {
 public:
  static constexpr std::size_t kDefaultSlotSize = 16UL * 1024UL;
  static constexpr std::size_t kDefaultMaxCached = 64;

  explicit BufferPool(std::size_t slotSize = kDefaultSlotSize, std::size_t maxCached = kDefaultMaxCached);

  BufferPool(const BufferPool&) = delete;
  BufferPool(BufferPool&&) noexcept = default;
  BufferPool& operator=(const BufferPool&) = delete;
  BufferPool& operator=(BufferPool&&) noexcept = default;

  ~BufferPool();

  // Returns a buffer holding one reference, with size 0.
  [[nodiscard]] PooledBuffer* acquire();

  // Copies 'data' into as many pooled buffers as needed and wraps them in a DataChunk.
  [[nodiscard]] DataChunk chunk(std::string_view data, bool flush = false);

  [[nodiscard]] std::size_t slotSize() const noexcept;

  // Number of buffers currently handed out and not yet fully released.
  [[nodiscard]] std::size_t outstanding() const noexcept;

  // Number of released buffers kept for reuse.
  [[nodiscard]] std::size_t cached() const;

 private:
  std::shared_ptr<internal::BufferPoolState> _state;
};

}  // namespace conduit
