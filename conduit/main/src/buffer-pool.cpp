#include "conduit/buffer-pool.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include "conduit/data-chunk.hpp"
#include "conduit/log.hpp"
#include "conduit/ref-counted-buffer.hpp"

namespace conduit {

namespace internal {

class BufferPoolState : public std::enable_shared_from_this<BufferPoolState> {
 public:
  BufferPoolState(std::size_t slotSize, std::size_t maxCached) : _slotSize(slotSize), _maxCached(maxCached) {}

  PooledBuffer* acquire() {
    std::unique_ptr<PooledBuffer> buffer;
    {
      std::lock_guard lock(_mutex);
      if (!_free.empty()) {
        buffer = std::move(_free.back());
        _free.pop_back();
      }
    }
    if (!buffer) {
      buffer.reset(new PooledBuffer(shared_from_this(), _slotSize));
    }
    buffer->_size = 0;
    buffer->_refCount.store(1, std::memory_order_relaxed);
    _outstanding.fetch_add(1, std::memory_order_relaxed);
    return buffer.release();
  }

  // Called on the last release of 'buffer'. May destroy this state (through the buffer's back reference).
  void recycle(PooledBuffer* buffer) noexcept {
    _outstanding.fetch_sub(1, std::memory_order_relaxed);
    std::unique_ptr<PooledBuffer> owned(buffer);
    {
      std::lock_guard lock(_mutex);
      if (!_closed && _free.size() < _maxCached) {
        _free.push_back(std::move(owned));
        return;
      }
    }
    // 'owned' is destroyed outside of the lock, possibly dropping the last reference to this state.
  }

  // Drops cached buffers. Buffers released after this call are freed instead of cached.
  void close() noexcept {
    std::vector<std::unique_ptr<PooledBuffer>> toFree;
    {
      std::lock_guard lock(_mutex);
      _closed = true;
      toFree.swap(_free);
    }
    if (_outstanding.load(std::memory_order_relaxed) != 0) {
      log::debug("BufferPool closed with {} outstanding buffer(s)", _outstanding.load(std::memory_order_relaxed));
    }
  }

  [[nodiscard]] std::size_t slotSize() const noexcept { return _slotSize; }

  [[nodiscard]] std::size_t outstanding() const noexcept { return _outstanding.load(std::memory_order_relaxed); }

  [[nodiscard]] std::size_t cached() const {
    std::lock_guard lock(_mutex);
    return _free.size();
  }

 private:
  std::size_t _slotSize;
  std::size_t _maxCached;
  mutable std::mutex _mutex;
  std::vector<std::unique_ptr<PooledBuffer>> _free;
  std::atomic<std::size_t> _outstanding{0};
  bool _closed{false};
};

}  // namespace internal

PooledBuffer::PooledBuffer(std::shared_ptr<internal::BufferPoolState> pool, std::size_t capacity)
    : _pool(std::move(pool)), _storage(std::make_unique_for_overwrite<char[]>(capacity)), _capacity(capacity) {}

bool PooledBuffer::release() noexcept {
  if (_refCount.fetch_sub(1, std::memory_order_acq_rel) != 1) {
    return false;
  }
  // Keep the state alive for the duration of recycle(), which may free this buffer.
  std::shared_ptr<internal::BufferPoolState> pool = _pool;
  pool->recycle(this);
  return true;
}

BufferPool::BufferPool(std::size_t slotSize, std::size_t maxCached)
    : _state(std::make_shared<internal::BufferPoolState>(slotSize, maxCached)) {
  if (slotSize == 0) {
    throw std::invalid_argument("BufferPool slot size should be strictly positive");
  }
}

BufferPool::~BufferPool() {
  if (_state) {
    _state->close();
  }
}

PooledBuffer* BufferPool::acquire() { return _state->acquire(); }

DataChunk BufferPool::chunk(std::string_view data, bool flush) {
  std::vector<RefCountedBuffer*> buffers;
  buffers.reserve((data.size() + _state->slotSize() - 1U) / _state->slotSize());
  while (!data.empty()) {
    PooledBuffer* buffer = acquire();
    const std::size_t nbBytes = std::min(data.size(), buffer->capacity());
    std::memcpy(buffer->data(), data.data(), nbBytes);
    buffer->setSize(nbBytes);
    buffers.push_back(buffer);
    data.remove_prefix(nbBytes);
  }
  return DataChunk(std::move(buffers), flush);
}

std::size_t BufferPool::slotSize() const noexcept { return _state->slotSize(); }

std::size_t BufferPool::outstanding() const noexcept { return _state->outstanding(); }

std::size_t BufferPool::cached() const { return _state->cached(); }

}  // namespace conduit
