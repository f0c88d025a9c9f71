#include "conduit/data-chunk.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "conduit/log.hpp"
#include "conduit/ref-counted-buffer.hpp"

namespace conduit {

namespace {

std::atomic<uint64_t> gNextChunkId{1};

// Buffer owning its bytes on the heap, freed with its last reference.
class HeapBuffer final : public RefCountedBuffer {
 public:
  explicit HeapBuffer(std::string data) noexcept : _data(std::move(data)) {}

  [[nodiscard]] std::string_view view() const noexcept override { return _data; }

  void retain() noexcept override { _refCount.fetch_add(1, std::memory_order_relaxed); }

  bool release() noexcept override {
    if (_refCount.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      delete this;
      return true;
    }
    return false;
  }

  [[nodiscard]] uint32_t refCount() const noexcept override { return _refCount.load(std::memory_order_relaxed); }

 private:
  std::string _data;
  std::atomic<uint32_t> _refCount{1};
};

}  // namespace

DataChunk::DataChunk(std::vector<RefCountedBuffer*> buffers, bool flush)
    : _id(gNextChunkId.fetch_add(1, std::memory_order_relaxed)), _buffers(std::move(buffers)), _flush(flush) {
  _views.reserve(_buffers.size());
  for (RefCountedBuffer* buffer : _buffers) {
    if (buffer == nullptr) {
      releaseBuffers();
      throw std::invalid_argument("DataChunk buffer cannot be null");
    }
    _views.push_back(buffer->view());
    _remaining += _views.back().size();
  }
}

DataChunk DataChunk::Copy(std::string_view data, bool flush) { return Of(std::string(data), flush); }

DataChunk DataChunk::Of(std::string data, bool flush) {
  if (data.empty()) {
    return DataChunk({}, flush);
  }
  return DataChunk({new HeapBuffer(std::move(data))}, flush);
}

DataChunk DataChunk::FlushMarker() { return DataChunk({}, true); }

DataChunk::DataChunk(DataChunk&& other) noexcept
    : _id(other._id),
      _buffers(std::move(other._buffers)),
      _views(std::move(other._views)),
      _remaining(std::exchange(other._remaining, 0)),
      _released(other._released.exchange(true, std::memory_order_acq_rel)),
      _flush(other._flush) {
  other._buffers.clear();
  other._views.clear();
}

DataChunk& DataChunk::operator=(DataChunk&& other) noexcept {
  if (this != &other) [[likely]] {
    release();
    _id = other._id;
    _buffers = std::move(other._buffers);
    _views = std::move(other._views);
    _remaining = std::exchange(other._remaining, 0);
    _released.store(other._released.exchange(true, std::memory_order_acq_rel), std::memory_order_release);
    _flush = other._flush;
    other._buffers.clear();
    other._views.clear();
  }
  return *this;
}

DataChunk::~DataChunk() {
  if (!_released.load(std::memory_order_acquire)) [[unlikely]] {
    internal::ChunkLeakDetector::Instance().report(_id, _remaining);
    release();
  }
}

std::span<const std::string_view> DataChunk::data() const {
  if (isReleased()) {
    throw std::logic_error("DataChunk data accessed after release");
  }
  return _views;
}

std::size_t DataChunk::remaining() const {
  if (isReleased()) {
    throw std::logic_error("DataChunk data accessed after release");
  }
  return _remaining;
}

void DataChunk::release() noexcept {
  bool expected = false;
  if (_released.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    releaseBuffers();
  }
}

void DataChunk::releaseBuffers() noexcept {
  for (RefCountedBuffer* buffer : _buffers) {
    if (buffer != nullptr) {
      buffer->release();
    }
  }
  _buffers.clear();
}

std::string DataChunk::toString() const {
  std::string out;
  out.reserve(remaining());
  for (std::string_view view : data()) {
    out.append(view);
  }
  return out;
}

namespace internal {

ChunkLeakDetector& ChunkLeakDetector::Instance() {
  static ChunkLeakDetector gDetector;
  return gDetector;
}

void ChunkLeakDetector::report(uint64_t chunkId, std::size_t nbBytes) noexcept {
  _nbLeaks.fetch_add(1, std::memory_order_relaxed);
  if (!_warned.exchange(true, std::memory_order_relaxed)) {
    log::warn("DataChunk # {} ({} bytes) was not released before destruction. It is released now, "
              "further leaks will not be reported",
              chunkId, nbBytes);
  }
}

}  // namespace internal

}  // namespace conduit
