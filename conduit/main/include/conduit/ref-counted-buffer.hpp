#pragma once

#include <cstdint>
#include <string_view>

namespace conduit {

// Reference counted, read-only byte region.
// The storage is reclaimed (returned to its pool or freed) when the last reference is released.
class RefCountedBuffer {
 public:
  virtual ~RefCountedBuffer() = default;

  [[nodiscard]] virtual std::string_view view() const noexcept = 0;

  // Adds one reference.
  virtual void retain() noexcept = 0;

  // Drops one reference. Returns true if this was the last one, in which case the buffer must not be used anymore.
  virtual bool release() noexcept = 0;

  [[nodiscard]] virtual uint32_t refCount() const noexcept = 0;
};

}  // namespace conduit
