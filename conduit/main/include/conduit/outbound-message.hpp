#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "conduit/data-chunk.hpp"

namespace conduit {

// Bytes of one channel write: an owned head, an optional body chunk and a static tail.
// A chunked body part is for instance: head "5\r\n", body "hello", tail "\r\n".
class OutboundMessage {
 public:
  OutboundMessage() noexcept = default;

  explicit OutboundMessage(std::string head) noexcept : _head(std::move(head)) {}

  OutboundMessage(std::string head, std::shared_ptr<DataChunk> body, std::string_view tail = {}) noexcept
      : _head(std::move(head)), _body(std::move(body)), _tail(tail) {}

  // Total number of bytes. Zero once the body was released.
  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] bool empty() const { return size() == 0; }

  // Non empty byte segments in emission order.
  [[nodiscard]] std::vector<std::string_view> segments() const;

  // Concatenation of all segments.
  [[nodiscard]] std::string toString() const;

  [[nodiscard]] const std::shared_ptr<DataChunk>& body() const noexcept { return _body; }

  // Releases the body chunk, if any. Idempotent.
  void releaseBody() noexcept;

 private:
  std::string _head;
  std::shared_ptr<DataChunk> _body;
  std::string_view _tail;
};

}  // namespace conduit
