#include "conduit/outbound-message.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace conduit {

std::size_t OutboundMessage::size() const {
  std::size_t size = _head.size() + _tail.size();
  if (_body && !_body->isReleased()) {
    size += _body->remaining();
  }
  return size;
}

std::vector<std::string_view> OutboundMessage::segments() const {
  std::vector<std::string_view> segments;
  if (!_head.empty()) {
    segments.emplace_back(_head);
  }
  if (_body && !_body->isReleased()) {
    for (std::string_view view : _body->data()) {
      if (!view.empty()) {
        segments.push_back(view);
      }
    }
  }
  if (!_tail.empty()) {
    segments.push_back(_tail);
  }
  return segments;
}

std::string OutboundMessage::toString() const {
  std::string out;
  out.reserve(size());
  for (std::string_view segment : segments()) {
    out.append(segment);
  }
  return out;
}

void OutboundMessage::releaseBody() noexcept {
  if (_body) {
    _body->release();
  }
}

}  // namespace conduit
