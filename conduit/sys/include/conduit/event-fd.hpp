#pragma once

#include "conduit/base-fd.hpp"

namespace conduit {

// Non-blocking, close-on-exec eventfd used to wake up an EventLoop blocked in poll.
class EventFd {
 public:
  EventFd();

  // Send a wakeup event.
  void send() const noexcept;

  // Drain pending wakeup events.
  void read() const noexcept;

  [[nodiscard]] int fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace conduit
