#include "conduit/event-fd.hpp"

#include <sys/eventfd.h>

#include <cerrno>
#include <cstring>

#include "conduit/errno-throw.hpp"
#include "conduit/log.hpp"

namespace conduit {

EventFd::EventFd() : _baseFd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new EventFd");
  }
  log::debug("EventFd fd # {} opened", fd());
}

void EventFd::send() const noexcept {
  if (::eventfd_write(fd(), 1) == -1) {
    const auto err = errno;
    if (err != EAGAIN) {
      log::error("EventFd fd # {} send failed errno={} msg={}", fd(), err, std::strerror(err));
    }
  }
}

void EventFd::read() const noexcept {
  eventfd_t counterValue;
  if (::eventfd_read(fd(), &counterValue) == -1) {
    const auto err = errno;
    if (err != EAGAIN) {
      log::error("EventFd fd # {} read failed errno={} msg={}", fd(), err, std::strerror(err));
    }
  }
}

}  // namespace conduit
