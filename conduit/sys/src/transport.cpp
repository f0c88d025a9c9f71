#include "conduit/transport.hpp"

#include <sys/socket.h>
#include <sys/uio.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstddef>
#include <string_view>

namespace conduit {

static_assert(EAGAIN == EWOULDBLOCK, "Add handling for EWOULDBLOCK if different from EAGAIN");

namespace {

// write(2) on a socket whose peer is gone raises SIGPIPE: sockets go through send(2) / sendmsg(2) with
// MSG_NOSIGNAL, other fds (pipes) fall back to write(2) / writev(2).
ssize_t WriteNoSignal(int fd, const char* data, std::size_t len) {
  const auto nbWritten = ::send(fd, data, len, MSG_NOSIGNAL);
  if (nbWritten == -1 && errno == ENOTSOCK) {
    return ::write(fd, data, len);
  }
  return nbWritten;
}

ssize_t WritevNoSignal(int fd, iovec* iov, int iovCount) {
  msghdr msg{};
  msg.msg_iov = iov;
  msg.msg_iovlen = static_cast<std::size_t>(iovCount);
  const auto nbWritten = ::sendmsg(fd, &msg, MSG_NOSIGNAL);
  if (nbWritten == -1 && errno == ENOTSOCK) {
    return ::writev(fd, iov, iovCount);
  }
  return nbWritten;
}

TransportHint HintForWriteError(int err) {
  return err == EAGAIN ? TransportHint::WriteReady : TransportHint::Error;
}

}  // namespace

ITransport::TransportResult PlainTransport::read(char* buf, std::size_t len) {
  while (true) {
    const auto nbRead = ::read(_fd, buf, len);
    if (nbRead != -1) [[likely]] {
      return {static_cast<std::size_t>(nbRead), TransportHint::None};
    }
    if (errno == EINTR) {
      continue;
    }
    return {0, errno == EAGAIN ? TransportHint::ReadReady : TransportHint::Error};
  }
}

ITransport::TransportResult PlainTransport::write(std::string_view data) {
  TransportResult ret{0, TransportHint::None};

  while (ret.bytesProcessed < data.size()) {
    const auto nbWritten = WriteNoSignal(_fd, data.data() + ret.bytesProcessed, data.size() - ret.bytesProcessed);
    if (nbWritten == -1) [[unlikely]] {
      if (errno == EINTR) {
        continue;
      }
      ret.want = HintForWriteError(errno);
      break;
    }
    ret.bytesProcessed += static_cast<std::size_t>(nbWritten);
  }

  return ret;
}

ITransport::TransportResult PlainTransport::write(std::string_view firstBuf, std::string_view secondBuf) {
  if (firstBuf.empty() || secondBuf.empty()) {
    return write(firstBuf.empty() ? secondBuf : firstBuf);
  }

  std::array<iovec, 2> iov;
  TransportResult ret{0, TransportHint::None};
  const std::size_t totalSize = firstBuf.size() + secondBuf.size();

  while (ret.bytesProcessed < totalSize) {
    int iovIdx = 0;
    std::size_t offset = ret.bytesProcessed;
    if (offset >= firstBuf.size()) {
      iovIdx = 1;
      offset -= firstBuf.size();
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
      iov[1] = {const_cast<char*>(secondBuf.data()) + offset, secondBuf.size() - offset};
    } else {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
      iov[0] = {const_cast<char*>(firstBuf.data()) + offset, firstBuf.size() - offset};
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
      iov[1] = {const_cast<char*>(secondBuf.data()), secondBuf.size()};
    }

    const auto nbWritten = WritevNoSignal(_fd, iov.data() + iovIdx, static_cast<int>(iov.size()) - iovIdx);
    if (nbWritten == -1) [[unlikely]] {
      if (errno == EINTR) {
        continue;
      }
      ret.want = HintForWriteError(errno);
      break;
    }
    ret.bytesProcessed += static_cast<std::size_t>(nbWritten);
  }

  return ret;
}

}  // namespace conduit
