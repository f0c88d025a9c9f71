#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace conduit {

// Indicates what the transport layer needs to proceed after a non-blocking I/O operation.
enum class TransportHint : uint8_t {
  None,        // Operation completed (or orderly close for reads)
  ReadReady,   // Need socket readable before operation can proceed
  WriteReady,  // Need socket writable before operation can proceed
  Error        // Fatal error, errno is preserved
};

// Byte-level transport abstraction under a SocketChannel.
class ITransport {
 public:
  struct TransportResult {
    std::size_t bytesProcessed;
    TransportHint want;
  };

  virtual ~ITransport() = default;

  // Non-blocking read. bytesProcessed == 0 with want == None means orderly close by the peer.
  virtual TransportResult read(char* buf, std::size_t len) = 0;

  // Non-blocking write of as much of data as possible.
  virtual TransportResult write(std::string_view data) = 0;

  // Non-blocking scatter write of both buffers, in order.
  virtual TransportResult write(std::string_view firstBuf, std::string_view secondBuf) = 0;
};

// Plain transport directly operating on a non-blocking fd.
class PlainTransport : public ITransport {
 public:
  explicit PlainTransport(int fd) noexcept : _fd(fd) {}

  TransportResult read(char* buf, std::size_t len) override;

  TransportResult write(std::string_view data) override;

  TransportResult write(std::string_view firstBuf, std::string_view secondBuf) override;

 private:
  int _fd;
};

}  // namespace conduit
