#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "conduit/base-fd.hpp"
#include "conduit/completion.hpp"
#include "conduit/event-loop.hpp"
#include "conduit/event.hpp"
#include "conduit/net-channel.hpp"
#include "conduit/outbound-message.hpp"
#include "conduit/pipeline-config.hpp"
#include "conduit/transport.hpp"

namespace conduit {

// NetChannel over a non-blocking stream socket registered in an EventLoop.
//
// Flushed messages are written in order; when the kernel buffer is full the channel waits for writability.
// Once PipelineConfig::flushThresholdBytes are queued, write() flushes by itself.
// Bytes queued beyond PipelineConfig::maxOutboundBufferBytes make further writes fail immediately.
// Inbound reading is not automatic: each read() call delivers at most one batch of bytes to the inbound handler.
// Peer close, socket errors and transport failures close the channel and fail all pending writes.
class SocketChannel final : public NetChannel, public std::enable_shared_from_this<SocketChannel> {
 public:
  using InboundHandler = std::function<void(std::string_view)>;

  // Takes ownership of 'fd' and registers it in 'loop'.
  // Must be called from the loop thread, or while the loop is not running.
  static std::shared_ptr<SocketChannel> Create(EventLoop& loop, BaseFd fd, const PipelineConfig& config,
                                               InboundHandler onInbound = {});

  static std::shared_ptr<SocketChannel> Create(EventLoop& loop, BaseFd fd, std::unique_ptr<ITransport> transport,
                                               const PipelineConfig& config, InboundHandler onInbound = {});

  SocketChannel(const SocketChannel&) = delete;
  SocketChannel(SocketChannel&&) = delete;
  SocketChannel& operator=(const SocketChannel&) = delete;
  SocketChannel& operator=(SocketChannel&&) = delete;

  ~SocketChannel() override;

  Completion write(OutboundMessage message) override;

  void flush() override;

  void read() override;

  void close() override;

  [[nodiscard]] bool isOpen() const noexcept override { return static_cast<bool>(_fd); }

  [[nodiscard]] bool isWritable() const noexcept override { return _fd && _queuedBytes < _flushThresholdBytes; }

  [[nodiscard]] uint64_t id() const noexcept override { return _id; }

  [[nodiscard]] EventLoop& eventLoop() noexcept override { return _loop; }

  [[nodiscard]] Completion closeFuture() const override { return _closeFuture; }

  [[nodiscard]] int fd() const noexcept { return _fd.fd(); }

  // Bytes written by the application but not yet handed to the kernel.
  [[nodiscard]] std::size_t queuedBytes() const noexcept { return _queuedBytes; }

  [[nodiscard]] std::size_t nbPendingWrites() const noexcept { return _queue.size(); }

  [[nodiscard]] uint64_t nbBytesWritten() const noexcept { return _nbBytesWritten; }

  [[nodiscard]] uint64_t nbBytesRead() const noexcept { return _nbBytesRead; }

  void setInboundHandler(InboundHandler onInbound) { _onInbound = std::move(onInbound); }

 private:
  struct PendingWrite {
    OutboundMessage message;
    Completion written;
    std::size_t nbWritten;
    std::size_t size;
  };

  SocketChannel(EventLoop& loop, BaseFd fd, std::unique_ptr<ITransport> transport, const PipelineConfig& config,
                InboundHandler onInbound);

  void onEvents(EventBmp eventBmp);

  void writeFlushed();

  void handleReadable();

  void updateInterest();

  void failAll(const std::exception_ptr& error);

  EventLoop& _loop;
  BaseFd _fd;
  std::unique_ptr<ITransport> _transport;
  InboundHandler _onInbound;
  uint64_t _id;
  std::size_t _maxOutboundBufferBytes;
  std::size_t _flushThresholdBytes;
  std::size_t _readChunkSize;
  std::deque<PendingWrite> _queue;
  std::size_t _nbFlushable{0};
  std::size_t _queuedBytes{0};
  uint64_t _nbBytesWritten{0};
  uint64_t _nbBytesRead{0};
  std::string _readBuffer;
  Completion _closeFuture;
  EventBmp _interest{0};
  bool _readPending{false};
  bool _waitingWritable{false};
};

}  // namespace conduit
