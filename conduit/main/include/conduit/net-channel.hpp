#pragma once

#include <cstdint>
#include <utility>

#include "conduit/completion.hpp"
#include "conduit/event-loop.hpp"
#include "conduit/outbound-message.hpp"

namespace conduit {

// Bidirectional byte channel bound to a single EventLoop.
//
// All methods but id(), eventLoop() and closeFuture() must be called from the event loop thread.
// Written messages are queued and only go to the wire on flush(), in write order.
// The Completion returned by write() settles once the message is fully handed to the transport, or failed
// (TransportError, ChannelClosedError). The message body is released in both cases.
class NetChannel {
 public:
  virtual ~NetChannel() = default;

  virtual Completion write(OutboundMessage message) = 0;

  Completion writeAndFlush(OutboundMessage message) {
    Completion written = write(std::move(message));
    flush();
    return written;
  }

  virtual void flush() = 0;

  // Arms one inbound read cycle: the next available bytes are delivered to the channel's inbound handler.
  virtual void read() = 0;

  // Closes the channel, failing pending writes. Idempotent.
  virtual void close() = 0;

  [[nodiscard]] virtual bool isOpen() const noexcept = 0;

  // Tells whether the channel can take more data without growing its backlog: false once closed, or when enough
  // bytes wait for the kernel. Callers then wait for their last write to complete before producing more.
  [[nodiscard]] virtual bool isWritable() const noexcept = 0;

  [[nodiscard]] virtual uint64_t id() const noexcept = 0;

  [[nodiscard]] virtual EventLoop& eventLoop() noexcept = 0;

  // Completed once the channel is closed.
  [[nodiscard]] virtual Completion closeFuture() const = 0;
};

}  // namespace conduit
