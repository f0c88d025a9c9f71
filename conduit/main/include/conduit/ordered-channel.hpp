#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

#include "conduit/completion.hpp"
#include "conduit/net-channel.hpp"
#include "conduit/outbound-message.hpp"

namespace conduit {

// Thread safe facade over a NetChannel.
//
// Every operation may be called from any thread: it runs inline when already on the channel's event loop and
// nothing is queued before it, and is otherwise scheduled there. Operations reach the underlying channel in the
// order they were called, even across threads, because each one is chained behind the submission of the
// previous one.
class OrderedChannel : public std::enable_shared_from_this<OrderedChannel> {
 public:
  // Receives the channel write's Completion and returns the Completion handed back to the caller of write().
  using PostProcess = std::function<Completion(Completion)>;

  static std::shared_ptr<OrderedChannel> Create(std::shared_ptr<NetChannel> channel);

  OrderedChannel(const OrderedChannel&) = delete;
  OrderedChannel(OrderedChannel&&) = delete;
  OrderedChannel& operator=(const OrderedChannel&) = delete;
  OrderedChannel& operator=(OrderedChannel&&) = delete;

  ~OrderedChannel() = default;

  // Appends a write (followed by a flush if 'flush') to the channel.
  // The returned Completion settles as the one returned by 'postProcess' applied to the channel write's
  // Completion (the write's own Completion when 'postProcess' is empty). It fails if the write could not even be
  // submitted. Never throws on transport failures.
  // The returned Completion tracks the write itself, not its submission: submission is reported to 'postProcess',
  // which runs on the event loop right after the message was handed to the channel, and submitted() read right
  // after this call settles once this write (and everything called before it) was submitted.
  Completion write(bool flush, OutboundMessage message, PostProcess postProcess = {});

  // Flushes everything written so far.
  void flush();

  // Requests one more inbound read cycle.
  void read();

  // Closes the channel once every previously called operation was submitted.
  void close();

  // Completed once every operation called so far was submitted to the underlying channel.
  [[nodiscard]] Completion submitted() const;

  [[nodiscard]] uint64_t id() const noexcept { return _id; }

  // Forwards to NetChannel::isWritable(), hence must be called on the event loop thread.
  [[nodiscard]] bool isWritable() const noexcept { return _channel->isWritable(); }

  [[nodiscard]] Completion closeFuture() const { return _channel->closeFuture(); }

  [[nodiscard]] NetChannel& channel() noexcept { return *_channel; }

 private:
  explicit OrderedChannel(std::shared_ptr<NetChannel> channel);

  // Runs 'op' on the event loop once every previously enqueued operation ran.
  void enqueue(std::function<void(NetChannel&)> op);

  std::shared_ptr<NetChannel> _channel;
  uint64_t _id;
  mutable std::mutex _mutex;
  Completion _tail;
};

}  // namespace conduit
