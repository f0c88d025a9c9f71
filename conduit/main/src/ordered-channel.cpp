#include "conduit/ordered-channel.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "conduit/completion.hpp"
#include "conduit/log.hpp"
#include "conduit/net-channel.hpp"
#include "conduit/outbound-message.hpp"

namespace conduit {

std::shared_ptr<OrderedChannel> OrderedChannel::Create(std::shared_ptr<NetChannel> channel) {
  if (!channel) {
    throw std::invalid_argument("OrderedChannel requires a channel");
  }
  return std::shared_ptr<OrderedChannel>(new OrderedChannel(std::move(channel)));
}

OrderedChannel::OrderedChannel(std::shared_ptr<NetChannel> channel)
    : _channel(std::move(channel)), _id(_channel->id()), _tail(Completion::Completed()) {}

void OrderedChannel::enqueue(std::function<void(NetChannel&)> op) {
  Completion submitted;
  Completion previous;
  {
    std::lock_guard lock(_mutex);
    previous = std::exchange(_tail, submitted);
  }
  previous.whenDone([channel = _channel, op = std::move(op), submitted](std::exception_ptr) {
    channel->eventLoop().execute([channel, op, submitted] {
      try {
        op(*channel);
      } catch (const std::exception& ex) {
        log::error("Channel # {} operation failed: {}", channel->id(), ex.what());
      }
      // Later operations must not be stalled by a failed one.
      submitted.complete();
    });
  });
}

Completion OrderedChannel::write(bool flush, OutboundMessage message, PostProcess postProcess) {
  Completion result;
  // Shared so that copies of the operation do not copy the message bytes.
  auto pendingMessage = std::make_shared<OutboundMessage>(std::move(message));
  enqueue([flush, pendingMessage, postProcess = std::move(postProcess), result](NetChannel& channel) {
    try {
      Completion written =
          flush ? channel.writeAndFlush(std::move(*pendingMessage)) : channel.write(std::move(*pendingMessage));
      Completion processed = postProcess ? postProcess(std::move(written)) : std::move(written);
      processed.forwardTo(result);
    } catch (const std::exception& ex) {
      log::error("Channel # {} write submission failed: {}", channel.id(), ex.what());
      pendingMessage->releaseBody();
      result.fail(std::current_exception());
    }
  });
  return result;
}

void OrderedChannel::flush() {
  enqueue([](NetChannel& channel) { channel.flush(); });
}

void OrderedChannel::read() {
  enqueue([](NetChannel& channel) { channel.read(); });
}

void OrderedChannel::close() {
  enqueue([](NetChannel& channel) { channel.close(); });
}

Completion OrderedChannel::submitted() const {
  std::lock_guard lock(_mutex);
  return _tail;
}

}  // namespace conduit
