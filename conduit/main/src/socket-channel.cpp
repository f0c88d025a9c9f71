#include "conduit/socket-channel.hpp"

#include <atomic>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <deque>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include "conduit/base-fd.hpp"
#include "conduit/channel-errors.hpp"
#include "conduit/completion.hpp"
#include "conduit/errno-throw.hpp"
#include "conduit/event.hpp"
#include "conduit/log.hpp"
#include "conduit/socket-ops.hpp"
#include "conduit/transport.hpp"

namespace conduit {

namespace {

std::atomic<uint64_t> gNextChannelId{1};

// Remaining byte ranges of 'segments' once the first 'offset' bytes are skipped.
std::vector<std::string_view> RemainingSegments(std::vector<std::string_view> segments, std::size_t offset) {
  auto it = segments.begin();
  while (it != segments.end() && offset >= it->size()) {
    offset -= it->size();
    ++it;
  }
  segments.erase(segments.begin(), it);
  if (!segments.empty()) {
    segments.front().remove_prefix(offset);
  }
  return segments;
}

}  // namespace

std::shared_ptr<SocketChannel> SocketChannel::Create(EventLoop& loop, BaseFd fd, const PipelineConfig& config,
                                                     InboundHandler onInbound) {
  auto transport = std::make_unique<PlainTransport>(fd.fd());
  return Create(loop, std::move(fd), std::move(transport), config, std::move(onInbound));
}

std::shared_ptr<SocketChannel> SocketChannel::Create(EventLoop& loop, BaseFd fd, std::unique_ptr<ITransport> transport,
                                                     const PipelineConfig& config, InboundHandler onInbound) {
  std::shared_ptr<SocketChannel> channel(
      new SocketChannel(loop, std::move(fd), std::move(transport), config, std::move(onInbound)));
  std::weak_ptr<SocketChannel> weakChannel = channel;
  loop.addOrThrow(channel->fd(), channel->_interest, [weakChannel](EventBmp eventBmp) {
    if (auto self = weakChannel.lock()) {
      self->onEvents(eventBmp);
    }
  });
  return channel;
}

SocketChannel::SocketChannel(EventLoop& loop, BaseFd fd, std::unique_ptr<ITransport> transport,
                             const PipelineConfig& config, InboundHandler onInbound)
    : _loop(loop),
      _fd(std::move(fd)),
      _transport(std::move(transport)),
      _onInbound(std::move(onInbound)),
      _id(gNextChannelId.fetch_add(1, std::memory_order_relaxed)),
      _maxOutboundBufferBytes(config.maxOutboundBufferBytes),
      _flushThresholdBytes(config.flushThresholdBytes),
      _readChunkSize(config.readChunkSize) {
  if (!_fd) {
    throw std::invalid_argument("SocketChannel requires an opened fd");
  }
  if (!SetNonBlocking(_fd.fd())) {
    throw_errno("Unable to set fd # {} non blocking", _fd.fd());
  }
  log::debug("Channel # {} opened on fd # {}", _id, _fd.fd());
}

SocketChannel::~SocketChannel() {
  if (_fd) {
    _loop.del(_fd.fd());
    _fd.close();
    failAll(std::make_exception_ptr(ChannelClosedError()));
    _closeFuture.complete();
  }
}

Completion SocketChannel::write(OutboundMessage message) {
  if (!_fd) [[unlikely]] {
    message.releaseBody();
    return Completion::Failed(std::make_exception_ptr(ChannelClosedError()));
  }
  const std::size_t size = message.size();
  if (!_queue.empty() && _queuedBytes + size > _maxOutboundBufferBytes) [[unlikely]] {
    log::warn("Channel # {} outbound buffer limit of {} bytes reached ({} queued), rejecting write of {} bytes", _id,
              _maxOutboundBufferBytes, _queuedBytes, size);
    message.releaseBody();
    return Completion::Failed(std::make_exception_ptr(TransportError("Outbound buffer limit exceeded")));
  }
  Completion written;
  _queue.push_back(PendingWrite{std::move(message), written, 0, size});
  _queuedBytes += size;
  if (_queuedBytes >= _flushThresholdBytes) {
    log::trace("Channel # {} flushing {} queued bytes", _id, _queuedBytes);
    flush();
  }
  return written;
}

void SocketChannel::flush() {
  _nbFlushable = _queue.size();
  writeFlushed();
}

void SocketChannel::writeFlushed() {
  while (_nbFlushable != 0 && _fd) {
    PendingWrite& pending = _queue.front();
    while (pending.nbWritten < pending.size) {
      const auto remaining = RemainingSegments(pending.message.segments(), pending.nbWritten);
      const auto res =
          remaining.size() == 1 ? _transport->write(remaining[0]) : _transport->write(remaining[0], remaining[1]);
      pending.nbWritten += res.bytesProcessed;
      _queuedBytes -= res.bytesProcessed;
      _nbBytesWritten += res.bytesProcessed;
      if (res.want == TransportHint::Error) [[unlikely]] {
        const auto err = errno;
        log::error("Channel # {} write failed fd # {} errno={} msg={}", _id, _fd.fd(), err, std::strerror(err));
        failAll(std::make_exception_ptr(TransportError(std::strerror(err))));
        close();
        return;
      }
      if (res.want != TransportHint::None) {
        if (!_waitingWritable) {
          log::trace("Channel # {} fd # {} waiting for writability ({} bytes queued)", _id, _fd.fd(), _queuedBytes);
          _waitingWritable = true;
          updateInterest();
        }
        return;
      }
    }
    Completion written = std::move(pending.written);
    pending.message.releaseBody();
    _queue.pop_front();
    --_nbFlushable;
    // Listeners may write, flush or close reentrantly.
    written.complete();
  }
  if (_waitingWritable && _fd) {
    _waitingWritable = false;
    updateInterest();
  }
}

void SocketChannel::read() {
  if (!_fd || _readPending) {
    return;
  }
  _readPending = true;
  updateInterest();
}

void SocketChannel::handleReadable() {
  if (!_readPending) {
    return;
  }
  _readBuffer.resize(_readChunkSize);
  const auto res = _transport->read(_readBuffer.data(), _readBuffer.size());
  if (res.bytesProcessed != 0) {
    _readPending = false;
    updateInterest();
    _nbBytesRead += res.bytesProcessed;
    if (_onInbound) {
      _onInbound(std::string_view(_readBuffer.data(), res.bytesProcessed));
    }
    return;
  }
  switch (res.want) {
    case TransportHint::None:
      log::debug("Channel # {} fd # {} closed by peer", _id, _fd.fd());
      close();
      break;
    case TransportHint::Error: {
      const auto err = errno;
      log::error("Channel # {} read failed fd # {} errno={} msg={}", _id, _fd.fd(), err, std::strerror(err));
      close();
      break;
    }
    default:
      break;
  }
}

void SocketChannel::onEvents(EventBmp eventBmp) {
  if ((eventBmp & EventOut) != 0) {
    writeFlushed();
  }
  if ((eventBmp & EventIn) != 0 && _fd) {
    handleReadable();
  }
  if ((eventBmp & (EventErr | EventHup)) != 0 && _fd) {
    const int err = GetSocketError(_fd.fd());
    if (err != 0) {
      log::error("Channel # {} socket error fd # {} errno={} msg={}", _id, _fd.fd(), err, std::strerror(err));
      failAll(std::make_exception_ptr(TransportError(std::strerror(err))));
    } else {
      log::debug("Channel # {} fd # {} hung up", _id, _fd.fd());
    }
    close();
  }
}

void SocketChannel::updateInterest() {
  const EventBmp interest = (_readPending ? EventIn : 0U) | (_waitingWritable ? EventOut : 0U);
  if (interest != _interest && _fd) {
    _interest = interest;
    if (!_loop.mod(_fd.fd(), interest)) {
      log::error("Channel # {} unable to update interest of fd # {}", _id, _fd.fd());
    }
  }
}

void SocketChannel::failAll(const std::exception_ptr& error) {
  std::deque<PendingWrite> queue = std::exchange(_queue, {});
  _nbFlushable = 0;
  _queuedBytes = 0;
  for (PendingWrite& pending : queue) {
    pending.message.releaseBody();
    pending.written.fail(error);
  }
}

void SocketChannel::close() {
  if (!_fd) {
    return;
  }
  log::debug("Channel # {} closing fd # {}", _id, _fd.fd());
  _loop.del(_fd.fd());
  _fd.close();
  _readPending = false;
  _waitingWritable = false;
  failAll(std::make_exception_ptr(ChannelClosedError()));
  _closeFuture.complete();
}

}  // namespace conduit
