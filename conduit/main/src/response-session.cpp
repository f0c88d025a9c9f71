#include "conduit/response-session.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include "conduit/completion.hpp"
#include "conduit/data-chunk.hpp"
#include "conduit/exception-message.hpp"
#include "conduit/exchange-context.hpp"
#include "conduit/http-constants.hpp"
#include "conduit/http-header-is-valid.hpp"
#include "conduit/http-headers.hpp"
#include "conduit/http-response-encoder.hpp"
#include "conduit/http-status-code.hpp"
#include "conduit/http-status.hpp"
#include "conduit/log.hpp"
#include "conduit/ordered-channel.hpp"
#include "conduit/outbound-message.hpp"
#include "conduit/pipeline-config.hpp"
#include "conduit/pipeline-stats.hpp"
#include "conduit/string-equal-ignore-case.hpp"
#include "conduit/subscription.hpp"

namespace conduit {

std::shared_ptr<ResponseSession> ResponseSession::Create(std::shared_ptr<OrderedChannel> channel,
                                                         ExchangeContext exchange, Completion previousResponse,
                                                         const PipelineConfig& config,
                                                         std::shared_ptr<internal::PipelineCounters> counters,
                                                         bool forceClose) {
  if (!channel) {
    throw std::invalid_argument("ResponseSession requires a channel");
  }
  return std::shared_ptr<ResponseSession>(new ResponseSession(std::move(channel), std::move(exchange),
                                                              std::move(previousResponse), config, std::move(counters),
                                                              forceClose));
}

ResponseSession::ResponseSession(std::shared_ptr<OrderedChannel> channel, ExchangeContext exchange,
                                 Completion previousResponse, const PipelineConfig& config,
                                 std::shared_ptr<internal::PipelineCounters> counters, bool forceClose)
    : _channel(std::move(channel)),
      _exchange(std::move(exchange)),
      _chain(std::move(previousResponse)),
      _counters(std::move(counters)),
      _lengthOptimizationEnabled(config.lengthOptimization),
      _errorTrailers(config.errorTrailers),
      _drainUnconsumedEntity(config.drainUnconsumedEntity),
      _forceClose(forceClose) {
  log::trace("Response # {} created on channel # {} for {} {}", _exchange.requestId, _channel->id(), _exchange.method,
             _exchange.target);
}

ResponseSession::~ResponseSession() {
  if (!_internallyClosed.load()) {
    log::warn("Response # {} destroyed before completion", _exchange.requestId);
  }
  if (_firstChunk) {
    _firstChunk->release();
  }
}

void ResponseSession::writeStatusAndHeaders(http::Status status, HttpHeaders headers) {
  if (!http::IsValidHeaderValue(status.reason)) {
    throw std::invalid_argument("Invalid reason phrase");
  }
  for (const auto& [name, value] : headers) {
    if (!http::IsValidHeaderName(name) || !http::IsValidHeaderValue(value)) {
      throw std::invalid_argument("Invalid response header '" + http::SanitizeHeaderValue(name) + "'");
    }
  }
  if (_statusHeadersSent.exchange(true)) {
    throw std::logic_error("Status and headers were already sent");
  }
  prepareHeaders(std::move(status), std::move(headers));
}

void ResponseSession::prepareHeaders(http::Status status, HttpHeaders headers) {
  _status = std::move(status);
  _headers = std::move(headers);

  if (auto streamId = _exchange.requestHeaders.get(http::StreamIdHeader)) {
    _headers.set(http::StreamIdHeader, *streamId);
  }

  _webSocketUpgrade = _status.code == http::StatusCodeSwitchingProtocols &&
                      _headers.containsToken(http::Upgrade, http::websocket);
  _noEntity = http::IsNoEntityStatus(_status.code);

  if (!_webSocketUpgrade && !_noEntity && !_headers.contains(http::ContentLength)) {
    _chunked = true;
    const bool explicitlyChunked = _headers.containsToken(http::TransferEncoding, http::chunked);
    const auto contentType = _headers.get(http::ContentType);
    const bool eventStream =
        contentType && StartsWithCaseInsensitive(*contentType, http::ContentTypeEventStream);
    _lengthOptimization =
        _lengthOptimizationEnabled && _status.code == http::StatusCodeOK && !eventStream && !explicitlyChunked;
  }

  log::debug("Response # {} status {} on channel # {} (chunked={}, lengthOptimization={}, upgrade={})",
             _exchange.requestId, _status.code, _channel->id(), _chunked, _lengthOptimization, _webSocketUpgrade);

  analyzeEntity();

  if (!_lengthOptimization) {
    scheduleHead();
  }
}

void ResponseSession::analyzeEntity() {
  const std::shared_ptr<RequestEntity>& entity = _exchange.entity;
  const bool unconsumed = entity && !entity->consumed();

  // Explicit response headers are authoritative over the request's keep-alive wish.
  if (!_exchange.keepAlive || _forceClose || _headers.containsToken(http::Connection, http::close)) {
    _closeAction = CloseAction::Close;
    if (unconsumed && !entity->dataRequested()) {
      const uint64_t requestId = _exchange.requestId;
      entity->drain().whenDone([requestId](std::exception_ptr error) {
        if (error) {
          log::debug("Response # {} discarding request entity failed: {}", requestId, ExceptionMessage(error));
        }
      });
    }
    _entityAnalyzed.complete();
    return;
  }

  if (!unconsumed || _webSocketUpgrade) {
    _closeAction = CloseAction::KeepAlive;
    _entityAnalyzed.complete();
    return;
  }

  if (entity->dataRequested()) {
    log::warn("Response # {} sent while the handler is still reading the request entity, closing channel # {}",
              _exchange.requestId, _channel->id());
    _closeAction = CloseAction::Close;
    _entityAnalyzed.complete();
    return;
  }

  if (!_drainUnconsumedEntity) {
    log::debug("Response # {} request entity not consumed, closing channel # {}", _exchange.requestId,
               _channel->id());
    _closeAction = CloseAction::Close;
    _entityAnalyzed.complete();
    return;
  }

  log::debug("Response # {} draining unconsumed request entity", _exchange.requestId);
  entity->drain().whenDone([self = shared_from_this()](std::exception_ptr error) {
    if (error) {
      log::warn("Response # {} request entity drain failed ({}), closing channel # {}", self->_exchange.requestId,
                ExceptionMessage(error), self->_channel->id());
      self->_closeAction = CloseAction::Close;
    } else {
      self->_closeAction = CloseAction::KeepAlive;
    }
    self->_entityAnalyzed.complete();
  });
}

void ResponseSession::onSubscribe(std::shared_ptr<Subscription> subscription) {
  if (!subscription) {
    throw std::invalid_argument("Subscription cannot be null");
  }
  if (_subscribed.exchange(true)) {
    log::warn("Response # {} already has a producer, cancelling the new subscription", _exchange.requestId);
    subscription->cancel();
    return;
  }
  {
    std::lock_guard lock(_subscriptionMutex);
    _subscription = subscription;
  }
  if (_internallyClosed.load()) {
    subscription->cancel();
    return;
  }
  subscription->request(1);
}

void ResponseSession::onNext(DataChunk chunk) {
  if (_internallyClosed.load()) [[unlikely]] {
    chunk.release();
    throw std::logic_error("Response is already completed, cannot write more data");
  }
  if (!_statusHeadersSent.load()) [[unlikely]] {
    chunk.release();
    throw std::logic_error("Status and headers must be sent before the response body");
  }

  if (chunk.isFlushMarker()) {
    chunk.release();
    afterEntityAnalyzed([self = shared_from_this()] { self->_channel->flush(); });
    requestMore();
    return;
  }

  if (_noEntity || chunk.remaining() == 0) {
    if (_noEntity) {
      log::warn("Response # {} with status {} cannot have a body, dropping {} bytes", _exchange.requestId,
                _status.code, chunk.remaining());
    }
    chunk.release();
    requestMore();
    return;
  }

  auto current = std::make_shared<DataChunk>(std::move(chunk));
  if (_lengthOptimization) {
    if (!_firstChunk) {
      log::trace("Response # {} holding back first chunk of {} bytes", _exchange.requestId, current->remaining());
      _firstChunk = std::move(current);
      requestMore();
      return;
    }
    // A second chunk proves the body does not fit in one buffer.
    _lengthOptimization = false;
    scheduleHead();
    sendChunk(std::exchange(_firstChunk, nullptr), false);
  }
  sendChunk(std::move(current), true);
}

void ResponseSession::onError(std::exception_ptr error) {
  if (!error) {
    throw std::invalid_argument("Response error cannot be null");
  }
  completeInternal(std::move(error));
}

void ResponseSession::onComplete() { completeInternal(nullptr); }

void ResponseSession::completeInternal(std::exception_ptr error) {
  if (_internallyClosed.exchange(true)) {
    log::debug("Response # {} already completed", _exchange.requestId);
    return;
  }
  if (auto sub = subscription()) {
    sub->cancel();
  }
  if (error) {
    log::debug("Response # {} producer failed: {}", _exchange.requestId, ExceptionMessage(error));
  }

  if (!_statusHeadersSent.exchange(true)) {
    prepareHeaders(http::Status(error ? http::StatusCodeInternalServerError : http::StatusCodeOK), HttpHeaders{});
  }

  if (_lengthOptimization) {
    _lengthOptimization = false;
    std::shared_ptr<DataChunk> firstChunk = std::exchange(_firstChunk, nullptr);
    if (error) {
      // Nothing was written yet: the status can still reflect the failure.
      if (firstChunk) {
        firstChunk->release();
      }
      _status = http::Status(http::StatusCodeInternalServerError);
      scheduleHead();
    } else {
      const std::size_t contentLength = firstChunk ? firstChunk->remaining() : 0;
      _chunked = false;
      _headers.set(http::ContentLength, std::to_string(contentLength));
      if (_counters) {
        _counters->nbLengthOptimized.fetch_add(1, std::memory_order_relaxed);
      }
      scheduleHead();
      if (firstChunk) {
        sendChunk(std::move(firstChunk), false);
      }
    }
  }

  writeLastContent(std::move(error));
}

void ResponseSession::afterEntityAnalyzed(std::function<void()> action) {
  _entityAnalyzed.whenDone([self = shared_from_this(), action = std::move(action)](std::exception_ptr) {
    self->_chain.orderedWrite(action).whenDone([requestId = self->_exchange.requestId](std::exception_ptr error) {
      if (error) {
        log::error("Response # {} write submission failed: {}", requestId, ExceptionMessage(error));
      }
    });
  });
}

void ResponseSession::scheduleHead() {
  afterEntityAnalyzed([self = shared_from_this()] { self->writeHead(); });
}

void ResponseSession::writeHead() {
  HttpHeaders headers = _headers;
  if (!_webSocketUpgrade) {
    if (_closeAction == CloseAction::Close) {
      headers.set(http::Connection, http::close);
    } else {
      headers.setIfAbsent(http::Connection, http::keepalive);
    }
  }
  if (_chunked) {
    headers.set(http::TransferEncoding, http::chunked);
    if (_counters) {
      _counters->nbChunked.fetch_add(1, std::memory_order_relaxed);
    }
  }

  OutboundMessage head(http::EncodeResponseHead(_status, headers));
  countBytes(head.size());
  log::trace("Response # {} writing head of {} bytes on channel # {}", _exchange.requestId, head.size(),
             _channel->id());

  _channel->write(_webSocketUpgrade, std::move(head), [self = shared_from_this()](Completion written) {
    written.whenDone([self](std::exception_ptr error) {
      if (error) {
        self->onWriteFailure(error);
      } else {
        self->_headersCompleted.complete();
      }
    });
    return written;
  });
}

void ResponseSession::sendChunk(std::shared_ptr<DataChunk> chunk, bool requestMore) {
  const bool chunked = _chunked;
  afterEntityAnalyzed([self = shared_from_this(), chunk, requestMore, chunked] {
    const bool flush = chunk->flush();
    OutboundMessage message = chunked ? OutboundMessage(http::EncodeChunkPrefix(chunk->remaining()), chunk, http::CRLF)
                                      : OutboundMessage(std::string(), chunk);
    self->countBytes(message.size());
    log::trace("Response # {} writing chunk # {} of {} bytes", self->_exchange.requestId, chunk->id(),
               chunk->remaining());

    self->_channel->write(flush, std::move(message), [self, chunk, requestMore](Completion written) {
      // Runs on the event loop once the chunk is queued in the channel. While the channel has room, the producer
      // gets its next credit right away; otherwise it waits for this chunk to reach the kernel.
      const bool creditOnSubmit = requestMore && self->_channel->isWritable();
      if (creditOnSubmit) {
        self->requestMore();
      }
      written.whenDone([self, chunk, creditOnWrite = requestMore && !creditOnSubmit](std::exception_ptr error) {
        chunk->release();
        if (error) {
          self->onWriteFailure(error);
        } else if (creditOnWrite) {
          self->requestMore();
        }
      });
      return written;
    });
  });
}

void ResponseSession::writeLastContent(std::exception_ptr error) {
  const bool chunked = _chunked;
  const bool delimitedBody = !chunked && !_noEntity;
  HttpHeaders trailers;
  if (error && chunked && _errorTrailers) {
    trailers.add(http::StreamStatusTrailer, std::to_string(http::StatusCodeInternalServerError));
    // The message is arbitrary text: a line break in it would end the trailer section early.
    trailers.add(http::StreamResultTrailer, http::SanitizeHeaderValue(ExceptionMessage(error)));
  }
  std::string frame = chunked ? http::EncodeLastChunk(trailers) : std::string();

  afterEntityAnalyzed([self = shared_from_this(), frame = std::move(frame), error, delimitedBody] {
    CloseAction action = self->_closeAction;
    if (error && delimitedBody) {
      // A length delimited or upgraded body cut short cannot be framed anymore.
      action = CloseAction::Close;
    }
    OutboundMessage message(frame);
    self->countBytes(message.size());
    self->_channel->write(true, std::move(message), [self, error, action](Completion written) {
      written.whenDone([self, error, action](std::exception_ptr writeError) {
        self->onTerminalWritten(error, writeError, action);
      });
      return written;
    });
    self->_terminalSubmitted.complete();
  });
}

void ResponseSession::onTerminalWritten(const std::exception_ptr& error, const std::exception_ptr& writeError,
                                        CloseAction action) {
  if (writeError) {
    onWriteFailure(writeError);
    return;
  }
  if (error) {
    if (_responseCompleted.fail(error) && _counters) {
      _counters->nbResponsesFailed.fetch_add(1, std::memory_order_relaxed);
    }
  } else if (_responseCompleted.complete() && _counters) {
    _counters->nbResponsesCompleted.fetch_add(1, std::memory_order_relaxed);
  }

  if (action == CloseAction::Close) {
    log::debug("Response # {} done, closing channel # {}", _exchange.requestId, _channel->id());
    _channel->close();
  } else {
    log::debug("Response # {} done, keeping channel # {} alive", _exchange.requestId, _channel->id());
    _channel->read();
  }
}

void ResponseSession::onWriteFailure(const std::exception_ptr& error) {
  _headersCompleted.fail(error);
  if (!_responseCompleted.fail(error)) {
    return;
  }
  log::error("Response # {} write failed on channel # {}: {}", _exchange.requestId, _channel->id(),
             ExceptionMessage(error));
  if (_counters) {
    _counters->nbResponsesFailed.fetch_add(1, std::memory_order_relaxed);
  }
  if (auto sub = subscription()) {
    sub->cancel();
  }
  _channel->close();
  // The connection is unusable: do not hold back the next response on a producer that may never complete.
  _terminalSubmitted.complete();
}

void ResponseSession::requestMore() {
  if (_internallyClosed.load()) {
    return;
  }
  if (auto sub = subscription()) {
    sub->request(1);
  }
}

std::shared_ptr<Subscription> ResponseSession::subscription() const {
  std::lock_guard lock(_subscriptionMutex);
  return _subscription;
}

void ResponseSession::countBytes(uint64_t nbBytes) const {
  if (_counters) {
    _counters->nbBytesQueued.fetch_add(nbBytes, std::memory_order_relaxed);
  }
}

}  // namespace conduit
