#pragma once

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>

#include "conduit/completion.hpp"
#include "conduit/data-chunk.hpp"
#include "conduit/exchange-context.hpp"
#include "conduit/http-headers.hpp"
#include "conduit/http-status.hpp"
#include "conduit/ordered-channel.hpp"
#include "conduit/pending-write-chain.hpp"
#include "conduit/pipeline-config.hpp"
#include "conduit/pipeline-stats.hpp"
#include "conduit/subscription.hpp"

namespace conduit {

// Output side of one HTTP/1.1 exchange.
//
// The producer calls writeStatusAndHeaders() once, then subscribes and pushes body chunks with onNext() under a
// request(1) credit protocol, and finishes with onComplete() or onError(). Producer calls must be serialized but
// may come from any thread. Every byte goes through the connection's OrderedChannel, and every write is chained
// on a PendingWriteChain linked to the previous response of the connection.
//
// Framing decisions:
//  - explicit Content-Length: body sent as is.
//  - status 200 without Content-Length on a non event-stream response: the first chunk is held back. If the body
//    ends before a second chunk arrives, the response is sent with Content-Length, otherwise it is chunked.
//  - other statuses without Content-Length: chunked.
//  - 101 with "Upgrade: websocket": no framing at all, the head is flushed immediately.
//  - 204, 205 and 304: no body, offered chunks are dropped.
// A failed chunked body ends with the trailers stream-status and stream-result.
//
// The connection is kept alive only if the request allows it, the response does not say "Connection: close" and
// the request body was consumed or could be drained. Otherwise the channel is closed after the terminal frame.
class ResponseSession : public std::enable_shared_from_this<ResponseSession> {
 public:
  // 'previousResponse' is settled once the previous response of the connection has submitted its terminal frame.
  // 'forceClose' refuses keep-alive whatever the request says.
  static std::shared_ptr<ResponseSession> Create(std::shared_ptr<OrderedChannel> channel, ExchangeContext exchange,
                                                 Completion previousResponse, const PipelineConfig& config,
                                                 std::shared_ptr<internal::PipelineCounters> counters = {},
                                                 bool forceClose = false);

  ResponseSession(const ResponseSession&) = delete;
  ResponseSession(ResponseSession&&) = delete;
  ResponseSession& operator=(const ResponseSession&) = delete;
  ResponseSession& operator=(ResponseSession&&) = delete;

  ~ResponseSession();

  // Throws std::logic_error if called more than once, and std::invalid_argument (without consuming the call) when
  // the reason phrase or a header field is not valid on the wire.
  void writeStatusAndHeaders(http::Status status, HttpHeaders headers);

  // Only the first subscription is kept, later ones are cancelled.
  // Throws std::invalid_argument if 'subscription' is null.
  void onSubscribe(std::shared_ptr<Subscription> subscription);

  // Throws std::logic_error if headers were not sent yet, or if the response is already completed.
  // The chunk is released in all cases.
  void onNext(DataChunk chunk);

  void onError(std::exception_ptr error);

  void onComplete();

  // Settled once the response head was written (or failed to be).
  [[nodiscard]] Completion whenHeadersCompleted() const { return _headersCompleted; }

  // Settled once the terminal frame was written. Fails with the producer error, or with the transport error.
  [[nodiscard]] Completion whenCompleted() const { return _responseCompleted; }

  // Settled once the terminal frame was submitted to the channel.
  [[nodiscard]] Completion whenTerminalSubmitted() const { return _terminalSubmitted; }

  [[nodiscard]] uint64_t requestId() const noexcept { return _exchange.requestId; }

  [[nodiscard]] bool headersSent() const noexcept { return _statusHeadersSent.load(); }

  [[nodiscard]] bool isClosed() const noexcept { return _internallyClosed.load(); }

  [[nodiscard]] bool isWebSocketUpgrade() const noexcept { return _webSocketUpgrade; }

 private:
  enum class CloseAction : uint8_t { KeepAlive, Close };

  ResponseSession(std::shared_ptr<OrderedChannel> channel, ExchangeContext exchange, Completion previousResponse,
                  const PipelineConfig& config, std::shared_ptr<internal::PipelineCounters> counters, bool forceClose);

  void prepareHeaders(http::Status status, HttpHeaders headers);

  void analyzeEntity();

  void completeInternal(std::exception_ptr error);

  // Registers 'action' on the write chain once the request entity was analyzed.
  void afterEntityAnalyzed(std::function<void()> action);

  void scheduleHead();

  void writeHead();

  void sendChunk(std::shared_ptr<DataChunk> chunk, bool requestMore);

  void writeLastContent(std::exception_ptr error);

  void onTerminalWritten(const std::exception_ptr& error, const std::exception_ptr& writeError, CloseAction action);

  void onWriteFailure(const std::exception_ptr& error);

  void requestMore();

  [[nodiscard]] std::shared_ptr<Subscription> subscription() const;

  void countBytes(uint64_t nbBytes) const;

  std::shared_ptr<OrderedChannel> _channel;
  ExchangeContext _exchange;
  PendingWriteChain _chain;
  std::shared_ptr<internal::PipelineCounters> _counters;

  bool _lengthOptimizationEnabled;
  bool _errorTrailers;
  bool _drainUnconsumedEntity;
  bool _forceClose;

  std::atomic<bool> _statusHeadersSent{false};
  std::atomic<bool> _internallyClosed{false};
  std::atomic<bool> _subscribed{false};

  mutable std::mutex _subscriptionMutex;
  std::shared_ptr<Subscription> _subscription;

  // Producer side state, only touched by serialized producer calls before the head is scheduled.
  http::Status _status;
  HttpHeaders _headers;
  std::shared_ptr<DataChunk> _firstChunk;
  bool _chunked{false};
  bool _lengthOptimization{false};
  bool _webSocketUpgrade{false};
  bool _noEntity{false};

  // Written before _entityAnalyzed settles, read after.
  CloseAction _closeAction{CloseAction::Close};

  Completion _entityAnalyzed;
  Completion _headersCompleted;
  Completion _responseCompleted;
  Completion _terminalSubmitted;
};

}  // namespace conduit
