#include "conduit/response-session.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "conduit/buffer-pool.hpp"
#include "conduit/channel-errors.hpp"
#include "conduit/completion.hpp"
#include "conduit/data-chunk.hpp"
#include "conduit/event-loop.hpp"
#include "conduit/exchange-context.hpp"
#include "conduit/http-headers.hpp"
#include "conduit/http-status-code.hpp"
#include "conduit/http-status.hpp"
#include "conduit/ordered-channel.hpp"
#include "conduit/pipeline-config.hpp"
#include "conduit/pipeline-stats.hpp"
#include "conduit/test_channel.hpp"
#include "conduit/test_producer.hpp"
#include "conduit/test_util.hpp"

namespace conduit {

namespace {

std::string Header(const HttpHeaders& headers, std::string_view name) {
  return std::string(headers.get(name).value_or("<absent>"));
}

}  // namespace

class ResponseSessionTest : public ::testing::Test {
 protected:
  ExchangeContext exchange(bool keepAlive = true) {
    ExchangeContext ctx;
    ctx.requestId = ++nextRequestId;
    ctx.keepAlive = keepAlive;
    ctx.method = "GET";
    ctx.target = "/resource";
    return ctx;
  }

  std::shared_ptr<ResponseSession> newSession(ExchangeContext ctx, bool forceClose = false) {
    return ResponseSession::Create(channel, std::move(ctx), Completion::Completed(), config, counters, forceClose);
  }

  std::shared_ptr<ResponseSession> newSession() { return newSession(exchange()); }

  std::shared_ptr<test::TestSubscription> subscribe(ResponseSession& session) {
    auto subscription = std::make_shared<test::TestSubscription>();
    session.onSubscribe(subscription);
    return subscription;
  }

  test::ParsedResponse wireResponse() {
    test::drainEventLoop(loop);
    auto parsed = test::parseResponse(recording->wire());
    if (!parsed) {
      ADD_FAILURE() << "Incomplete response on the wire: " << recording->wire();
      return {};
    }
    EXPECT_EQ(parsed->consumedBytes, recording->wire().size()) << "Trailing bytes after the response";
    return *parsed;
  }

  PipelineConfig config;
  EventLoop loop{std::chrono::milliseconds{1}};
  std::shared_ptr<test::RecordingChannel> recording = std::make_shared<test::RecordingChannel>(loop);
  std::shared_ptr<OrderedChannel> channel = OrderedChannel::Create(recording);
  std::shared_ptr<internal::PipelineCounters> counters = std::make_shared<internal::PipelineCounters>();
  BufferPool pool{64, 16};
  uint64_t nextRequestId{0};
};

TEST_F(ResponseSessionTest, SingleChunkIsSentWithContentLength) {
  auto session = newSession();
  int nbCompletions = 0;
  session->whenCompleted().whenDone([&nbCompletions](std::exception_ptr error) {
    EXPECT_EQ(error, nullptr);
    ++nbCompletions;
  });

  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {});
  auto subscription = subscribe(*session);
  const std::string body(37, 'b');
  session->onNext(pool.chunk(body));
  session->onComplete();

  auto resp = wireResponse();
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.reason, "OK");
  EXPECT_EQ(Header(resp.headers, "Content-Length"), "37");
  EXPECT_FALSE(resp.headers.contains("Transfer-Encoding"));
  EXPECT_EQ(Header(resp.headers, "Connection"), "keep-alive");
  EXPECT_EQ(resp.body, body);

  EXPECT_EQ(nbCompletions, 1);
  EXPECT_EQ(recording->nbCloses(), 0U);
  EXPECT_EQ(recording->nbReads(), 1U);
  EXPECT_TRUE(recording->isOpen());
  EXPECT_EQ(pool.outstanding(), 0U);
  EXPECT_EQ(subscription->requested(), 2);

  const PipelineStats stats = counters->snapshot();
  EXPECT_EQ(stats.nbLengthOptimized, 1U);
  EXPECT_EQ(stats.nbChunked, 0U);
  EXPECT_EQ(stats.nbResponsesCompleted, 1U);
  EXPECT_EQ(stats.nbBytesQueued, recording->wire().size());
}

TEST_F(ResponseSessionTest, EmptyBodyIsSentWithZeroContentLength) {
  auto session = newSession();
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {});
  session->onComplete();

  auto resp = wireResponse();
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(Header(resp.headers, "Content-Length"), "0");
  EXPECT_FALSE(resp.chunked);
  EXPECT_TRUE(resp.body.empty());
  EXPECT_TRUE(session->whenCompleted().isDone());
}

TEST_F(ResponseSessionTest, CompletionWithoutHeadersSends200) {
  auto session = newSession();
  session->onComplete();
  EXPECT_TRUE(session->headersSent());

  auto resp = wireResponse();
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(Header(resp.headers, "Content-Length"), "0");
}

TEST_F(ResponseSessionTest, SecondHeaderWriteThrows) {
  auto session = newSession();
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {});
  EXPECT_THROW(session->writeStatusAndHeaders(http::Status(http::StatusCodeNotFound), {}), std::logic_error);
  session->onComplete();
  EXPECT_THROW(session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {}), std::logic_error);

  auto resp = wireResponse();
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
}

TEST_F(ResponseSessionTest, HeaderWriteAfterSynthesizedHeadersThrows) {
  auto session = newSession();
  session->onComplete();
  EXPECT_THROW(session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {}), std::logic_error);
}

TEST_F(ResponseSessionTest, CompletionIsResolvedOnce) {
  auto session = newSession();
  int nbCompletions = 0;
  session->whenCompleted().whenDone([&nbCompletions](std::exception_ptr) { ++nbCompletions; });

  session->writeStatusAndHeaders(http::Status(http::StatusCodeCreated), {});
  session->onComplete();
  session->onComplete();
  session->onError(std::make_exception_ptr(std::runtime_error("too late")));
  test::drainEventLoop(loop);

  EXPECT_EQ(nbCompletions, 1);
  EXPECT_FALSE(session->whenCompleted().isFailed());
  EXPECT_TRUE(session->isClosed());
  EXPECT_EQ(test::countOccurrences(recording->wire(), "0\r\n\r\n"), 1);
  EXPECT_EQ(counters->snapshot().nbResponsesCompleted, 1U);
  EXPECT_EQ(counters->snapshot().nbResponsesFailed, 0U);
}

TEST_F(ResponseSessionTest, NullErrorIsRejected) {
  auto session = newSession();
  EXPECT_THROW(session->onError(nullptr), std::invalid_argument);
  EXPECT_FALSE(session->isClosed());
  session->onComplete();
}

TEST_F(ResponseSessionTest, SeveralChunksFallBackToChunkedEncoding) {
  auto session = newSession();
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {});
  auto subscription = subscribe(*session);
  session->onNext(pool.chunk("Hello"));
  session->onNext(pool.chunk(", "));
  session->onNext(pool.chunk("World"));
  session->onComplete();

  auto resp = wireResponse();
  EXPECT_TRUE(resp.chunked);
  EXPECT_FALSE(resp.headers.contains("Content-Length"));
  EXPECT_EQ(resp.body, "Hello, World");
  EXPECT_EQ(resp.nbChunks, 3U);
  EXPECT_EQ(resp.trailers.size(), 0U);
  EXPECT_EQ(pool.outstanding(), 0U);
  EXPECT_EQ(counters->snapshot().nbChunked, 1U);
  EXPECT_EQ(counters->snapshot().nbLengthOptimized, 0U);
  EXPECT_EQ(counters->snapshot().nbBytesQueued, recording->wire().size());
}

TEST_F(ResponseSessionTest, LargeChunkedBodyPreservesOrder) {
  auto session = newSession();
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {});
  std::string expected;
  for (int i = 0; i < 100; ++i) {
    std::string part = "part-" + std::to_string(i) + ";";
    expected += part;
    session->onNext(pool.chunk(part));
  }
  session->onComplete();

  auto resp = wireResponse();
  EXPECT_EQ(resp.body, expected);
  EXPECT_EQ(resp.nbChunks, 100U);
}

TEST_F(ResponseSessionTest, ExplicitContentLengthIsKept) {
  auto session = newSession();
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {{"Content-Length", "10"}});
  session->onNext(pool.chunk("01234"));
  session->onNext(pool.chunk("56789"));
  session->onComplete();

  auto resp = wireResponse();
  EXPECT_FALSE(resp.chunked);
  EXPECT_EQ(Header(resp.headers, "Content-Length"), "10");
  EXPECT_EQ(resp.body, "0123456789");
  EXPECT_EQ(counters->snapshot().nbLengthOptimized, 0U);
}

TEST_F(ResponseSessionTest, NonOkStatusIsChunked) {
  auto session = newSession();
  session->writeStatusAndHeaders(http::Status(http::StatusCodeCreated), {});
  session->onNext(pool.chunk("single"));
  session->onComplete();

  auto resp = wireResponse();
  EXPECT_EQ(resp.statusCode, http::StatusCodeCreated);
  EXPECT_TRUE(resp.chunked);
  EXPECT_EQ(resp.body, "single");
}

TEST_F(ResponseSessionTest, EventStreamIsNeverLengthOptimized) {
  auto session = newSession();
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK),
                                 {{"Content-Type", "text/event-stream; charset=utf-8"}});
  session->onNext(pool.chunk("data: hi\n\n"));
  session->onComplete();

  auto resp = wireResponse();
  EXPECT_TRUE(resp.chunked);
  EXPECT_EQ(resp.body, "data: hi\n\n");
}

TEST_F(ResponseSessionTest, LengthOptimizationCanBeDisabled) {
  config.withLengthOptimization(false);
  auto session = newSession();
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {});
  session->onNext(pool.chunk("abc"));
  session->onComplete();

  auto resp = wireResponse();
  EXPECT_TRUE(resp.chunked);
  EXPECT_EQ(resp.body, "abc");
}

TEST_F(ResponseSessionTest, ExplicitChunkedHeaderIsNotDuplicated) {
  auto session = newSession();
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {{"Transfer-Encoding", "chunked"}});
  session->onNext(pool.chunk("abc"));
  session->onComplete();

  auto resp = wireResponse();
  EXPECT_TRUE(resp.chunked);
  EXPECT_EQ(test::countOccurrences(recording->wire(), "Transfer-Encoding"), 1);
}

TEST_F(ResponseSessionTest, HeadersAreEmittedInOrder) {
  auto session = newSession();
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK, "Fine"),
                                 {{"X-First", "1"}, {"Set-Cookie", "a=1"}, {"Set-Cookie", "b=2"}});
  session->onComplete();
  test::drainEventLoop(loop);

  const std::string wire = recording->wire();
  EXPECT_TRUE(wire.starts_with("HTTP/1.1 200 Fine\r\nX-First: 1\r\nSet-Cookie: a=1\r\nSet-Cookie: b=2\r\n"));
}

TEST_F(ResponseSessionTest, NonKeepAliveRequestAlwaysClosesTheConnection) {
  const std::vector<std::vector<std::string>> bodyShapes{{}, {"one"}, {"one", "two", "three"}};
  for (const auto& chunks : bodyShapes) {
    for (bool explicitLength : {false, true}) {
      auto shapeRecording = std::make_shared<test::RecordingChannel>(loop);
      auto shapeChannel = OrderedChannel::Create(shapeRecording);
      auto session = ResponseSession::Create(shapeChannel, exchange(false), Completion::Completed(), config);

      std::string body;
      for (const auto& chunk : chunks) {
        body += chunk;
      }
      HttpHeaders headers;
      if (explicitLength) {
        headers.add("Content-Length", std::to_string(body.size()));
      }
      session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), std::move(headers));
      for (const auto& chunk : chunks) {
        session->onNext(pool.chunk(chunk));
      }
      session->onComplete();
      test::drainEventLoop(loop);

      auto resp = test::parseResponse(shapeRecording->wire());
      ASSERT_TRUE(resp.has_value());
      EXPECT_EQ(Header(resp->headers, "Connection"), "close") << chunks.size() << " chunk(s)";
      EXPECT_EQ(resp->body, body);
      EXPECT_EQ(shapeRecording->nbCloses(), 1U);
      EXPECT_EQ(shapeRecording->nbReads(), 0U);
      EXPECT_EQ(shapeRecording->ops().back(), "close");
      EXPECT_TRUE(session->whenCompleted().isDone());
    }
  }
}

TEST_F(ResponseSessionTest, ResponseConnectionCloseHeaderWins) {
  auto session = newSession();
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {{"Connection", "close"}});
  session->onNext(pool.chunk("bye"));
  session->onComplete();

  auto resp = wireResponse();
  EXPECT_EQ(Header(resp.headers, "Connection"), "close");
  EXPECT_EQ(Header(resp.headers, "Content-Length"), "3");
  EXPECT_EQ(recording->nbCloses(), 1U);
}

TEST_F(ResponseSessionTest, ForcedCloseOverridesKeepAliveHeader) {
  auto session = newSession(exchange(), true);
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {{"Connection", "keep-alive"}});
  session->onComplete();

  auto resp = wireResponse();
  EXPECT_EQ(Header(resp.headers, "Connection"), "close");
  EXPECT_EQ(test::countOccurrences(recording->wire(), "Connection"), 1);
  EXPECT_EQ(recording->nbCloses(), 1U);
}

TEST_F(ResponseSessionTest, ExplicitKeepAliveIsNotDuplicated) {
  auto session = newSession();
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {{"connection", "Keep-Alive"}});
  session->onComplete();
  test::drainEventLoop(loop);
  EXPECT_EQ(test::countOccurrences(recording->wire(), "onnection"), 1);
  EXPECT_EQ(recording->nbReads(), 1U);
}

TEST_F(ResponseSessionTest, ProducerErrorAfterChunkedHeadEndsWithTrailers) {
  auto session = newSession();
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {});
  session->onNext(pool.chunk("partial "));
  session->onNext(pool.chunk("body"));
  session->onError(std::make_exception_ptr(std::runtime_error("backend went away")));

  auto resp = wireResponse();
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_TRUE(resp.chunked);
  EXPECT_EQ(resp.body, "partial body");
  EXPECT_EQ(Header(resp.trailers, "stream-status"), "500");
  EXPECT_EQ(Header(resp.trailers, "stream-result"), "backend went away");

  EXPECT_TRUE(session->whenCompleted().isFailed());
  // The chunked framing is intact: the connection can be reused.
  EXPECT_EQ(recording->nbReads(), 1U);
  EXPECT_EQ(recording->nbCloses(), 0U);
  EXPECT_EQ(counters->snapshot().nbResponsesFailed, 1U);
}

TEST_F(ResponseSessionTest, LineBreaksInErrorMessageStayInsideTheTrailer) {
  auto session = newSession();
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {});
  session->onNext(pool.chunk("partial "));
  session->onNext(pool.chunk("body"));
  session->onError(std::make_exception_ptr(std::runtime_error("a\r\nX: y\r\n\r\nHTTP/1.1 200 OK")));

  auto resp = wireResponse();
  EXPECT_EQ(resp.trailers.size(), 2U);
  EXPECT_EQ(Header(resp.trailers, "stream-result"), "a  X: y    HTTP/1.1 200 OK");
  EXPECT_FALSE(resp.trailers.contains("X"));
  EXPECT_EQ(test::parseResponses(recording->wire()).size(), 1U);
}

TEST_F(ResponseSessionTest, InvalidHeaderFieldIsRejected) {
  auto session = newSession();
  HttpHeaders injected{{"X-Injected", "a\r\nSet-Cookie: b"}};
  EXPECT_THROW(session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), injected), std::invalid_argument);
  EXPECT_THROW(session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {{"Bad Name", "v"}}),
               std::invalid_argument);
  EXPECT_THROW(session->writeStatusAndHeaders(http::Status(http::StatusCodeOK, "OK\r\nX: y"), {}),
               std::invalid_argument);

  // Rejected calls do not count as the single allowed one.
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {{"X-Fine", "value"}});
  session->onComplete();
  auto resp = wireResponse();
  EXPECT_EQ(Header(resp.headers, "X-Fine"), "value");
}

TEST_F(ResponseSessionTest, ErrorTrailersCanBeDisabled) {
  config.withErrorTrailers(false);
  auto session = newSession();
  session->writeStatusAndHeaders(http::Status(http::StatusCodeAccepted), {});
  session->onNext(pool.chunk("abc"));
  session->onError(std::make_exception_ptr(std::runtime_error("failure")));

  auto resp = wireResponse();
  EXPECT_TRUE(resp.chunked);
  EXPECT_EQ(resp.trailers.size(), 0U);
  EXPECT_TRUE(recording->wire().ends_with("\r\n0\r\n\r\n"));
}

TEST_F(ResponseSessionTest, ErrorBeforeHeadersSends500) {
  auto session = newSession();
  session->onError(std::make_exception_ptr(std::runtime_error("handler crashed")));

  auto resp = wireResponse();
  EXPECT_EQ(resp.statusCode, http::StatusCodeInternalServerError);
  EXPECT_EQ(resp.reason, "Internal Server Error");
  EXPECT_TRUE(resp.chunked);
  EXPECT_TRUE(resp.body.empty());
  EXPECT_EQ(Header(resp.trailers, "stream-result"), "handler crashed");
  EXPECT_TRUE(session->whenCompleted().isFailed());
}

TEST_F(ResponseSessionTest, ErrorWhileHoldingFirstChunkTurnsInto500) {
  auto session = newSession();
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {});
  session->onNext(pool.chunk("never sent"));
  session->onError(std::make_exception_ptr(std::runtime_error("second chunk failed")));

  auto resp = wireResponse();
  EXPECT_EQ(resp.statusCode, http::StatusCodeInternalServerError);
  EXPECT_TRUE(resp.chunked);
  EXPECT_TRUE(resp.body.empty());
  EXPECT_EQ(Header(resp.trailers, "stream-status"), "500");
  EXPECT_EQ(recording->wire().find("never sent"), std::string::npos);
  EXPECT_EQ(pool.outstanding(), 0U);
}

TEST_F(ResponseSessionTest, ErrorWithContentLengthClosesTheConnection) {
  auto session = newSession();
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {{"Content-Length", "10"}});
  session->onNext(pool.chunk("01234"));
  session->onError(std::make_exception_ptr(std::runtime_error("truncated")));
  test::drainEventLoop(loop);

  EXPECT_TRUE(recording->wire().ends_with("01234"));
  EXPECT_EQ(recording->nbCloses(), 1U);
  EXPECT_EQ(recording->nbReads(), 0U);
  EXPECT_TRUE(session->whenCompleted().isFailed());
}

TEST_F(ResponseSessionTest, WebSocketUpgradeFlushesHeadImmediately) {
  auto session = newSession();
  session->writeStatusAndHeaders(http::Status(http::StatusCodeSwitchingProtocols),
                                 {{"Upgrade", "websocket"}, {"Connection", "Upgrade"}});
  EXPECT_TRUE(session->isWebSocketUpgrade());
  test::drainEventLoop(loop);

  ASSERT_EQ(recording->ops().size(), 2U);
  EXPECT_EQ(recording->ops()[1], "flush");
  EXPECT_TRUE(session->whenHeadersCompleted().isDone());

  auto resp = test::parseResponse(recording->wire());
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->statusCode, http::StatusCodeSwitchingProtocols);
  EXPECT_EQ(Header(resp->headers, "Connection"), "Upgrade");
  EXPECT_FALSE(resp->headers.contains("Transfer-Encoding"));
  EXPECT_FALSE(resp->headers.contains("Content-Length"));

  session->onNext(DataChunk::Copy("\x81\x02hi", true));
  test::drainEventLoop(loop);
  EXPECT_TRUE(recording->wire().ends_with("\r\n\r\n\x81\x02hi"));
}

TEST_F(ResponseSessionTest, NoEntityStatusDropsBody) {
  auto session = newSession();
  auto subscription = subscribe(*session);
  session->writeStatusAndHeaders(http::Status(http::StatusCodeNoContent), {});
  session->onNext(pool.chunk("ignored"));
  session->onComplete();
  test::drainEventLoop(loop);

  const std::string wire = recording->wire();
  EXPECT_TRUE(wire.ends_with("\r\n\r\n"));
  EXPECT_EQ(wire.find("ignored"), std::string::npos);
  EXPECT_EQ(wire.find("Transfer-Encoding"), std::string::npos);
  EXPECT_EQ(wire.find("Content-Length"), std::string::npos);
  EXPECT_EQ(pool.outstanding(), 0U);
  EXPECT_EQ(subscription->requested(), 2);
  EXPECT_EQ(recording->nbReads(), 1U);
}

TEST_F(ResponseSessionTest, FlushMarkerDoesNotDefeatLengthOptimization) {
  auto session = newSession();
  auto subscription = subscribe(*session);
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {});
  session->onNext(DataChunk::FlushMarker());
  session->onNext(pool.chunk("data"));
  session->onComplete();

  auto resp = wireResponse();
  EXPECT_EQ(Header(resp.headers, "Content-Length"), "4");
  EXPECT_EQ(resp.body, "data");
  EXPECT_EQ(recording->nbFlushes(), 2U);
  EXPECT_EQ(subscription->requested(), 3);
}

TEST_F(ResponseSessionTest, ChunkBeforeHeadersIsRejected) {
  auto session = newSession();
  EXPECT_THROW(session->onNext(pool.chunk("early")), std::logic_error);
  EXPECT_EQ(pool.outstanding(), 0U);
}

TEST_F(ResponseSessionTest, ChunkAfterCompletionIsRejected) {
  auto session = newSession();
  session->onComplete();
  EXPECT_THROW(session->onNext(pool.chunk("late")), std::logic_error);
  EXPECT_EQ(pool.outstanding(), 0U);
}

TEST_F(ResponseSessionTest, CreditIsRenewedOnceChunkIsQueued) {
  auto session = newSession();
  session->writeStatusAndHeaders(http::Status(http::StatusCodeCreated), {});
  auto subscription = subscribe(*session);
  EXPECT_EQ(subscription->requested(), 1);

  session->onNext(pool.chunk("abc"));
  EXPECT_EQ(subscription->requested(), 1);
  test::drainEventLoop(loop);
  EXPECT_EQ(subscription->requested(), 2);

  session->onComplete();
  EXPECT_TRUE(subscription->cancelled());
}

TEST_F(ResponseSessionTest, CreditWaitsForWriteWhenChannelIsBacklogged) {
  recording->setWritable(false);
  recording->holdWrites();
  auto session = newSession();
  session->writeStatusAndHeaders(http::Status(http::StatusCodeCreated), {});
  auto subscription = subscribe(*session);

  session->onNext(pool.chunk("abc"));
  test::drainEventLoop(loop);
  EXPECT_EQ(subscription->requested(), 1);
  EXPECT_EQ(recording->nbHeldWrites(), 2U);

  recording->setWritable(true);
  recording->releaseHeldWrites();
  test::drainEventLoop(loop);
  EXPECT_EQ(subscription->requested(), 2);

  // Room again: the next chunk is credited as soon as it is queued, even if its write is still pending.
  session->onNext(pool.chunk("def"));
  test::drainEventLoop(loop);
  EXPECT_EQ(subscription->requested(), 3);
  EXPECT_EQ(recording->nbHeldWrites(), 1U);

  recording->holdWrites(false);
  recording->releaseHeldWrites();
  session->onComplete();
  test::drainEventLoop(loop);
  EXPECT_TRUE(session->whenCompleted().isDone());
  EXPECT_EQ(pool.outstanding(), 0U);
}

TEST_F(ResponseSessionTest, OnlyFirstSubscriptionIsKept) {
  auto session = newSession();
  auto first = subscribe(*session);
  auto second = subscribe(*session);
  EXPECT_EQ(first->requested(), 1);
  EXPECT_FALSE(first->cancelled());
  EXPECT_EQ(second->requested(), 0);
  EXPECT_TRUE(second->cancelled());
  EXPECT_THROW(session->onSubscribe(nullptr), std::invalid_argument);
  session->onComplete();
}

TEST_F(ResponseSessionTest, SubscriptionAfterCompletionIsCancelled) {
  auto session = newSession();
  session->onComplete();
  auto subscription = subscribe(*session);
  EXPECT_TRUE(subscription->cancelled());
  EXPECT_EQ(subscription->requested(), 0);
}

TEST_F(ResponseSessionTest, WriteFailureFailsTheResponse) {
  recording->failNextWrite(std::make_exception_ptr(TransportError("Connection reset by peer")));
  auto session = newSession();
  auto subscription = subscribe(*session);
  session->writeStatusAndHeaders(http::Status(http::StatusCodeCreated), {});
  test::drainEventLoop(loop);

  EXPECT_TRUE(session->whenHeadersCompleted().isFailed());
  EXPECT_TRUE(session->whenCompleted().isFailed());
  EXPECT_TRUE(session->whenTerminalSubmitted().isDone());
  EXPECT_TRUE(subscription->cancelled());
  EXPECT_FALSE(recording->isOpen());

  // Late producer calls do not throw, their chunks are released.
  EXPECT_NO_THROW(session->onNext(pool.chunk("late")));
  EXPECT_NO_THROW(session->onComplete());
  test::drainEventLoop(loop);
  EXPECT_EQ(pool.outstanding(), 0U);
  EXPECT_EQ(counters->snapshot().nbResponsesFailed, 1U);
  EXPECT_EQ(counters->snapshot().nbResponsesCompleted, 0U);
}

TEST_F(ResponseSessionTest, HeadersCompletedBeforeBodyEnds) {
  auto session = newSession();
  session->writeStatusAndHeaders(http::Status(http::StatusCodeCreated), {});
  test::drainEventLoop(loop);
  EXPECT_TRUE(session->whenHeadersCompleted().isDone());
  EXPECT_FALSE(session->whenCompleted().isDone());
  EXPECT_FALSE(session->whenTerminalSubmitted().isDone());
  session->onComplete();
  test::drainEventLoop(loop);
  EXPECT_TRUE(session->whenTerminalSubmitted().isDone());
  EXPECT_TRUE(session->whenCompleted().isDone());
}

TEST_F(ResponseSessionTest, StreamIdHeaderIsCopiedFromRequest) {
  ExchangeContext ctx = exchange();
  ctx.requestHeaders.add("X-HTTP2-Stream-Id", "7");
  auto session = newSession(std::move(ctx));
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {});
  session->onComplete();

  auto resp = wireResponse();
  EXPECT_EQ(Header(resp.headers, "x-http2-stream-id"), "7");
}

TEST_F(ResponseSessionTest, UnconsumedEntityIsDrainedBeforeKeepAlive) {
  auto entity = std::make_shared<test::FakeRequestEntity>(false, false);
  ExchangeContext ctx = exchange();
  ctx.entity = entity;
  auto session = newSession(std::move(ctx));
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {{"Content-Length", "2"}});
  session->onNext(pool.chunk("ok"));
  session->onComplete();
  test::drainEventLoop(loop);

  EXPECT_EQ(entity->nbDrains(), 1U);
  EXPECT_TRUE(recording->wire().empty());

  entity->completeDrain();
  auto resp = wireResponse();
  EXPECT_EQ(Header(resp.headers, "Connection"), "keep-alive");
  EXPECT_EQ(resp.body, "ok");
  EXPECT_EQ(recording->nbReads(), 1U);
}

TEST_F(ResponseSessionTest, FailedDrainClosesTheConnection) {
  auto entity = std::make_shared<test::FakeRequestEntity>(false, false);
  ExchangeContext ctx = exchange();
  ctx.entity = entity;
  auto session = newSession(std::move(ctx));
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {});
  session->onComplete();
  entity->failDrain(std::make_exception_ptr(std::runtime_error("entity too large")));

  auto resp = wireResponse();
  EXPECT_EQ(Header(resp.headers, "Connection"), "close");
  EXPECT_EQ(recording->nbCloses(), 1U);
  EXPECT_FALSE(session->whenCompleted().isFailed());
}

TEST_F(ResponseSessionTest, EntityBeingReadClosesTheConnection) {
  auto entity = std::make_shared<test::FakeRequestEntity>(false, true);
  ExchangeContext ctx = exchange();
  ctx.entity = entity;
  auto session = newSession(std::move(ctx));
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {});
  session->onComplete();

  auto resp = wireResponse();
  EXPECT_EQ(Header(resp.headers, "Connection"), "close");
  EXPECT_EQ(entity->nbDrains(), 0U);
  EXPECT_EQ(recording->nbCloses(), 1U);
}

TEST_F(ResponseSessionTest, UnconsumedEntityClosesWhenDrainIsDisabled) {
  config.withDrainUnconsumedEntity(false);
  auto entity = std::make_shared<test::FakeRequestEntity>(false, false);
  ExchangeContext ctx = exchange();
  ctx.entity = entity;
  auto session = newSession(std::move(ctx));
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {});
  session->onComplete();

  auto resp = wireResponse();
  EXPECT_EQ(Header(resp.headers, "Connection"), "close");
  EXPECT_EQ(entity->nbDrains(), 0U);
}

TEST_F(ResponseSessionTest, ClosingResponseDiscardsEntityWithoutWaiting) {
  auto entity = std::make_shared<test::FakeRequestEntity>(false, false);
  ExchangeContext ctx = exchange(false);
  ctx.entity = entity;
  auto session = newSession(std::move(ctx));
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {});
  session->onComplete();

  auto resp = wireResponse();
  EXPECT_EQ(entity->nbDrains(), 1U);
  EXPECT_EQ(Header(resp.headers, "Connection"), "close");
  EXPECT_EQ(recording->nbCloses(), 1U);
}

TEST_F(ResponseSessionTest, ConsumedEntityKeepsAlive) {
  auto entity = std::make_shared<test::FakeRequestEntity>(true, true);
  ExchangeContext ctx = exchange();
  ctx.entity = entity;
  auto session = newSession(std::move(ctx));
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {});
  session->onComplete();

  auto resp = wireResponse();
  EXPECT_EQ(Header(resp.headers, "Connection"), "keep-alive");
  EXPECT_EQ(entity->nbDrains(), 0U);
}

TEST_F(ResponseSessionTest, ProducerOnOtherThreadWritesOnLoopThread) {
  auto session = newSession();
  std::thread producer([&] {
    session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {});
    for (int i = 0; i < 10; ++i) {
      session->onNext(pool.chunk(std::to_string(i)));
    }
    session->onComplete();
  });
  producer.join();

  auto resp = wireResponse();
  EXPECT_EQ(resp.body, "0123456789");
  EXPECT_TRUE(resp.chunked);
  EXPECT_TRUE(recording->allCallsOnLoopThread());
  EXPECT_EQ(pool.outstanding(), 0U);
}

TEST_F(ResponseSessionTest, WritesWaitForPreviousResponse) {
  Completion previous;
  auto session = ResponseSession::Create(channel, exchange(), previous, config, counters);
  session->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {});
  session->onNext(pool.chunk("second"));
  session->onComplete();
  test::drainEventLoop(loop);
  EXPECT_EQ(recording->nbWrites(), 0U);
  EXPECT_FALSE(session->whenTerminalSubmitted().isDone());

  previous.complete();
  auto resp = wireResponse();
  EXPECT_EQ(resp.body, "second");
  EXPECT_TRUE(session->whenTerminalSubmitted().isDone());
}

}  // namespace conduit
