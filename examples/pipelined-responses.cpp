#include <conduit/conduit.hpp>
#include <sys/socket.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>

using namespace conduit;

// Serves two pipelined responses over a socket pair and prints what the client side receives.
// The second response is produced first, from another thread, but still reaches the wire second.
int main() {
  log::set_level(log::level::debug);

  PipelineConfig config;
  config.withPollInterval(std::chrono::milliseconds{10});

  EventLoop loop(config.pollInterval);
  auto [serverFd, clientFd] = CreateSocketPair();
  auto socketChannel = SocketChannel::Create(loop, std::move(serverFd), config);
  Connection connection(socketChannel, config);
  BufferPool pool(config.bufferPoolSlotSize, config.bufferPoolMaxCached);

  auto first = connection.newResponse(ExchangeContext{.requestId = 1, .method = "GET", .target = "/slow"});
  auto second = connection.newResponse(ExchangeContext{.requestId = 2, .method = "GET", .target = "/fast"});

  std::thread fastHandler([&] {
    second->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {{"Content-Type", "text/plain"}});
    second->onNext(pool.chunk("fast response\n"));
    second->onComplete();
  });

  std::thread slowHandler([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    first->writeStatusAndHeaders(http::Status(http::StatusCodeOK), {{"Content-Type", "text/plain"}});
    for (int i = 0; i < 3; ++i) {
      first->onNext(pool.chunk("slow part " + std::to_string(i) + "\n"));
    }
    first->onComplete();
  });

  std::atomic<bool> done{false};
  second->whenCompleted().whenDone([&done](const std::exception_ptr&) { done.store(true); });

  std::string received;
  const auto readClientSide = [&received, fd = clientFd.fd()] {
    char buf[4096];
    for (auto nb = ::recv(fd, buf, sizeof(buf), MSG_DONTWAIT); nb > 0; nb = ::recv(fd, buf, sizeof(buf), MSG_DONTWAIT)) {
      received.append(buf, static_cast<std::size_t>(nb));
    }
  };
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{5};
  while (!done.load() && std::chrono::steady_clock::now() < deadline) {
    loop.runOnce();
    readClientSide();
  }
  readClientSide();

  fastHandler.join();
  slowHandler.join();

  if (!done.load()) {
    std::cerr << "Responses were not completed in time\n";
    return 1;
  }

  const PipelineStats stats = connection.stats();
  std::cout << received << "\n---\n";
  std::cout << "responses completed: " << stats.nbResponsesCompleted << ", chunked: " << stats.nbChunked
            << ", length optimized: " << stats.nbLengthOptimized << ", bytes: " << stats.nbBytesQueued << '\n';
  return 0;
}
