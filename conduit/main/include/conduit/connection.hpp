#pragma once

#include <cstdint>
#include <memory>
#include <mutex>

#include "conduit/completion.hpp"
#include "conduit/exchange-context.hpp"
#include "conduit/net-channel.hpp"
#include "conduit/ordered-channel.hpp"
#include "conduit/pipeline-config.hpp"
#include "conduit/pipeline-stats.hpp"
#include "conduit/response-session.hpp"

namespace conduit {

// Response side of one HTTP/1.1 connection.
//
// Creates the ResponseSession of each pipelined request, in request order, each one chained behind the terminal
// submission of the previous one so that response bytes never interleave even if later responses are produced
// first. Once PipelineConfig::maxRequestsPerConnection responses were created, the last one closes the connection.
class Connection {
 public:
  // Throws std::invalid_argument if 'channel' is null or 'config' is invalid.
  Connection(std::shared_ptr<NetChannel> channel, PipelineConfig config);

  Connection(const Connection&) = delete;
  Connection(Connection&&) = delete;
  Connection& operator=(const Connection&) = delete;
  Connection& operator=(Connection&&) = delete;

  ~Connection() = default;

  // Must be called in request order. Thread safe.
  std::shared_ptr<ResponseSession> newResponse(ExchangeContext exchange);

  [[nodiscard]] NetChannel& channel() noexcept { return _orderedChannel->channel(); }

  [[nodiscard]] const std::shared_ptr<OrderedChannel>& orderedChannel() const noexcept { return _orderedChannel; }

  [[nodiscard]] PipelineStats stats() const noexcept { return _counters->snapshot(); }

  [[nodiscard]] const PipelineConfig& config() const noexcept { return _config; }

  [[nodiscard]] uint32_t nbResponses() const;

 private:
  PipelineConfig _config;
  std::shared_ptr<OrderedChannel> _orderedChannel;
  std::shared_ptr<internal::PipelineCounters> _counters;
  mutable std::mutex _mutex;
  Completion _previousTerminal;
  uint32_t _nbResponses{0};
};

}  // namespace conduit
