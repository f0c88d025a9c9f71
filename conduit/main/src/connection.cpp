#include "conduit/connection.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

#include "conduit/completion.hpp"
#include "conduit/exchange-context.hpp"
#include "conduit/log.hpp"
#include "conduit/net-channel.hpp"
#include "conduit/ordered-channel.hpp"
#include "conduit/pipeline-config.hpp"
#include "conduit/pipeline-stats.hpp"
#include "conduit/response-session.hpp"

namespace conduit {

Connection::Connection(std::shared_ptr<NetChannel> channel, PipelineConfig config)
    : _config(std::move(config)),
      _orderedChannel(OrderedChannel::Create(std::move(channel))),
      _counters(std::make_shared<internal::PipelineCounters>()),
      _previousTerminal(Completion::Completed()) {
  _config.validate();
}

std::shared_ptr<ResponseSession> Connection::newResponse(ExchangeContext exchange) {
  std::lock_guard lock(_mutex);
  ++_nbResponses;
  const bool forceClose = _nbResponses >= _config.maxRequestsPerConnection;
  if (_nbResponses > _config.maxRequestsPerConnection) [[unlikely]] {
    log::warn("Connection # {} response # {} exceeds the limit of {} requests", _orderedChannel->id(), _nbResponses,
              _config.maxRequestsPerConnection);
  } else if (forceClose) {
    log::debug("Connection # {} reached {} requests, closing after this response", _orderedChannel->id(),
               _nbResponses);
  }
  _counters->nbResponsesStarted.fetch_add(1, std::memory_order_relaxed);

  auto session = ResponseSession::Create(_orderedChannel, std::move(exchange), _previousTerminal, _config, _counters,
                                         forceClose);
  _previousTerminal = session->whenTerminalSubmitted();
  return session;
}

uint32_t Connection::nbResponses() const {
  std::lock_guard lock(_mutex);
  return _nbResponses;
}

}  // namespace conduit
