#pragma once

// Umbrella header of the response pipeline.

#include "conduit/buffer-pool.hpp"
#include "conduit/channel-errors.hpp"
#include "conduit/completion.hpp"
#include "conduit/connection.hpp"
#include "conduit/data-chunk.hpp"
#include "conduit/event-loop.hpp"
#include "conduit/exchange-context.hpp"
#include "conduit/http-constants.hpp"
#include "conduit/http-headers.hpp"
#include "conduit/http-status-code.hpp"
#include "conduit/http-status.hpp"
#include "conduit/log.hpp"
#include "conduit/net-channel.hpp"
#include "conduit/ordered-channel.hpp"
#include "conduit/pipeline-config.hpp"
#include "conduit/pipeline-stats.hpp"
#include "conduit/request-entity.hpp"
#include "conduit/response-session.hpp"
#include "conduit/socket-channel.hpp"
#include "conduit/socket-ops.hpp"
#include "conduit/subscription.hpp"
