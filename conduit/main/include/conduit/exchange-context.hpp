#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "conduit/http-headers.hpp"
#include "conduit/request-entity.hpp"

namespace conduit {

// Per exchange information handed by the protocol layer when a response is created.
struct ExchangeContext {
  // Correlation id used in logs.
  uint64_t requestId{0};

  // Whether the request allows the connection to be reused after the response.
  bool keepAlive{true};

  std::string method;

  std::string target;

  HttpHeaders requestHeaders;

  // Request body, or nullptr if the request had none.
  std::shared_ptr<RequestEntity> entity;
};

}  // namespace conduit
