#pragma once

#include "conduit/completion.hpp"

namespace conduit {

// View of an inbound request body, as seen by the response side of the exchange.
class RequestEntity {
 public:
  virtual ~RequestEntity() = default;

  // True once the body was entirely consumed by the handler (or was empty).
  [[nodiscard]] virtual bool consumed() const = 0;

  // True if the handler subscribed to the body and requested data from it.
  [[nodiscard]] virtual bool dataRequested() const = 0;

  // Discards the remaining body bytes (releasing their buffers) without handing them to the handler.
  // The returned Completion settles once the body end was reached, or fails if the body could not be read.
  virtual Completion drain() = 0;
};

}  // namespace conduit
