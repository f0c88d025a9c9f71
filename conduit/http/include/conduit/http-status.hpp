#pragma once

#include <string>
#include <string_view>

#include "conduit/http-constants.hpp"
#include "conduit/http-status-code.hpp"

namespace conduit::http {

// Status line content of a response: numeric code and reason phrase.
struct Status {
  Status() = default;

  // Uses the canonical reason phrase for 'code' when known.
  explicit Status(StatusCode code) : code(code), reason(ReasonPhraseFor(code)) {}

  Status(StatusCode code, std::string_view reason) : code(code), reason(reason) {}

  bool operator==(const Status&) const noexcept = default;

  StatusCode code{StatusCodeOK};
  std::string reason{ReasonOK};
};

}  // namespace conduit::http
