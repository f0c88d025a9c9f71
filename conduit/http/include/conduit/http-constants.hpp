#pragma once

#include <string_view>

#include "conduit/http-status-code.hpp"

namespace conduit::http {

// Header names are stored in canonical form for emission; comparisons must remain case-insensitive.
// Header value tokens are kept lowercase.

inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

// Standard header field names
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Upgrade = "Upgrade";

// Correlation header copied verbatim from the request to the response
inline constexpr std::string_view StreamIdHeader = "x-http2-stream-id";

// Trailers describing a failed streamed body
inline constexpr std::string_view StreamStatusTrailer = "stream-status";
inline constexpr std::string_view StreamResultTrailer = "stream-result";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";

// Common header values
inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view close = "close";
inline constexpr std::string_view chunked = "chunked";
inline constexpr std::string_view websocket = "websocket";

inline constexpr std::string_view ContentTypeEventStream = "text/event-stream";

// Terminal frame of a chunked body without trailers
inline constexpr std::string_view LastChunkNoTrailers = "0\r\n\r\n";

// Reason phrases
inline constexpr std::string_view ReasonSwitchingProtocols = "Switching Protocols";
inline constexpr std::string_view ReasonOK = "OK";
inline constexpr std::string_view ReasonCreated = "Created";
inline constexpr std::string_view ReasonAccepted = "Accepted";
inline constexpr std::string_view ReasonNoContent = "No Content";
inline constexpr std::string_view ReasonResetContent = "Reset Content";
inline constexpr std::string_view ReasonPartialContent = "Partial Content";
inline constexpr std::string_view ReasonMovedPermanently = "Moved Permanently";
inline constexpr std::string_view ReasonFound = "Found";
inline constexpr std::string_view ReasonNotModified = "Not Modified";
inline constexpr std::string_view ReasonBadRequest = "Bad Request";
inline constexpr std::string_view ReasonNotFound = "Not Found";
inline constexpr std::string_view ReasonMethodNotAllowed = "Method Not Allowed";
inline constexpr std::string_view ReasonPayloadTooLarge = "Payload Too Large";
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";
inline constexpr std::string_view ReasonNotImplemented = "Not Implemented";
inline constexpr std::string_view ReasonServiceUnavailable = "Service Unavailable";

// Return the canonical reason phrase for a subset of status codes, or an empty string.
constexpr std::string_view ReasonPhraseFor(StatusCode status) noexcept {
  switch (status) {
    case StatusCodeSwitchingProtocols:
      return ReasonSwitchingProtocols;
    case StatusCodeOK:
      return ReasonOK;
    case StatusCodeCreated:
      return ReasonCreated;
    case StatusCodeAccepted:
      return ReasonAccepted;
    case StatusCodeNoContent:
      return ReasonNoContent;
    case StatusCodeResetContent:
      return ReasonResetContent;
    case StatusCodePartialContent:
      return ReasonPartialContent;
    case StatusCodeMovedPermanently:
      return ReasonMovedPermanently;
    case StatusCodeFound:
      return ReasonFound;
    case StatusCodeNotModified:
      return ReasonNotModified;
    case StatusCodeBadRequest:
      return ReasonBadRequest;
    case StatusCodeNotFound:
      return ReasonNotFound;
    case StatusCodeMethodNotAllowed:
      return ReasonMethodNotAllowed;
    case StatusCodePayloadTooLarge:
      return ReasonPayloadTooLarge;
    case StatusCodeInternalServerError:
      return ReasonInternalServerError;
    case StatusCodeNotImplemented:
      return ReasonNotImplemented;
    case StatusCodeServiceUnavailable:
      return ReasonServiceUnavailable;
    default:
      return {};
  }
}

// Statuses whose responses never carry a body (no chunked framing, no Content-Length computation).
constexpr bool IsNoEntityStatus(StatusCode status) noexcept {
  return status == StatusCodeNoContent || status == StatusCodeResetContent || status == StatusCodeNotModified;
}

}  // namespace conduit::http
