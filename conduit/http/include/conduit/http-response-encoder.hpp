#pragma once

#include <cstddef>
#include <string>

#include "conduit/http-headers.hpp"
#include "conduit/http-status.hpp"

namespace conduit::http {

// HTTP/1.1 wire encoding of the response parts emitted by a response session.
// Headers are written verbatim and in order; framing headers are the caller's responsibility.

// "HTTP/1.1 <code> <reason>\r\n" followed by each "Name: value\r\n" and the terminating CRLF.
[[nodiscard]] std::string EncodeResponseHead(const Status& status, const HttpHeaders& headers);

// Chunk size line "<hex size>\r\n" preceding a chunk of 'size' bytes (which must be followed by CRLF).
[[nodiscard]] std::string EncodeChunkPrefix(std::size_t size);

// Terminal frame of a chunked body: "0\r\n", trailer fields, then CRLF.
[[nodiscard]] std::string EncodeLastChunk(const HttpHeaders& trailers);

}  // namespace conduit::http
