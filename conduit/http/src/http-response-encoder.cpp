#include "conduit/http-response-encoder.hpp"

#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <iterator>
#include <string>

#include "conduit/http-constants.hpp"
#include "conduit/http-headers.hpp"
#include "conduit/http-status.hpp"

namespace conduit::http {

namespace {

void WriteHeaderCRLF(std::string& out, const HttpHeaders& headers) {
  for (const auto& [name, value] : headers) {
    out.append(name);
    out.append(HeaderSep);
    out.append(value);
    out.append(CRLF);
  }
}

std::size_t HeadersSize(const HttpHeaders& headers) {
  std::size_t size = 0;
  for (const auto& [name, value] : headers) {
    size += name.size() + HeaderSep.size() + value.size() + CRLF.size();
  }
  return size;
}

}  // namespace

std::string EncodeResponseHead(const Status& status, const HttpHeaders& headers) {
  std::string out;
  out.reserve(HTTP11Sv.size() + 5U + status.reason.size() + CRLF.size() + HeadersSize(headers) + CRLF.size());
  out.append(HTTP11Sv);
  fmt::format_to(std::back_inserter(out), " {} ", status.code);
  out.append(status.reason);
  out.append(CRLF);
  WriteHeaderCRLF(out, headers);
  out.append(CRLF);
  return out;
}

std::string EncodeChunkPrefix(std::size_t size) { return fmt::format("{:x}\r\n", size); }

std::string EncodeLastChunk(const HttpHeaders& trailers) {
  if (trailers.empty()) {
    return std::string(LastChunkNoTrailers);
  }
  std::string out;
  out.reserve(3U + HeadersSize(trailers) + CRLF.size());
  out.append("0\r\n");
  WriteHeaderCRLF(out, trailers);
  out.append(CRLF);
  return out;
}

}  // namespace conduit::http
