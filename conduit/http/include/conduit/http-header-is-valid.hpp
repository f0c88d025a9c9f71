#pragma once

#include <algorithm>
#include <string>
#include <string_view>

namespace conduit::http {

// RFC 9110 token character.
constexpr bool IsTokenChar(char ch) noexcept {
  if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
    return true;
  }
  return std::string_view("!#$%&'*+-.^_`|~").find(ch) != std::string_view::npos;
}

// Visible ASCII or horizontal tab. CR, LF and other control characters would break the message framing.
constexpr bool IsFieldValueChar(char ch) noexcept {
  const auto uch = static_cast<unsigned char>(ch);
  return uch == '\t' || (uch >= 0x20 && uch <= 0x7E);
}

constexpr bool IsValidHeaderName(std::string_view name) noexcept {
  return !name.empty() && std::ranges::all_of(name, IsTokenChar);
}

constexpr bool IsValidHeaderValue(std::string_view value) noexcept {
  return std::ranges::all_of(value, IsFieldValueChar);
}

// Copy of 'value' where every character not allowed in a field value is replaced by a space.
// Used for values built from untrusted text, such as exception messages.
inline std::string SanitizeHeaderValue(std::string_view value) {
  std::string out(value);
  std::ranges::replace_if(out, [](char ch) { return !IsFieldValueChar(ch); }, ' ');
  return out;
}

}  // namespace conduit::http
