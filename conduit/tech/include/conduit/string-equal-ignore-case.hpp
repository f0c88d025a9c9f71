#pragma once

#include <cstddef>
#include <string_view>

namespace conduit {

constexpr char tolower(char ch) noexcept {
  auto uch = static_cast<unsigned char>(ch);
  if (uch >= 'A' && uch <= 'Z') {
    uch |= 0x20;
  }
  return static_cast<char>(uch);
}

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (tolower(lhs[pos]) != tolower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) noexcept {
  return value.size() >= prefix.size() && CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

// Tells whether the comma separated token list 'list' (e.g. "keep-alive, Upgrade") contains 'token',
// ignoring case and optional whitespace around each element.
constexpr bool ContainsTokenIgnoreCase(std::string_view list, std::string_view token) noexcept {
  while (!list.empty()) {
    const std::size_t commaPos = list.find(',');
    std::string_view elem = list.substr(0, commaPos);
    while (!elem.empty() && (elem.front() == ' ' || elem.front() == '\t')) {
      elem.remove_prefix(1);
    }
    while (!elem.empty() && (elem.back() == ' ' || elem.back() == '\t')) {
      elem.remove_suffix(1);
    }
    if (CaseInsensitiveEqual(elem, token)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    list.remove_prefix(commaPos + 1);
  }
  return false;
}

}  // namespace conduit
