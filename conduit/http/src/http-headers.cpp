#include "conduit/http-headers.hpp"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "conduit/string-equal-ignore-case.hpp"

namespace conduit {

HttpHeaders::HttpHeaders(std::initializer_list<Entry> entries) : _entries(entries) {}

HttpHeaders& HttpHeaders::add(std::string_view name, std::string_view value) {
  _entries.emplace_back(std::string(name), std::string(value));
  return *this;
}

HttpHeaders& HttpHeaders::set(std::string_view name, std::string_view value) {
  auto it = std::ranges::find_if(_entries, [name](const Entry& entry) { return CaseInsensitiveEqual(entry.name, name); });
  if (it == _entries.end()) {
    return add(name, value);
  }
  it->value.assign(value);
  auto nextIt = std::remove_if(std::next(it), _entries.end(),
                               [name](const Entry& entry) { return CaseInsensitiveEqual(entry.name, name); });
  _entries.erase(nextIt, _entries.end());
  return *this;
}

bool HttpHeaders::setIfAbsent(std::string_view name, std::string_view value) {
  if (contains(name)) {
    return false;
  }
  add(name, value);
  return true;
}

std::size_t HttpHeaders::remove(std::string_view name) {
  return std::erase_if(_entries, [name](const Entry& entry) { return CaseInsensitiveEqual(entry.name, name); });
}

std::optional<std::string_view> HttpHeaders::get(std::string_view name) const noexcept {
  for (const Entry& entry : _entries) {
    if (CaseInsensitiveEqual(entry.name, name)) {
      return std::string_view(entry.value);
    }
  }
  return std::nullopt;
}

std::vector<std::string_view> HttpHeaders::getAll(std::string_view name) const {
  std::vector<std::string_view> values;
  for (const Entry& entry : _entries) {
    if (CaseInsensitiveEqual(entry.name, name)) {
      values.emplace_back(entry.value);
    }
  }
  return values;
}

bool HttpHeaders::containsToken(std::string_view name, std::string_view token) const noexcept {
  return std::ranges::any_of(_entries, [name, token](const Entry& entry) {
    return CaseInsensitiveEqual(entry.name, name) && ContainsTokenIgnoreCase(entry.value, token);
  });
}

}  // namespace conduit
