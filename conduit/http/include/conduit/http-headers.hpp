#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conduit {

// Ordered, multi-valued HTTP header map with case-insensitive name lookup.
// Insertion order is preserved for emission.
class HttpHeaders {
 public:
  struct Entry {
    std::string name;
    std::string value;

    bool operator==(const Entry&) const noexcept = default;
  };

  using const_iterator = std::vector<Entry>::const_iterator;

  HttpHeaders() noexcept = default;

  HttpHeaders(std::initializer_list<Entry> entries);

  // Appends a header, keeping existing ones with the same name.
  HttpHeaders& add(std::string_view name, std::string_view value);

  // Replaces all values of 'name' by a single one, at the position of the first occurrence (or at the end).
  HttpHeaders& set(std::string_view name, std::string_view value);

  // Appends the header only if no header with this name exists.
  // Returns true if it was added.
  bool setIfAbsent(std::string_view name, std::string_view value);

  // Removes all headers named 'name'. Returns the number of removed entries.
  std::size_t remove(std::string_view name);

  // Returns the first value of 'name', if any.
  [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept;

  [[nodiscard]] std::vector<std::string_view> getAll(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return get(name).has_value(); }

  // Tells whether any value of header 'name', read as a comma separated token list, contains 'token' (ignoring case).
  [[nodiscard]] bool containsToken(std::string_view name, std::string_view token) const noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }

  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _entries.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _entries.end(); }

  bool operator==(const HttpHeaders&) const noexcept = default;

 private:
  std::vector<Entry> _entries;
};

}  // namespace conduit
