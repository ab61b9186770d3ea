#pragma once

#include <rediswire/resp2/type.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace rediswire::resp2 {

// Forward declaration
struct message;

/// Simple string value (+)
struct simple_string {
  static constexpr type type_id = type::simple_string;
  std::string data;

  auto operator==(simple_string const&) const -> bool = default;
};

/// Simple error value (-)
/// `kind` is the leading uppercase token, `message` the text after the separator.
struct simple_error {
  static constexpr type type_id = type::simple_error;
  std::string kind;
  std::string message;

  auto operator==(simple_error const&) const -> bool = default;
};

/// Integer value (:)
struct integer {
  static constexpr type type_id = type::integer;
  std::int64_t value;

  auto operator==(integer const&) const -> bool = default;
};

/// Bulk string value ($)
///
/// The payload is raw bytes: it may contain NUL, CR, LF or invalid UTF-8.
struct bulk_string {
  static constexpr type type_id = type::bulk_string;
  std::vector<std::byte> data;

  /// Copy `bytes` verbatim into a new bulk string.
  [[nodiscard]] static auto copy_of(std::string_view bytes) -> bulk_string {
    auto const* first = reinterpret_cast<std::byte const*>(bytes.data());
    return bulk_string{.data = std::vector<std::byte>(first, first + bytes.size())};
  }

  /// Payload reinterpreted as chars. No decoding takes place.
  [[nodiscard]] auto view() const noexcept -> std::string_view {
    return {reinterpret_cast<char const*>(data.data()), data.size()};
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t { return data.size(); }

  auto operator==(bulk_string const&) const -> bool = default;
};

/// Null bulk string ($-1)
struct null_bulk_string {
  static constexpr type type_id = type::null_bulk_string;

  auto operator==(null_bulk_string const&) const -> bool = default;
};

/// Array value (*)
struct array {
  static constexpr type type_id = type::array;
  std::vector<message> elements;
};

// Defined in message.hpp, once `message` is complete.
inline auto operator==(array const& lhs, array const& rhs) -> bool;

/// Null array (*-1)
struct null_array {
  static constexpr type type_id = type::null_array;

  auto operator==(null_array const&) const -> bool = default;
};

}  // namespace rediswire::resp2
