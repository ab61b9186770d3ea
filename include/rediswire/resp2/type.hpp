#pragma once

#include <optional>
#include <string_view>

namespace rediswire::resp2 {

// clang-format off

/// RESP2 value types.
///
/// The two null types share the prefix of their non-null counterpart on the wire
/// (`$-1`, `*-1`) but are distinct values.
enum class type {
  simple_string,    // +
  simple_error,     // -
  integer,          // :
  bulk_string,      // $
  null_bulk_string, // $-1
  array,            // *
  null_array,       // *-1
};

/// Leading prefix byte of a type in the wire format.
[[nodiscard]] constexpr auto type_to_prefix(type t) noexcept -> char {
  switch (t) {
    case type::simple_string:    return '+';
    case type::simple_error:     return '-';
    case type::integer:          return ':';
    case type::bulk_string:      return '$';
    case type::null_bulk_string: return '$';
    case type::array:            return '*';
    case type::null_array:       return '*';
  }
  return '\0';
}

/// Type selected by a leading prefix byte.
/// Never yields a null type: nullness is decided by the length field.
[[nodiscard]] constexpr auto prefix_to_type(char b) noexcept -> std::optional<type> {
  switch (b) {
    case '+': return type::simple_string;
    case '-': return type::simple_error;
    case ':': return type::integer;
    case '$': return type::bulk_string;
    case '*': return type::array;
    default:  return std::nullopt;
  }
}

/// User-readable type name (for diagnostics/logging).
[[nodiscard]] constexpr auto type_name(type t) noexcept -> std::string_view {
  switch (t) {
    case type::simple_string:    return "simple_string";
    case type::simple_error:     return "simple_error";
    case type::integer:          return "integer";
    case type::bulk_string:      return "bulk_string";
    case type::null_bulk_string: return "null_bulk_string";
    case type::array:            return "array";
    case type::null_array:       return "null_array";
  }
  return "<unknown>";
}

// clang-format on

}  // namespace rediswire::resp2
