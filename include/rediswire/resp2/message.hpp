#pragma once

#include <rediswire/resp2/type.hpp>
#include <rediswire/resp2/value.hpp>

#include <concepts>
#include <type_traits>
#include <utility>
#include <variant>

namespace rediswire::resp2 {

namespace detail {

template <typename T>
concept has_type_id = requires {
  { T::type_id } -> std::convertible_to<type>;
};

template <typename... Ts>
constexpr bool all_have_type_id = (has_type_id<Ts> && ...);

}  // namespace detail

// clang-format off

/// A complete decoded RESP2 value.
///
/// A message owns every byte it carries; it holds no reference into the buffer it was
/// decoded from. Arrays nest messages, so one message is the root of a value tree.
struct message {
  using value_type = std::variant<
    simple_string,
    simple_error,
    integer,
    bulk_string,
    null_bulk_string,
    array,
    null_array
  >;

  static_assert(detail::all_have_type_id<
    simple_string, simple_error, integer, bulk_string, null_bulk_string, array, null_array
  >, "All RESP2 value types must have a static type_id member");

  value_type value;

  // Default constructor - creates a null bulk string (the RESP2 "nil")
  message() : value(null_bulk_string{}) {}

  template <typename T>
    requires std::constructible_from<value_type, T>
  explicit message(T&& val) : value(std::forward<T>(val)) {}

  /// Uses the alternative's type_id rather than the variant index.
  [[nodiscard]] auto get_type() const -> type {
    return std::visit([](const auto& val) -> type {
      using T = std::decay_t<decltype(val)>;
      return T::type_id;
    }, value);
  }

  template <typename T>
  [[nodiscard]] bool is() const {
    return std::holds_alternative<T>(value);
  }

  /// Throws std::bad_variant_access if the type doesn't match
  template <typename T>
  [[nodiscard]] auto as() -> T& {
    return std::get<T>(value);
  }

  template <typename T>
  [[nodiscard]] auto as() const -> const T& {
    return std::get<T>(value);
  }

  /// Returns nullptr if the type doesn't match
  template <typename T>
  [[nodiscard]] auto try_as() -> T* {
    return std::get_if<T>(&value);
  }

  template <typename T>
  [[nodiscard]] auto try_as() const -> const T* {
    return std::get_if<T>(&value);
  }

  /// Null bulk string or null array
  [[nodiscard]] bool is_null() const {
    return is<null_bulk_string>() || is<null_array>();
  }

  [[nodiscard]] bool is_aggregate() const {
    return is<array>();
  }

  [[nodiscard]] bool is_error() const {
    return is<simple_error>();
  }

  /// Simple or bulk string
  [[nodiscard]] bool is_string() const {
    return is<simple_string>() || is<bulk_string>();
  }

  auto operator==(message const& other) const -> bool {
    return value == other.value;
  }
};

// clang-format on

inline auto operator==(array const& lhs, array const& rhs) -> bool {
  return lhs.elements == rhs.elements;
}

}  // namespace rediswire::resp2
