#pragma once

#include <rediswire/resp2/error.hpp>

#include <string>

namespace rediswire::resp2 {

namespace detail {

struct error_category_impl : std::error_category {
  auto name() const noexcept -> const char* override {
    return "resp2";
  }

  auto message(int ev) const -> std::string override {
    // clang-format off
    switch (static_cast<error>(ev)) {
      case error::unrecognized_type:        return "unrecognized type byte";
      case error::empty_content:            return "empty simple string";
      case error::empty_kind:               return "missing or mixed-case error kind";
      case error::missing_separator:        return "missing separator after error kind";
      case error::malformed_terminator:     return "malformed CRLF terminator";
      case error::malformed_digits:         return "malformed integer digits";
      case error::overflow:                 return "integer overflow";
      case error::invalid_length:           return "invalid length";
      case error::truncated_payload:        return "truncated bulk string payload";
      case error::truncated_elements:       return "truncated array elements";
      case error::recursion_limit_exceeded: return "array nesting too deep";
      case error::limit_exceeded:           return "size limit exceeded";
      case error::parser_failed:            return "parser failed on an earlier frame";
      default:                              return "unknown error";
    }
    // clang-format on
  }
};

inline auto category() -> std::error_category const& {
  static error_category_impl instance;
  return instance;
}

}  // namespace detail

inline auto make_error_code(error e) -> std::error_code {
  return {static_cast<int>(e), detail::category()};
}

}  // namespace rediswire::resp2
