#pragma once

#include <system_error>
#include <type_traits>

namespace rediswire::resp2 {

/// RESP2 decode errors. Each names the first grammar rule the input violated.
enum class error {
  /// Leading byte is not one of `+ - : $ *`, or the input is empty.
  unrecognized_type = 1,

  /// Simple string (or simple error message) has no characters before CR-LF.
  empty_content,

  /// Simple error has no uppercase kind token, or the token is mixed case.
  empty_kind,

  /// Simple error kind is not followed by a space or LF separator.
  missing_separator,

  /// Expected CR-LF is absent, reordered or only partially present.
  malformed_terminator,

  /// Integer or length field contains something other than an optional sign and digits.
  malformed_digits,

  /// Integer or length field does not fit in a signed 64-bit integer.
  overflow,

  /// Bulk string length or array count is negative but not -1.
  invalid_length,

  /// Fewer payload bytes remain than the bulk string length declares.
  truncated_payload,

  /// Input ends before the declared number of array elements.
  truncated_elements,

  /// Arrays are nested deeper than decoder_config::max_depth.
  recursion_limit_exceeded,

  /// Declared size or line length is above a decoder_config limit.
  limit_exceeded,

  /// Stream parser already rejected an earlier frame (call reset()).
  parser_failed,
};

inline auto make_error_code(error e) -> std::error_code;

}  // namespace rediswire::resp2

namespace std {

template <>
struct is_error_code_enum<rediswire::resp2::error> : std::true_type {};

}  // namespace std

#include <rediswire/resp2/impl/error.ipp>
