#pragma once

#include <rediswire/assert.hpp>
#include <rediswire/resp2/decoder.hpp>
#include <rediswire/resp2/type.hpp>

#include <algorithm>
#include <charconv>
#include <limits>
#include <system_error>

namespace rediswire::resp2 {

namespace detail {

// Every RESP2 frame takes at least four bytes (e.g. ":0\r\n", "*0\r\n").
inline constexpr std::size_t min_frame_bytes = 4;

[[nodiscard]] inline auto invalid(error e) -> fault {
  return fault{.code = e, .incomplete = false, .needed = 0};
}

[[nodiscard]] inline auto starved(error e, std::size_t needed = 1) -> fault {
  return fault{.code = e, .incomplete = true, .needed = needed};
}

[[nodiscard]] constexpr auto is_digit(char c) noexcept -> bool {
  return c >= '0' && c <= '9';
}

[[nodiscard]] constexpr auto is_upper(char c) noexcept -> bool {
  return c >= 'A' && c <= 'Z';
}

[[nodiscard]] constexpr auto is_lower(char c) noexcept -> bool {
  return c >= 'a' && c <= 'z';
}

[[nodiscard]] constexpr auto is_error_separator(char c) noexcept -> bool {
  return c == ' ' || c == '\n';
}

/// `text` is an optional '-' followed by ASCII digits (a '+' is already stripped).
[[nodiscard]] inline auto parse_i64(std::string_view text, std::int64_t& out) -> std::errc {
  auto first = text.data();
  auto last = text.data() + text.size();
  auto res = std::from_chars(first, last, out);
  REDISWIRE_ASSERT(res.ec != std::errc{} || res.ptr == last);
  return res.ec;
}

inline auto decoder::read_crlf() -> expected<std::monostate, fault> {
  if (remaining() == 0) {
    return unexpected(starved(error::malformed_terminator, 2));
  }
  if (input_[pos_] != '\r') {
    return unexpected(invalid(error::malformed_terminator));
  }
  if (remaining() == 1) {
    return unexpected(starved(error::malformed_terminator, 1));
  }
  if (input_[pos_ + 1] != '\n') {
    return unexpected(invalid(error::malformed_terminator));
  }
  pos_ += 2;
  return std::monostate{};
}

inline auto decoder::read_text(std::size_t used) -> expected<std::string, fault> {
  auto const line = rest();
  auto const end = line.find_first_of("\r\n");
  auto const len = end == std::string_view::npos ? line.size() : end;

  if (used + len > cfg_.max_line_bytes) {
    return unexpected(invalid(error::limit_exceeded));
  }
  if (len == 0) {
    if (line.empty()) {
      return unexpected(starved(error::empty_content));
    }
    return unexpected(invalid(error::empty_content));
  }
  if (end == std::string_view::npos) {
    return unexpected(starved(error::malformed_terminator, 2));
  }

  pos_ += len;
  auto crlf = read_crlf();
  if (!crlf) {
    return unexpected(crlf.error());
  }
  return std::string(line.substr(0, len));
}

inline auto decoder::read_signed(std::int64_t ceiling) -> expected<std::int64_t, fault> {
  auto const line = rest();
  std::size_t n = 0;
  bool explicit_plus = false;
  if (!line.empty() && (line[0] == '+' || line[0] == '-')) {
    explicit_plus = line[0] == '+';
    n = 1;
  }

  auto const digits_begin = n;
  while (n < line.size() && is_digit(line[n])) {
    ++n;
  }
  if (n > cfg_.max_line_bytes) {
    return unexpected(invalid(error::limit_exceeded));
  }

  auto const at_end = n == line.size();
  if (!at_end && line[n] != '\r' && line[n] != '\n') {
    return unexpected(invalid(error::malformed_digits));
  }
  if (n == digits_begin) {
    return unexpected(at_end ? starved(error::malformed_digits) : invalid(error::malformed_digits));
  }

  // More digits only grow the magnitude, so a digit run cut off by the end of input
  // already decides overflow and the ceiling.
  std::int64_t v{};
  auto const number = line.substr(explicit_plus ? 1 : 0, explicit_plus ? n - 1 : n);
  if (parse_i64(number, v) != std::errc{}) {
    return unexpected(invalid(error::overflow));
  }
  if (v > ceiling) {
    return unexpected(invalid(error::limit_exceeded));
  }
  if (at_end) {
    return unexpected(starved(error::malformed_terminator, 2));
  }

  pos_ += n;
  auto crlf = read_crlf();
  if (!crlf) {
    return unexpected(crlf.error());
  }
  return v;
}

inline auto decoder::decode_value(std::uint32_t depth) -> expected<message, fault> {
  if (remaining() == 0) {
    return unexpected(starved(error::unrecognized_type));
  }

  auto maybe_t = prefix_to_type(input_[pos_]);
  if (!maybe_t.has_value()) {
    return unexpected(invalid(error::unrecognized_type));
  }
  pos_ += 1;

  switch (*maybe_t) {
    case type::simple_string:
      return decode_simple_string();
    case type::simple_error:
      return decode_simple_error();
    case type::integer:
      return decode_integer();
    case type::bulk_string:
      return decode_bulk_string();
    case type::array:
      return decode_array(depth);
    case type::null_bulk_string:
    case type::null_array:
      break;
  }
  REDISWIRE_UNREACHABLE();
}

inline auto decoder::decode_simple_string() -> expected<message, fault> {
  auto text = read_text();
  if (!text) {
    return unexpected(text.error());
  }
  return message{simple_string{std::move(*text)}};
}

inline auto decoder::decode_simple_error() -> expected<message, fault> {
  auto line = rest();
  std::size_t n = 0;
  while (n < line.size() && is_upper(line[n])) {
    ++n;
  }
  if (n > cfg_.max_line_bytes) {
    return unexpected(invalid(error::limit_exceeded));
  }

  if (n == line.size()) {
    return unexpected(starved(n == 0 ? error::empty_kind : error::missing_separator));
  }
  // Lowercase right after (or instead of) the uppercase run: "-err", "-ErR".
  if (n == 0 || is_lower(line[n])) {
    return unexpected(invalid(error::empty_kind));
  }

  auto kind = std::string(line.substr(0, n));
  pos_ += n;

  // Separator: any run of spaces and LFs. CR is not part of it.
  line = rest();
  std::size_t sep = 0;
  while (sep < line.size() && is_error_separator(line[sep])) {
    ++sep;
  }
  // Kind, separator and message together form one line.
  if (n + sep > cfg_.max_line_bytes) {
    return unexpected(invalid(error::limit_exceeded));
  }
  if (sep == 0) {
    return unexpected(invalid(error::missing_separator));
  }
  if (sep == line.size()) {
    return unexpected(starved(error::empty_content));
  }
  pos_ += sep;

  auto text = read_text(n + sep);
  if (!text) {
    return unexpected(text.error());
  }
  return message{simple_error{.kind = std::move(kind), .message = std::move(*text)}};
}

inline auto decoder::decode_integer() -> expected<message, fault> {
  auto v = read_signed();
  if (!v) {
    return unexpected(v.error());
  }
  return message{integer{*v}};
}

inline auto decoder::decode_bulk_string() -> expected<message, fault> {
  auto const max_len = std::min<std::uint64_t>(
    cfg_.max_bulk_bytes, static_cast<std::uint64_t>((std::numeric_limits<std::int64_t>::max)()));
  auto len = read_signed(static_cast<std::int64_t>(max_len));
  if (!len) {
    return unexpected(len.error());
  }
  if (*len == -1) {
    return message{null_bulk_string{}};
  }
  if (*len < 0) {
    return unexpected(invalid(error::invalid_length));
  }

  auto const size = static_cast<std::size_t>(*len);
  if (remaining() < size) {
    return unexpected(starved(error::truncated_payload, size - remaining() + 2));
  }

  auto const payload = input_.substr(pos_, size);
  pos_ += size;
  auto crlf = read_crlf();
  if (!crlf) {
    return unexpected(crlf.error());
  }
  return message{bulk_string::copy_of(payload)};
}

inline auto decoder::decode_array(std::uint32_t depth) -> expected<message, fault> {
  auto count = read_signed(static_cast<std::int64_t>(cfg_.max_array_len));
  if (!count) {
    return unexpected(count.error());
  }
  if (*count == -1) {
    return message{null_array{}};
  }
  if (*count < 0) {
    return unexpected(invalid(error::invalid_length));
  }
  // A null array opens no nesting level.
  if (depth >= cfg_.max_depth) {
    return unexpected(invalid(error::recursion_limit_exceeded));
  }

  auto const n = static_cast<std::size_t>(*count);
  array a{};
  a.elements.reserve(std::min(n, remaining() / min_frame_bytes));
  for (std::size_t i = 0; i < n; ++i) {
    if (remaining() == 0) {
      return unexpected(starved(error::truncated_elements, (n - i) * min_frame_bytes));
    }
    auto element = decode_value(depth + 1);
    if (!element) {
      return unexpected(element.error());
    }
    a.elements.push_back(std::move(*element));
  }
  return message{std::move(a)};
}

}  // namespace detail

inline auto decode(std::string_view input, decoder_config const& cfg)
  -> expected<message, error> {
  detail::decoder d{input, cfg};
  auto r = d.decode_value(0);
  if (!r) {
    return unexpected(r.error().code);
  }
  return std::move(*r);
}

inline auto decode_prefix(std::string_view input, decoder_config const& cfg)
  -> expected<parse_step<frame>, error> {
  detail::decoder d{input, cfg};
  auto r = d.decode_value(0);
  if (!r) {
    if (r.error().incomplete) {
      return needs_more_step<frame>(r.error().needed);
    }
    return unexpected(r.error().code);
  }
  return ok_step(frame{.value = std::move(*r), .consumed = d.position()});
}

}  // namespace rediswire::resp2
