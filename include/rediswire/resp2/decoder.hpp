#pragma once

#include <rediswire/config.hpp>
#include <rediswire/expected.hpp>
#include <rediswire/resp2/error.hpp>
#include <rediswire/resp2/message.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace rediswire::resp2 {

enum class parse_status : std::uint8_t {
  needs_more = 0,
  ok,
};

/// Outcome of a decode attempt that did not hit a protocol error.
///
/// - ok: `value` holds the result
/// - needs_more: the input is a strict prefix of a frame that may still be valid;
///   `needed` is a lower bound on the bytes still missing
template <typename T>
struct parse_step {
  parse_status status{parse_status::needs_more};
  T value{};
  std::size_t needed{0};

  [[nodiscard]] auto needs_more() const noexcept -> bool {
    return status == parse_status::needs_more;
  }
};

template <typename T>
[[nodiscard]] auto ok_step(T v) -> parse_step<T> {
  return parse_step<T>{.status = parse_status::ok, .value = std::move(v)};
}

template <typename T>
[[nodiscard]] auto needs_more_step(std::size_t needed) -> parse_step<T> {
  return parse_step<T>{.status = parse_status::needs_more, .value = T{}, .needed = needed};
}

/// One decoded frame and the number of input bytes it occupied.
struct frame {
  message value{};
  std::size_t consumed{0};
};

/// Decode the first RESP2 frame of `input`.
///
/// The whole frame must be present: running out of input is an error (for example
/// error::truncated_payload). Bytes after the frame are ignored and not reported.
[[nodiscard]] inline auto decode(std::string_view input, decoder_config const& cfg = {})
  -> expected<message, error>;

/// Decode the first RESP2 frame of `input` and report how many bytes it used.
///
/// Three outcomes:
/// - ok step: `value.consumed` bytes form a complete frame
/// - needs_more step: `input` ends inside a frame that may still turn out valid
/// - error: the first protocol violation; more input cannot fix it
[[nodiscard]] inline auto decode_prefix(std::string_view input,
                                        decoder_config const& cfg = {})
  -> expected<parse_step<frame>, error>;

namespace detail {

/// Grammar failure. `incomplete` is set when the grammar reached the end of input
/// before it could decide; `code` is then what a strict decode reports.
struct fault {
  error code{};
  bool incomplete{false};
  std::size_t needed{0};
};

/// Recursive-descent RESP2 decoder over one contiguous input.
///
/// Each decode_* function starts right after the type prefix and leaves the cursor
/// after the frame's final CR-LF. Array nesting is tracked by an explicit depth
/// argument and capped by decoder_config::max_depth.
class decoder {
 public:
  decoder(std::string_view input, decoder_config const& cfg) noexcept
      : input_(input), cfg_(cfg) {}

  /// Dispatch on the type prefix. `depth` counts the arrays enclosing this value.
  [[nodiscard]] auto decode_value(std::uint32_t depth) -> expected<message, fault>;

  /// Bytes consumed so far.
  [[nodiscard]] auto position() const noexcept -> std::size_t { return pos_; }

 private:
  std::string_view input_;
  decoder_config const& cfg_;
  std::size_t pos_{0};

  [[nodiscard]] auto remaining() const noexcept -> std::size_t { return input_.size() - pos_; }
  [[nodiscard]] auto rest() const noexcept -> std::string_view { return input_.substr(pos_); }

  [[nodiscard]] auto decode_simple_string() -> expected<message, fault>;
  [[nodiscard]] auto decode_simple_error() -> expected<message, fault>;
  [[nodiscard]] auto decode_integer() -> expected<message, fault>;
  [[nodiscard]] auto decode_bulk_string() -> expected<message, fault>;
  [[nodiscard]] auto decode_array(std::uint32_t depth) -> expected<message, fault>;

  /// Simple string grammar: one or more bytes other than CR/LF, then CR-LF.
  /// `used` is the part of the line already taken by an error kind and its separator.
  [[nodiscard]] auto read_text(std::size_t used = 0) -> expected<std::string, fault>;
  /// Optional sign, one or more ASCII digits, CR-LF. Range: int64_t.
  /// Values above `ceiling` fail with error::limit_exceeded.
  [[nodiscard]] auto read_signed(std::int64_t ceiling = (std::numeric_limits<std::int64_t>::max)())
    -> expected<std::int64_t, fault>;
  [[nodiscard]] auto read_crlf() -> expected<std::monostate, fault>;
};

}  // namespace detail

}  // namespace rediswire::resp2

#include <rediswire/resp2/impl/decoder.ipp>
