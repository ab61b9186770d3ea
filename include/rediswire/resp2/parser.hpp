#pragma once

#include <rediswire/config.hpp>
#include <rediswire/expected.hpp>
#include <rediswire/resp2/buffer.hpp>
#include <rediswire/resp2/decoder.hpp>
#include <rediswire/resp2/error.hpp>
#include <rediswire/resp2/message.hpp>

#include <cstddef>
#include <span>
#include <string_view>

namespace rediswire::resp2 {

/// Incremental RESP2 stream parser.
///
/// - input: prepare()/commit() (zero-copy) or feed() (copying), in chunks of any size
/// - output: parse_one() yields one message per complete frame, in wire order
/// - a frame's bytes are consumed only once it decodes completely
///
/// Contracts:
/// - a protocol error is sticky: every later parse_one() returns error::parser_failed
///   until reset(); the stream cannot be resynchronised
/// - returned messages own their data, so the buffer may be written to right away
class parser {
 public:
  parser() = default;
  explicit parser(decoder_config cfg) : cfg_(cfg) {}

  /// Writable space of at least `min_size` bytes; follow with commit().
  auto prepare(std::size_t min_size = 4096) -> std::span<std::byte> {
    return std::as_writable_bytes(buf_.prepare(min_size));
  }
  auto commit(std::size_t n) -> void { buf_.commit(n); }

  /// Copy `data` into the input buffer.
  auto feed(std::string_view data) -> void { buf_.append(data); }

  /// Decode the next frame from buffered input.
  ///
  /// Returns:
  /// - ok step: a complete message; its bytes are consumed
  /// - needs_more step: nothing consumed; `needed` is a lower bound on missing bytes
  /// - error: protocol violation; the parser is now failed
  auto parse_one() -> expected<parse_step<message>, error>;

  /// Bytes buffered but not yet consumed by a complete frame.
  [[nodiscard]] auto buffered() const noexcept -> std::size_t { return buf_.size(); }

  [[nodiscard]] bool failed() const noexcept { return failed_; }

  [[nodiscard]] auto config() const noexcept -> decoder_config const& { return cfg_; }

  auto reset() -> void {
    buf_.reset();
    failed_ = false;
    wanted_ = 0;
  }

 private:
  buffer buf_{};
  decoder_config cfg_{};
  bool failed_{false};

  // Buffered size below which the pending frame cannot be complete.
  std::size_t wanted_{0};
};

}  // namespace rediswire::resp2

#include <rediswire/resp2/impl/parser.ipp>
