#pragma once

#include <cstddef>
#include <cstdint>

namespace rediswire {

/// RESP2 input hardening limits.
///
/// Every limit bounds something an untrusted peer controls: how deep the decoder
/// recurses, and how much a single frame can make a reader allocate or buffer.
/// Exceeding `max_depth` is reported as `resp2::error::recursion_limit_exceeded`,
/// every other limit as `resp2::error::limit_exceeded`.
struct decoder_config {
  /// Maximum number of nested array levels. A top-level array is level 1.
  std::uint32_t max_depth = 128U;

  /// Largest accepted bulk string payload (matches the server's proto-max-bulk-len).
  std::size_t max_bulk_bytes = 512ULL * 1024ULL * 1024ULL;  // 512 MiB

  /// Largest accepted array element count.
  std::uint32_t max_array_len = 1'000'000U;

  /// Longest accepted line (simple string, error, integer or length field), CR-LF excluded.
  /// For an error line this is kind, separator run and message together.
  std::size_t max_line_bytes = 64ULL * 1024ULL;  // 64 KiB
};

}  // namespace rediswire
