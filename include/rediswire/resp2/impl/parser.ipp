#pragma once

#include <rediswire/logger.hpp>
#include <rediswire/resp2/parser.hpp>

#include <utility>

namespace rediswire::resp2 {

inline auto parser::parse_one() -> expected<parse_step<message>, error> {
  if (failed_) {
    return unexpected(error::parser_failed);
  }

  // The last attempt told us how much was missing; don't re-scan before it arrived.
  if (buf_.size() < wanted_) {
    return needs_more_step<message>(wanted_ - buf_.size());
  }

  auto r = decode_prefix(buf_.data(), cfg_);
  if (!r) {
    failed_ = true;
    REDISWIRE_LOG_DEBUG("resp2 frame rejected: {} ({} bytes buffered, first byte {:#04x})",
                        make_error_code(r.error()).message(), buf_.size(),
                        static_cast<unsigned char>(buf_.data().front()));
    return unexpected(r.error());
  }

  if (r->needs_more()) {
    wanted_ = buf_.size() + r->needed;
    return needs_more_step<message>(r->needed);
  }

  wanted_ = 0;
  buf_.consume(r->value.consumed);
  if (buf_.empty()) {
    buf_.compact();
  }
  return ok_step(std::move(r->value.value));
}

}  // namespace rediswire::resp2
