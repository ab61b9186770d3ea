#pragma once

#include <rediswire/assert.hpp>

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <limits>
#include <span>
#include <string_view>
#include <vector>

namespace rediswire::resp2 {

/// Growable input buffer for the stream parser.
///
/// Layout: [consumed | readable | writable]. Readers look at `data()` and `consume()`
/// whole frames; writers `prepare()` space, fill it, then `commit()`.
class buffer {
 public:
  buffer() : buffer(4096) {}

  explicit buffer(std::size_t initial_capacity) {
    storage_.resize(std::max<std::size_t>(initial_capacity, 1));
  }

  /// Writable space of at least `min_size` bytes, directly after the readable bytes.
  auto prepare(std::size_t min_size = 4096) -> std::span<char> {
    ensure_writable(min_size);
    return std::span<char>(storage_.data() + write_pos_, storage_.size() - write_pos_);
  }

  /// Make `n` bytes written into the last prepare() span readable.
  auto commit(std::size_t n) -> void {
    REDISWIRE_ASSERT(n <= storage_.size() - write_pos_);
    write_pos_ += n;
  }

  /// Copy `bytes` to the end of the readable region.
  auto append(std::string_view bytes) -> void {
    if (bytes.empty()) {
      return;
    }
    auto w = prepare(bytes.size());
    std::memcpy(w.data(), bytes.data(), bytes.size());
    commit(bytes.size());
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    REDISWIRE_ASSERT(write_pos_ >= read_pos_);
    return write_pos_ - read_pos_;
  }

  [[nodiscard]] auto empty() const noexcept -> bool { return size() == 0; }

  [[nodiscard]] auto capacity() const noexcept -> std::size_t { return storage_.size(); }

  /// Readable bytes. Invalidated by prepare(), append() and compact().
  [[nodiscard]] auto data() const noexcept -> std::string_view {
    return std::string_view(storage_.data() + read_pos_, write_pos_ - read_pos_);
  }

  auto consume(std::size_t n) -> void {
    REDISWIRE_ASSERT(n <= size());
    read_pos_ += n;
  }

  /// Drop all data, keep capacity.
  auto reset() noexcept -> void {
    read_pos_ = 0;
    write_pos_ = 0;
  }

  /// Move readable bytes to the front, reclaiming consumed space.
  auto compact() -> void {
    if (read_pos_ == 0) {
      return;
    }

    auto remaining = size();
    if (remaining > 0) {
      std::memmove(storage_.data(), storage_.data() + read_pos_, remaining);
    }

    read_pos_ = 0;
    write_pos_ = remaining;
  }

 private:
  std::vector<char> storage_;
  std::size_t read_pos_ = 0;
  std::size_t write_pos_ = 0;

  auto ensure_writable(std::size_t n) -> void {
    REDISWIRE_ASSERT(write_pos_ <= storage_.size());

    if (storage_.size() - write_pos_ >= n) {
      return;
    }

    // Reuse consumed space before growing.
    compact();
    if (storage_.size() - write_pos_ >= n) {
      return;
    }

    auto new_size = storage_.size();
    while (new_size - write_pos_ < n) {
      if (new_size > (std::numeric_limits<std::size_t>::max)() / 2) {
        new_size = write_pos_ + n;
        break;
      }
      new_size *= 2;
    }
    storage_.resize(new_size);
  }
};

}  // namespace rediswire::resp2
