#pragma once

#include <atomic>
#include <chrono>
#include <string_view>
#include <utility>

#if defined(__cpp_lib_format) && __has_include(<format>)
#include <format>
namespace rediswire {
namespace format_impl = std;
}  // namespace rediswire
#else
#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif
#include <fmt/format.h>
namespace rediswire {
namespace format_impl = fmt;
}  // namespace rediswire
#endif

namespace rediswire {

enum class log_level {
  debug,
  info,
  warning,
  error,
  off,
};

constexpr auto to_string(log_level level) noexcept -> char const* {
  switch (level) {
    case log_level::debug:
      return "debug";
    case log_level::info:
      return "info";
    case log_level::warning:
      return "warning";
    case log_level::error:
      return "error";
    case log_level::off:
      return "off";
    default:
      return "unknown";
  }
}

struct log_context {
  log_level level;
  std::string_view message;
  std::string_view file;
  int line;
  std::chrono::system_clock::time_point timestamp;
};

using log_function = void (*)(void*, log_context const&);

/// Process-wide log sink.
///
/// Silent by default (level `off`). The decoder itself never logs; the stream parser
/// reports rejected frames at `debug`.
class logger {
 public:
  static auto instance() -> logger& {
    static logger inst;
    return inst;
  }

  // IMPORTANT: install the sink before any thread starts logging.
  // Passing nullptr restores the default stderr sink.
  void set_log_function(log_function fn, void* user_data = nullptr) {
    if (fn == nullptr) {
      log_fn_ = &default_log_function;
      log_user_data_ = nullptr;
      return;
    }
    log_fn_ = fn;
    log_user_data_ = user_data;
  }

  void set_log_level(log_level level) { min_level_.store(level, std::memory_order_relaxed); }

  auto get_log_level() const -> log_level { return min_level_.load(std::memory_order_relaxed); }

  [[nodiscard]] auto enabled(log_level level) const noexcept -> bool {
    return level != log_level::off && level >= min_level_.load(std::memory_order_relaxed);
  }

  void log(log_level level, std::string_view message, std::string_view file, int line) {
    if (!enabled(level)) {
      return;
    }

    log_context ctx{
      .level = level,
      .message = message,
      .file = file,
      .line = line,
      .timestamp = std::chrono::system_clock::now(),
    };
    log_fn_(log_user_data_, ctx);
  }

  template <typename... Args>
  void log(log_level level, std::string_view file, int line,
           format_impl::format_string<Args...> fmt, Args&&... args) {
    if (!enabled(level)) {
      return;
    }

    auto message = format_impl::format(fmt, std::forward<Args>(args)...);
    log(level, message, file, line);
  }

 private:
  logger() : log_fn_(&default_log_function), log_user_data_(nullptr), min_level_(log_level::off) {}

  static void default_log_function(void*, log_context const& ctx);

  log_function log_fn_;
  void* log_user_data_;
  std::atomic<log_level> min_level_;
};

inline auto get_logger() -> logger& { return logger::instance(); }

inline void set_log_function(log_function fn, void* user_data = nullptr) {
  logger::instance().set_log_function(fn, user_data);
}

inline void set_log_level(log_level level) { logger::instance().set_log_level(level); }

}  // namespace rediswire

#define REDISWIRE_LOG_DEBUG(fmt, ...)                                                      \
  ::rediswire::get_logger().log(::rediswire::log_level::debug, __FILE__, __LINE__, fmt \
                                __VA_OPT__(, ) __VA_ARGS__)

#define REDISWIRE_LOG_INFO(fmt, ...)                                                      \
  ::rediswire::get_logger().log(::rediswire::log_level::info, __FILE__, __LINE__, fmt \
                                __VA_OPT__(, ) __VA_ARGS__)

#define REDISWIRE_LOG_WARNING(fmt, ...)                                                      \
  ::rediswire::get_logger().log(::rediswire::log_level::warning, __FILE__, __LINE__, fmt \
                                __VA_OPT__(, ) __VA_ARGS__)

#define REDISWIRE_LOG_ERROR(fmt, ...)                                                      \
  ::rediswire::get_logger().log(::rediswire::log_level::error, __FILE__, __LINE__, fmt \
                                __VA_OPT__(, ) __VA_ARGS__)
