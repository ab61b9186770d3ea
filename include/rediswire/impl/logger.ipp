#include <rediswire/logger.hpp>

#include <ctime>
#include <iostream>

namespace rediswire {

namespace {

// Trim a __FILE__ path to what follows "rediswire/", or to the basename.
auto short_source_path(std::string_view path) -> std::string_view {
  using namespace std::string_view_literals;
  for (auto marker : {"rediswire/"sv, "rediswire\\"sv}) {
    if (auto pos = path.rfind(marker); pos != std::string_view::npos) {
      return path.substr(pos + marker.size());
    }
  }
  if (auto pos = path.find_last_of("/\\"); pos != std::string_view::npos) {
    return path.substr(pos + 1);
  }
  return path;
}

}  // namespace

void logger::default_log_function(void*, log_context const& ctx) {
  auto time = std::chrono::system_clock::to_time_t(ctx.timestamp);
  std::tm tm{};
  localtime_r(&time, &tm);
  auto ms =
    std::chrono::duration_cast<std::chrono::milliseconds>(ctx.timestamp.time_since_epoch()) % 1000;

  auto formatted = format_impl::format(
    "[{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}] [rediswire] [{}] [{}:{}] {}",
    tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
    static_cast<int>(ms.count()), to_string(ctx.level), short_source_path(ctx.file), ctx.line,
    ctx.message);

  std::cerr << formatted << std::endl;
}

}  // namespace rediswire
