#include <rediswire/assert.hpp>

#include <cstdio>
#include <cstdlib>

namespace rediswire::detail {

namespace {

[[noreturn]] void report_and_abort(char const* what, char const* expr, char const* msg,
                                   char const* file, int line, char const* func) noexcept {
  std::fprintf(stderr, "[rediswire] %s failure\n", what);
  if (expr != nullptr) {
    std::fprintf(stderr, "  expression: %s\n", expr);
  }
  if (msg != nullptr) {
    std::fprintf(stderr, "  message   : %s\n", msg);
  }
  std::fprintf(stderr,
               "  location  : %s:%d\n"
               "  function  : %s\n",
               file, line, func);
  std::fflush(stderr);
  std::abort();
}

}  // namespace

void assert_fail(char const* expr, char const* file, int line, char const* func) noexcept {
  report_and_abort("ASSERT", expr, nullptr, file, line, func);
}

void assert_fail(char const* expr, char const* msg, char const* file, int line,
                 char const* func) noexcept {
  report_and_abort("ASSERT", expr, msg, file, line, func);
}

void unreachable_fail(char const* file, int line, char const* func) noexcept {
  report_and_abort("UNREACHABLE", nullptr, nullptr, file, line, func);
}

}  // namespace rediswire::detail
