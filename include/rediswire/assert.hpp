#pragma once

#if defined(__GNUC__) || defined(__clang__)
#define REDISWIRE_LIKELY(x) __builtin_expect(!!(x), 1)
#define REDISWIRE_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define REDISWIRE_LIKELY(x) (x)
#define REDISWIRE_UNLIKELY(x) (x)
#endif

namespace rediswire::detail {

[[noreturn]] void assert_fail(char const* expr, char const* file, int line,
                              char const* func) noexcept;

[[noreturn]] void assert_fail(char const* expr, char const* msg, char const* file, int line,
                              char const* func) noexcept;

[[noreturn]] void unreachable_fail(char const* file, int line, char const* func) noexcept;

}  // namespace rediswire::detail

// -------------------- ASSERT --------------------
// Internal invariants only. Never used to validate wire input.
#if !defined(NDEBUG)

#define REDISWIRE_ASSERT_SELECTOR(_1, _2, NAME, ...) NAME

#define REDISWIRE_ASSERT_1(expr)    \
  (REDISWIRE_LIKELY(expr) ? (void)0 \
                          : ::rediswire::detail::assert_fail(#expr, __FILE__, __LINE__, __func__))

#define REDISWIRE_ASSERT_2(expr, msg) \
  (REDISWIRE_LIKELY(expr)             \
     ? (void)0                        \
     : ::rediswire::detail::assert_fail(#expr, msg, __FILE__, __LINE__, __func__))

#define REDISWIRE_ASSERT(...) \
  REDISWIRE_ASSERT_SELECTOR(__VA_ARGS__, REDISWIRE_ASSERT_2, REDISWIRE_ASSERT_1)(__VA_ARGS__)

#else
#define REDISWIRE_ASSERT(...) ((void)0)
#endif

// -------------------- UNREACHABLE --------------------

#define REDISWIRE_UNREACHABLE() ::rediswire::detail::unreachable_fail(__FILE__, __LINE__, __func__)
