// Copyright (c) 2025 canhaz authors.
//
// Licensed under the BSD 3-Clause License
// <LICENSE.rst or https://opensource.org/licenses/BSD-3-Clause>.
// This file may not be copied, modified, or distributed except
// according to those terms.

#ifndef CANHAZ_UTIL_LOG_HPP
#define CANHAZ_UTIL_LOG_HPP

#include <format>
#include <iostream>
#include <string>
#include <string_view>

#define CANHAZ_LOG_LEVEL_OFF   0
#define CANHAZ_LOG_LEVEL_FATAL 1
#define CANHAZ_LOG_LEVEL_ERROR 2
#define CANHAZ_LOG_LEVEL_WARN  3
#define CANHAZ_LOG_LEVEL_INFO  4
#define CANHAZ_LOG_LEVEL_DEBUG 5
#define CANHAZ_LOG_LEVEL_TRACE 6

// Levels above the compile-time level are compiled out entirely.
#ifndef CANHAZ_LOG_LEVEL
#define CANHAZ_LOG_LEVEL CANHAZ_LOG_LEVEL_ERROR
#endif

namespace canhaz {
namespace util {

// Runtime threshold, never more verbose than CANHAZ_LOG_LEVEL.
inline int& log_threshold() {
  static int threshold = CANHAZ_LOG_LEVEL;
  return threshold;
}

// Returns the threshold that is actually in effect.
inline int set_log_threshold(int level) {
  log_threshold() = level < CANHAZ_LOG_LEVEL_OFF ? CANHAZ_LOG_LEVEL_OFF
                  : level > CANHAZ_LOG_LEVEL ? CANHAZ_LOG_LEVEL
                  : level;
  return log_threshold();
}

inline std::string_view log_tag(int level) {
  switch (level) {
    case CANHAZ_LOG_LEVEL_FATAL: return "\033[95m[F]\033[0m";
    case CANHAZ_LOG_LEVEL_ERROR: return "\033[91m[E]\033[0m";
    case CANHAZ_LOG_LEVEL_WARN:  return "\033[93m[W]\033[0m";
    case CANHAZ_LOG_LEVEL_INFO:  return "\033[92m[I]\033[0m";
    case CANHAZ_LOG_LEVEL_DEBUG: return "\033[94m[D]\033[0m";
    default:                     return "\033[96m[T]\033[0m";
  }
}

// Diagnostics go to std::clog; std::cout is reserved for passwords.
template<typename... Args>
void log(int level, std::string_view fmt, Args&&... args) {
  if (level > log_threshold()) {
    return;
  }

  std::string message;
  if constexpr (sizeof...(Args) == 0) {
    message = std::string(fmt);
  } else {
    message = std::vformat(fmt, std::make_format_args(args...));
  }
  std::clog << log_tag(level) << " canhaz: " << message << std::endl;
}

}  // namespace util
}  // namespace canhaz

#define CANHAZ_LOG_AT(LEVEL, FMT, ...) ::canhaz::util::log(LEVEL, FMT __VA_OPT__(, ) __VA_ARGS__)
#define CANHAZ_LOG_NOTHING() do { } while (false)

#if CANHAZ_LOG_LEVEL >= CANHAZ_LOG_LEVEL_FATAL
#define CANHAZ_LOG_FATAL(FMT, ...) CANHAZ_LOG_AT(CANHAZ_LOG_LEVEL_FATAL, FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define CANHAZ_LOG_FATAL(FMT, ...) CANHAZ_LOG_NOTHING()
#endif

#if CANHAZ_LOG_LEVEL >= CANHAZ_LOG_LEVEL_ERROR
#define CANHAZ_LOG_ERROR(FMT, ...) CANHAZ_LOG_AT(CANHAZ_LOG_LEVEL_ERROR, FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define CANHAZ_LOG_ERROR(FMT, ...) CANHAZ_LOG_NOTHING()
#endif

#if CANHAZ_LOG_LEVEL >= CANHAZ_LOG_LEVEL_WARN
#define CANHAZ_LOG_WARN(FMT, ...) CANHAZ_LOG_AT(CANHAZ_LOG_LEVEL_WARN, FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define CANHAZ_LOG_WARN(FMT, ...) CANHAZ_LOG_NOTHING()
#endif

#if CANHAZ_LOG_LEVEL >= CANHAZ_LOG_LEVEL_INFO
#define CANHAZ_LOG_INFO(FMT, ...) CANHAZ_LOG_AT(CANHAZ_LOG_LEVEL_INFO, FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define CANHAZ_LOG_INFO(FMT, ...) CANHAZ_LOG_NOTHING()
#endif

#if CANHAZ_LOG_LEVEL >= CANHAZ_LOG_LEVEL_DEBUG
#define CANHAZ_LOG_DEBUG(FMT, ...) CANHAZ_LOG_AT(CANHAZ_LOG_LEVEL_DEBUG, FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define CANHAZ_LOG_DEBUG(FMT, ...) CANHAZ_LOG_NOTHING()
#endif

#if CANHAZ_LOG_LEVEL >= CANHAZ_LOG_LEVEL_TRACE
#define CANHAZ_LOG_TRACE(FMT, ...) CANHAZ_LOG_AT(CANHAZ_LOG_LEVEL_TRACE, FMT __VA_OPT__(, ) __VA_ARGS__)
#else
#define CANHAZ_LOG_TRACE(FMT, ...) CANHAZ_LOG_NOTHING()
#endif

#endif  // CANHAZ_UTIL_LOG_HPP
