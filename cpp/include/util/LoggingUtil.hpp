#pragma once

#include "util/CppUtil.hpp"

#include <spdlog/fmt/ostr.h>  // Enables fallback to ostream <<
#include <spdlog/spdlog.h>

#include <string>

// Logging macros, in increasing order of severity: LOG_TRACE(), LOG_DEBUG(), LOG_INFO(),
// LOG_WARN(), LOG_ERROR(). They take fmt-style format strings:
//
// LOG_INFO("Tree policy: {}", name);
// LOG_WARN("{} moves, scores: [{}]", n, fmt::join(scores, ", "));
//
// LOG_TRACE() and LOG_DEBUG() are compiled out unless configured with
// -DPOLICY_ENABLE_DEBUG_LOGGING=ON, which lowers SPDLOG_ACTIVE_LEVEL. Compiled-out statements still
// type-check their arguments, so they cannot rot.

#define LOG_IMPL(SPDLOG_MACRO, ...) \
  do {                              \
    USE_UNEVALUATED(__VA_ARGS__);   \
    SPDLOG_MACRO(__VA_ARGS__);      \
  } while (0)

#define LOG_TRACE(...) LOG_IMPL(SPDLOG_TRACE, __VA_ARGS__)
#define LOG_DEBUG(...) LOG_IMPL(SPDLOG_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) LOG_IMPL(SPDLOG_INFO, __VA_ARGS__)
#define LOG_WARN(...) LOG_IMPL(SPDLOG_WARN, __VA_ARGS__)
#define LOG_ERROR(...) LOG_IMPL(SPDLOG_ERROR, __VA_ARGS__)

namespace util {

struct Logging {
  struct Params {
    auto make_options_description();

    std::string log_filename;
    bool append_mode = false;
    bool omit_timestamps = false;
  };

  /*
   * Replaces spdlog's default logger with one that writes to stdout, and additionally to
   * params.log_filename if set. Call once, before any search thread starts.
   */
  static void init(const Params& params);
};

}  // namespace util

#include "inline/util/LoggingUtil.inl"
