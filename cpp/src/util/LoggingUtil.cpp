#include "util/LoggingUtil.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace util {

void Logging::init(const Params& params) {
  const char* pattern = params.omit_timestamps ? "[%l] %v" : "%Y-%m-%d %H:%M:%S.%f [%l] %v";

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!params.log_filename.empty()) {
    bool truncate = !params.append_mode;
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(params.log_filename, truncate));
  }

  auto logger = std::make_shared<spdlog::logger>("policy", sinks.begin(), sinks.end());
  logger->set_pattern(pattern);

  // Warnings from search threads should reach the file even if the process dies right after.
  logger->flush_on(spdlog::level::warn);

  // Filtering happens at compile-time via SPDLOG_ACTIVE_LEVEL.
  logger->set_level(spdlog::level::trace);
  spdlog::set_default_logger(logger);
}

}  // namespace util
