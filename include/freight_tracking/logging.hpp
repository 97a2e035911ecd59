// === Logging =================================================================
//
// Process-wide structured logger shared by every tracking component. Console
// output is human-readable; the rotating file sink writes one JSON object per
// line.

#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace freight_tracking {

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

}  // namespace freight_tracking
