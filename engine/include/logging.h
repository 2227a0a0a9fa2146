#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string_view>

namespace poolkit {

// Name of the process-wide logger shared by every pool.
constexpr const char* kLoggerName = "poolkit";

// Get the poolkit logger. Created lazily (colored stderr sink, info level)
// if init_logging() has not been called.
std::shared_ptr<spdlog::logger> logger();

// Create (or reconfigure) the poolkit logger at the given level.
void init_logging(spdlog::level::level_enum level = spdlog::level::info);

void set_log_level(spdlog::level::level_enum level);

// Parse "trace" / "debug" / "info" / "warn" / "error" / "critical" / "off".
std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

}  // namespace poolkit
