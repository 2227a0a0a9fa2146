#include "logging.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>

namespace poolkit {

namespace {
std::mutex g_logger_mutex;

std::shared_ptr<spdlog::logger> get_or_create_locked() {
  auto existing = spdlog::get(kLoggerName);
  if (existing) {
    return existing;
  }
  auto created = spdlog::stderr_color_mt(kLoggerName);
  created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v");
  created->set_level(spdlog::level::info);
  return created;
}
}  // namespace

std::shared_ptr<spdlog::logger> logger() {
  // Cached after the first lookup.
  static std::shared_ptr<spdlog::logger> cached = [] {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    return get_or_create_locked();
  }();
  return cached;
}

void init_logging(spdlog::level::level_enum level) {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  get_or_create_locked()->set_level(level);
}

void set_log_level(spdlog::level::level_enum level) {
  logger()->set_level(level);
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
  // from_str maps unknown names to off.
  auto level = spdlog::level::from_str(std::string(name));
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

}  // namespace poolkit
