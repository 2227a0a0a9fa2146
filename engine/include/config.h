#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

#include "pipeline_runner.h"
#include "resource_pool.h"
#include "task_pool.h"

namespace poolkit {

// =====================================================
// Per-component settings
// =====================================================

struct TaskPoolConfig {
  size_t threads = 1;
  std::optional<std::chrono::milliseconds> timeout;  // timeout_ms 0 = none
  bool stop_on_first_error = true;
  TerminationPoll termination_poll;

  TaskPoolOptions to_options(const std::string& name) const;
};

struct PipelineConfig {
  size_t input_threads = 1;
  size_t output_threads = 1;
  std::optional<std::chrono::milliseconds> timeout;
  std::chrono::milliseconds backoff{500};

  PipelineOptions to_options(const std::string& name) const;
};

struct ResourcePoolConfig {
  std::chrono::seconds request_interval{1};
  std::chrono::seconds request_timeout{60};

  ResourcePoolOptions to_options(const std::string& name) const;
};

// =====================================================
// Config
// =====================================================

/**
 * Pool settings loaded from a JSON file:
 *
 *   {
 *     "schema_version": 1,
 *     "log_level": "info",
 *     "task_pools": { "<name>": { "threads": 4, "timeout_ms": 0,
 *                                 "stop_on_first_error": true,
 *                                 "termination_poll": { "attempts": 3000,
 *                                                       "interval_ms": 100 } } },
 *     "pipelines": { "<name>": { "input_threads": 1, "output_threads": 1,
 *                                "timeout_ms": 0, "backoff_ms": 500 } },
 *     "resource_pools": { "<name>": { "request_interval_seconds": 1,
 *                                     "request_timeout_seconds": 60 } }
 *   }
 *
 * Every section and field except schema_version is optional.
 */
class Config {
 public:
  // Returns either a valid config or an error message
  static std::variant<Config, std::string> LoadFromJson(const std::string& path);
  static std::variant<Config, std::string> Parse(const nlohmann::json& j);

  // Lookup by name, nullptr if absent
  const TaskPoolConfig* task_pool(std::string_view name) const;
  const PipelineConfig* pipeline(std::string_view name) const;
  const ResourcePoolConfig* resource_pool(std::string_view name) const;

  spdlog::level::level_enum log_level() const { return log_level_; }

  size_t size() const {
    return task_pools_.size() + pipelines_.size() + resource_pools_.size();
  }

 private:
  spdlog::level::level_enum log_level_ = spdlog::level::info;
  std::unordered_map<std::string, TaskPoolConfig> task_pools_;
  std::unordered_map<std::string, PipelineConfig> pipelines_;
  std::unordered_map<std::string, ResourcePoolConfig> resource_pools_;
};

}  // namespace poolkit
