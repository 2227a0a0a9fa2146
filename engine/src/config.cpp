#include "config.h"

#include <cstdint>
#include <exception>
#include <fstream>
#include <limits>
#include <utility>

#include "logging.h"

namespace poolkit {

namespace {

using json = nlohmann::json;

// Upper bound for every thread count.
constexpr int64_t kMaxThreads = 1024;
constexpr int64_t kMaxInt = std::numeric_limits<int>::max();

// Reads an optional integer field. Returns an error message if present but
// not an integer, or outside [min, max].
std::optional<std::string> read_int(
    const json& obj, const std::string& where, const char* key, int64_t min,
    int64_t& out, int64_t max = std::numeric_limits<int64_t>::max()) {
  if (!obj.contains(key)) {
    return std::nullopt;
  }
  if (!obj[key].is_number_integer()) {
    return where + ": " + key + " must be an integer";
  }
  int64_t value = obj[key].get<int64_t>();
  if (value < min) {
    return where + ": " + key + " must be >= " + std::to_string(min) +
           ", got " + std::to_string(value);
  }
  if (value > max) {
    return where + ": " + key + " must be <= " + std::to_string(max) +
           ", got " + std::to_string(value);
  }
  out = value;
  return std::nullopt;
}

std::optional<std::chrono::milliseconds> optional_timeout(int64_t ms) {
  if (ms == 0) {
    return std::nullopt;
  }
  return std::chrono::milliseconds(ms);
}

std::variant<TaskPoolConfig, std::string> parse_task_pool(
    const std::string& name, const json& j) {
  const std::string where = "task_pools." + name;
  if (!j.is_object()) {
    return where + " must be an object";
  }
  TaskPoolConfig config;

  int64_t threads = 1;
  int64_t timeout_ms = 0;
  if (auto err = read_int(j, where, "threads", 1, threads, kMaxThreads)) {
    return *err;
  }
  if (auto err = read_int(j, where, "timeout_ms", 0, timeout_ms)) return *err;
  config.threads = static_cast<size_t>(threads);
  config.timeout = optional_timeout(timeout_ms);

  if (j.contains("stop_on_first_error")) {
    if (!j["stop_on_first_error"].is_boolean()) {
      return where + ": stop_on_first_error must be a boolean";
    }
    config.stop_on_first_error = j["stop_on_first_error"].get<bool>();
  }

  if (j.contains("termination_poll")) {
    const auto& poll = j["termination_poll"];
    const std::string poll_where = where + ".termination_poll";
    if (!poll.is_object()) {
      return poll_where + " must be an object";
    }
    int64_t attempts = config.termination_poll.attempts;
    int64_t interval_ms = config.termination_poll.interval.count();
    if (auto err =
            read_int(poll, poll_where, "attempts", 0, attempts, kMaxInt)) {
      return *err;
    }
    if (auto err = read_int(poll, poll_where, "interval_ms", 1, interval_ms)) {
      return *err;
    }
    config.termination_poll.attempts = static_cast<int>(attempts);
    config.termination_poll.interval = std::chrono::milliseconds(interval_ms);
  }
  return config;
}

std::variant<PipelineConfig, std::string> parse_pipeline(
    const std::string& name, const json& j) {
  const std::string where = "pipelines." + name;
  if (!j.is_object()) {
    return where + " must be an object";
  }
  PipelineConfig config;

  int64_t input_threads = 1;
  int64_t output_threads = 1;
  int64_t timeout_ms = 0;
  int64_t backoff_ms = config.backoff.count();
  if (auto err = read_int(j, where, "input_threads", 1, input_threads,
                          kMaxThreads)) {
    return *err;
  }
  if (auto err = read_int(j, where, "output_threads", 1, output_threads,
                          kMaxThreads)) {
    return *err;
  }
  if (auto err = read_int(j, where, "timeout_ms", 0, timeout_ms)) return *err;
  if (auto err = read_int(j, where, "backoff_ms", 1, backoff_ms)) return *err;

  config.input_threads = static_cast<size_t>(input_threads);
  config.output_threads = static_cast<size_t>(output_threads);
  config.timeout = optional_timeout(timeout_ms);
  config.backoff = std::chrono::milliseconds(backoff_ms);
  return config;
}

std::variant<ResourcePoolConfig, std::string> parse_resource_pool(
    const std::string& name, const json& j) {
  const std::string where = "resource_pools." + name;
  if (!j.is_object()) {
    return where + " must be an object";
  }
  ResourcePoolConfig config;

  int64_t interval = config.request_interval.count();
  int64_t timeout = config.request_timeout.count();
  if (auto err = read_int(j, where, "request_interval_seconds", 1, interval)) {
    return *err;
  }
  if (auto err = read_int(j, where, "request_timeout_seconds", 0, timeout)) {
    return *err;
  }
  config.request_interval = std::chrono::seconds(interval);
  config.request_timeout = std::chrono::seconds(timeout);
  return config;
}

// Parses one "<section>": { "<name>": {...} } map into `out`.
template <typename Entry, typename ParseFn>
std::optional<std::string> parse_section(
    const json& j, const char* section, ParseFn parse,
    std::unordered_map<std::string, Entry>& out) {
  if (!j.contains(section)) {
    return std::nullopt;
  }
  if (!j[section].is_object()) {
    return std::string(section) + " must be an object";
  }
  for (auto it = j[section].begin(); it != j[section].end(); ++it) {
    auto parsed = parse(it.key(), it.value());
    if (std::holds_alternative<std::string>(parsed)) {
      return std::get<std::string>(parsed);
    }
    out.emplace(it.key(), std::move(std::get<Entry>(parsed)));
  }
  return std::nullopt;
}

}  // namespace

TaskPoolOptions TaskPoolConfig::to_options(const std::string& name) const {
  TaskPoolOptions options;
  options.name = name;
  options.worker_count = threads;
  options.timeout = timeout;
  options.stop_on_first_error = stop_on_first_error;
  options.termination_poll = termination_poll;
  return options;
}

PipelineOptions PipelineConfig::to_options(const std::string& name) const {
  PipelineOptions options;
  options.name = name;
  options.parallel_input_count = input_threads;
  options.parallel_output_count = output_threads;
  options.timeout = timeout;
  options.backoff = backoff;
  return options;
}

ResourcePoolOptions ResourcePoolConfig::to_options(
    const std::string& name) const {
  return ResourcePoolOptions{name, request_interval, request_timeout};
}

std::variant<Config, std::string> Config::LoadFromJson(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    return "Failed to open config: " + path;
  }

  json j;
  try {
    j = json::parse(file);
  } catch (const std::exception& e) {
    return "Failed to parse config JSON: " + std::string(e.what());
  }

  auto result = Parse(j);
  if (std::holds_alternative<Config>(result)) {
    logger()->debug("Loaded {} pool settings from {}",
                    std::get<Config>(result).size(), path);
  }
  return result;
}

std::variant<Config, std::string> Config::Parse(const json& j) {
  if (!j.is_object()) {
    return "Config root must be an object";
  }

  // Validate schema version
  if (!j.contains("schema_version") ||
      !j["schema_version"].is_number_integer()) {
    return "Missing or invalid schema_version";
  }
  if (j["schema_version"].get<int64_t>() != 1) {
    return "Unsupported schema_version: " +
           std::to_string(j["schema_version"].get<int64_t>());
  }

  Config config;

  if (j.contains("log_level")) {
    if (!j["log_level"].is_string()) {
      return "log_level must be a string";
    }
    auto level_str = j["log_level"].get<std::string>();
    auto level = parse_log_level(level_str);
    if (!level) {
      return "Unknown log_level: " + level_str;
    }
    config.log_level_ = *level;
  }

  if (auto err = parse_section<TaskPoolConfig>(j, "task_pools", parse_task_pool,
                                               config.task_pools_)) {
    return *err;
  }
  if (auto err = parse_section<PipelineConfig>(j, "pipelines", parse_pipeline,
                                               config.pipelines_)) {
    return *err;
  }
  if (auto err = parse_section<ResourcePoolConfig>(
          j, "resource_pools", parse_resource_pool, config.resource_pools_)) {
    return *err;
  }

  return config;
}

const TaskPoolConfig* Config::task_pool(std::string_view name) const {
  auto it = task_pools_.find(std::string(name));
  if (it == task_pools_.end()) return nullptr;
  return &it->second;
}

const PipelineConfig* Config::pipeline(std::string_view name) const {
  auto it = pipelines_.find(std::string(name));
  if (it == pipelines_.end()) return nullptr;
  return &it->second;
}

const ResourcePoolConfig* Config::resource_pool(std::string_view name) const {
  auto it = resource_pools_.find(std::string(name));
  if (it == resource_pools_.end()) return nullptr;
  return &it->second;
}

}  // namespace poolkit
