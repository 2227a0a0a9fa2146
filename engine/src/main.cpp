#include <CLI/CLI.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "config.h"
#include "fan_out_runner.h"
#include "logging.h"
#include "pipeline_runner.h"
#include "resource_pool.h"
#include "task_pool.h"

using json = nlohmann::ordered_json;  // ordered for deterministic output
using namespace poolkit;

namespace {

struct BenchArgs {
  std::string mode = "fanout";
  int workers = 4;
  int items = 100;
  int resources = 2;
  int task_ms = 10;
};

// Settings named "poolbench.<mode>" in the config, or flag-driven defaults.
struct BenchSettings {
  std::optional<Config> config;

  TaskPoolOptions task_pool(const BenchArgs &args) const {
    const TaskPoolConfig *found =
        config ? config->task_pool("poolbench.fanout") : nullptr;
    TaskPoolOptions options =
        found ? found->to_options("poolbench.fanout") : TaskPoolOptions{};
    if (!found) {
      options.name = "poolbench.fanout";
      options.worker_count = static_cast<size_t>(args.workers);
    }
    return options;
  }

  PipelineOptions pipeline(const BenchArgs &args) const {
    const PipelineConfig *found =
        config ? config->pipeline("poolbench.pipeline") : nullptr;
    if (found) {
      return found->to_options("poolbench.pipeline");
    }
    PipelineOptions options;
    options.name = "poolbench.pipeline";
    options.parallel_input_count = 1;
    options.parallel_output_count = static_cast<size_t>(args.workers);
    options.backoff = std::chrono::milliseconds(10);
    return options;
  }

  ResourcePoolOptions resource_pool() const {
    const ResourcePoolConfig *found =
        config ? config->resource_pool("poolbench.resources") : nullptr;
    if (found) {
      return found->to_options("poolbench.resources");
    }
    return ResourcePoolOptions{"poolbench.resources", std::chrono::seconds(1),
                               std::chrono::seconds(60)};
  }
};

void sleep_task(int task_ms) {
  this_worker::sleep_for(std::chrono::milliseconds(task_ms));
}

// Every worker runs its share of `items` simulated calls.
json run_fanout(const BenchArgs &args, const BenchSettings &settings) {
  TaskPoolOptions options = settings.task_pool(args);
  const int per_worker =
      std::max(1, args.items / static_cast<int>(options.worker_count));
  std::atomic<int> completed{0};

  FanOutRunner runner(options, [&]() {
    for (int i = 0; i < per_worker; ++i) {
      sleep_task(args.task_ms);
      completed.fetch_add(1);
    }
  });
  runner.invoke_all();

  json result;
  result["workers"] = runner.worker_count();
  result["completed"] = completed.load();
  return result;
}

// One producer emits 1..items, consumers sum what they receive.
json run_pipeline(const BenchArgs &args, const BenchSettings &settings) {
  PipelineRunner<int> pipeline(settings.pipeline(args));
  std::atomic<int> next{0};
  std::atomic<long long> sum{0};
  std::atomic<int> consumed{0};

  pipeline.set_input_executor([&](EofFlag &eof) -> std::optional<int> {
    int value = next.fetch_add(1) + 1;
    if (value >= args.items) {
      eof.set();
    }
    if (value > args.items) {
      return std::nullopt;
    }
    return value;
  });
  pipeline.set_output_executor([&](EofFlag &, int value) {
    sleep_task(args.task_ms);
    sum.fetch_add(value);
    consumed.fetch_add(1);
  });
  pipeline.run();

  json result;
  result["produced"] = std::min(next.load(), args.items);
  result["consumed"] = consumed.load();
  result["sum"] = sum.load();
  return result;
}

// Workers contend for a small set of resources; records peak concurrency.
json run_resource(const BenchArgs &args, const BenchSettings &settings) {
  ResourcePool<std::string> pool(settings.resource_pool());
  std::vector<std::string> initial;
  for (int i = 0; i < args.resources; ++i) {
    initial.push_back("resource-" + std::to_string(i + 1));
  }
  pool.init(std::move(initial));

  TaskPoolOptions options = settings.task_pool(args);
  options.name = "poolbench.resources";
  const int per_worker =
      std::max(1, args.items / static_cast<int>(options.worker_count));
  std::atomic<int> in_use{0};
  std::atomic<int> peak{0};
  std::atomic<int> actions{0};

  FanOutRunner runner(options, [&]() {
    const std::string requester = ThreadPool::current_thread_name();
    for (int i = 0; i < per_worker; ++i) {
      pool.perform_action(requester, [&](const std::string &) {
        int now = in_use.fetch_add(1) + 1;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        sleep_task(args.task_ms);
        in_use.fetch_sub(1);
        actions.fetch_add(1);
      });
    }
  });
  runner.invoke_all();

  json result;
  result["resources"] = args.resources;
  result["actions"] = actions.load();
  result["peak_in_use"] = peak.load();
  result["available"] = pool.available_size();
  result["borrowed"] = pool.borrowed_size();
  return result;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"poolbench - load generator for poolkit pools"};

  BenchArgs args;
  std::string config_path;
  std::string log_level;

  app.add_option("--config", config_path, "Path to pool config JSON file");
  app.add_option("--mode", args.mode, "Scenario: fanout, pipeline, resource")
      ->check(CLI::IsMember({"fanout", "pipeline", "resource"}));
  app.add_option("--workers", args.workers, "Worker threads")
      ->check(CLI::PositiveNumber);
  app.add_option("--items", args.items, "Work items to process")
      ->check(CLI::PositiveNumber);
  app.add_option("--resources", args.resources,
                 "Resources in the pool (resource mode)")
      ->check(CLI::PositiveNumber);
  app.add_option("--task-ms", args.task_ms, "Simulated work per item (ms)")
      ->check(CLI::NonNegativeNumber);
  app.add_option("--log-level", log_level,
                 "trace, debug, info, warn, error, critical, off");

  CLI11_PARSE(app, argc, argv);

  BenchSettings settings;
  if (!config_path.empty()) {
    auto loaded = Config::LoadFromJson(config_path);
    if (std::holds_alternative<std::string>(loaded)) {
      std::cerr << "Error: " << std::get<std::string>(loaded) << std::endl;
      return 1;
    }
    settings.config = std::move(std::get<Config>(loaded));
    init_logging(settings.config->log_level());
  }
  if (!log_level.empty()) {
    auto level = parse_log_level(log_level);
    if (!level) {
      std::cerr << "Error: Invalid --log-level '" << log_level << "'"
                << std::endl;
      return 1;
    }
    init_logging(*level);
  }

  json response;
  response["mode"] = args.mode;
  auto start = std::chrono::steady_clock::now();

  try {
    if (args.mode == "fanout") {
      response["result"] = run_fanout(args, settings);
    } else if (args.mode == "pipeline") {
      response["result"] = run_pipeline(args, settings);
    } else {
      response["result"] = run_resource(args, settings);
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  response["elapsed_ms"] =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start)
          .count();
  logger()->info("poolbench {} finished", args.mode);
  std::cout << response.dump() << std::endl;
  return 0;
}
