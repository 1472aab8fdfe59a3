#include "target.hpp"

#include <algorithm>
#include <iostream>

#include <redlog.hpp>

#include "p33k/engine/field_offsets.hpp"
#include "p33k/utils/env_config.hpp"

namespace p33kx::commands {

using p33k::engine::error_code;
using p33k::engine::error_result;
using p33k::engine::ok_result;
using p33k::engine::result;
using p33k::engine::scanner_config;

result<scanner_config> make_scanner_config(const target_options& options) {
  p33k::utils::env_config env("P33K");
  scanner_config config;

  config.process_name = options.process_name.empty()
                            ? env.get<std::string>("PROCESS", std::string(p33k::engine::k_default_process_name))
                            : options.process_name;

  if (options.pid) {
    config.pid = options.pid;
  } else if (env.has("PID")) {
    int pid = env.get<int>("PID", 0);
    if (pid <= 0) {
      return error_result<scanner_config>(error_code::invalid_argument, "P33K_PID is not a valid process id");
    }
    config.pid = pid;
  }

  std::string cache_path = options.cache_path.empty() ? env.get<std::string>("CACHE", "") : options.cache_path;
  if (!cache_path.empty()) {
    config.cache_path = cache_path;
  }
  config.use_cache = !options.no_cache && !env.get<bool>("NO_CACHE", false);

  // extra window names join the built-in set
  for (auto& name : env.get_list("WINDOWS")) {
    if (std::find(config.window_names.begin(), config.window_names.end(), name) == config.window_names.end()) {
      config.window_names.push_back(name);
    }
  }

  std::string offsets_path = options.offsets_path.empty() ? env.get<std::string>("OFFSETS", "") : options.offsets_path;
  if (!offsets_path.empty()) {
    auto offsets = p33k::engine::field_offset_table::load(offsets_path);
    if (!offsets.ok()) {
      return error_result<scanner_config>(offsets.status_info);
    }
    config.offsets = std::move(offsets.value);
  }

  uint64_t max_region_mb = env.get<uint64_t>("MAX_REGION_MB", 0);
  if (max_region_mb > 0) {
    config.max_region_size = max_region_mb * 1024 * 1024;
  }

  return ok_result(std::move(config));
}

result<int> resolve_pid(const scanner_config& config, const p33k::engine::process_backend& backend) {
  if (config.pid) {
    if (!backend.is_alive(*config.pid)) {
      return error_result<int>(
          error_code::process_not_found, "process " + std::to_string(*config.pid) + " is not running"
      );
    }
    return ok_result(*config.pid);
  }
  return backend.find_process(config.process_name);
}

int report_failure(const char* logger_name, const char* what, const p33k::engine::status& error) {
  auto log = redlog::get_logger(logger_name);
  log.err(
      what, redlog::field("code", p33k::engine::error_code_name(error.code)), redlog::field("error", error.message)
  );
  std::cerr << "error: " << error.message << std::endl;
  return 1;
}

} // namespace p33kx::commands
