#pragma once

#include <optional>
#include <string>

#include "p33k/engine/process_backend.hpp"
#include "p33k/engine/result.hpp"
#include "p33k/engine/scanner.hpp"

namespace p33kx::commands {

// process selection and scanner settings shared by every command.
// unset fields fall back to P33K_* environment variables, then to defaults.
struct target_options {
  std::optional<int> pid;
  std::string process_name;
  std::string cache_path;
  std::string offsets_path;
  bool no_cache = false;
};

p33k::engine::result<p33k::engine::scanner_config> make_scanner_config(const target_options& options);

// pid of the configured process without attaching to it
p33k::engine::result<int> resolve_pid(
    const p33k::engine::scanner_config& config, const p33k::engine::process_backend& backend
);

// reports a failed status on stderr and the command log; returns the exit code
int report_failure(const char* logger_name, const char* what, const p33k::engine::status& error);

} // namespace p33kx::commands
