#include "read.hpp"

#include <iostream>

#include <redlog.hpp>

#include "p33k/engine/scanner.hpp"

namespace p33kx::commands {

int read_command(const read_request& request) {
  auto log = redlog::get_logger("p33kx.read");

  if (request.window.empty()) {
    log.err("window name required");
    std::cerr << "error: window name (-w/--window) is required" << std::endl;
    return 1;
  }

  auto config = make_scanner_config(request.target);
  if (!config.ok()) {
    return report_failure("p33kx.read", "invalid configuration", config.status_info);
  }

  p33k::engine::scanner scanner(std::move(config.value));
  auto connected = scanner.connect();
  if (!connected.ok()) {
    return report_failure("p33kx.read", "failed to attach", connected);
  }
  log.vrb("attached", redlog::field("pid", scanner.process_id()));

  auto lines = scanner.read_window(request.window, request.lines, request.colors);
  if (!lines.ok()) {
    return report_failure("p33kx.read", "failed to read window", lines.status_info);
  }

  for (const auto& line : lines.value) {
    std::cout << line << "\n";
  }
  std::cout.flush();
  return 0;
}

} // namespace p33kx::commands
