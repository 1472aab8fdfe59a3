#include "version.hpp"

#include <iostream>

#include <redlog.hpp>

#include "p33k/engine/scanner.hpp"

namespace p33kx::commands {

int version_command(const version_request& request) {
  auto log = redlog::get_logger("p33kx.version");

  auto config = make_scanner_config(request.target);
  if (!config.ok()) {
    return report_failure("p33kx.version", "invalid configuration", config.status_info);
  }

  p33k::engine::scanner scanner(std::move(config.value));
  auto connected = scanner.connect();
  if (!connected.ok()) {
    return report_failure("p33kx.version", "failed to attach", connected);
  }

  auto version = scanner.get_version();
  if (!version.ok()) {
    return report_failure("p33kx.version", "version not found", version.status_info);
  }

  log.vrb("version is a best guess", redlog::field("pid", scanner.process_id()));
  std::cout << version.value << std::endl;
  return 0;
}

} // namespace p33kx::commands
