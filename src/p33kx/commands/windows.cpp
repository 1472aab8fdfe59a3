#include "windows.hpp"

#include <iostream>

#include <redlog.hpp>

#include "p33k/engine/scanner.hpp"
#include "p33k/utils/hex_utils.hpp"

namespace p33kx::commands {

int windows_command(const windows_request& request) {
  auto log = redlog::get_logger("p33kx.windows");

  auto config = make_scanner_config(request.target);
  if (!config.ok()) {
    return report_failure("p33kx.windows", "invalid configuration", config.status_info);
  }

  p33k::engine::scanner scanner(std::move(config.value));
  auto connected = scanner.connect();
  if (!connected.ok()) {
    return report_failure("p33kx.windows", "failed to attach", connected);
  }

  if (request.locate_all) {
    for (const auto& name : scanner.config().window_names) {
      if (scanner.anchors().find(name) != scanner.anchors().end()) {
        continue;
      }
      // a one-line read locates and records the window
      auto located = scanner.read_window(name, 1, true);
      if (!located.ok()) {
        log.vrb("window not located", redlog::field("name", name), redlog::field("error", located.status_info.message));
      }
    }
  }

  std::cout << "pid: " << scanner.process_id() << "\n";
  if (auto vtable = scanner.window_vtable()) {
    std::cout << "window vtable: " << p33k::utils::format_address(*vtable) << "\n";
  }
  std::cout << "windows: " << scanner.anchors().size() << "\n";
  for (const auto& [name, anchor] : scanner.anchors()) {
    std::cout << "  " << p33k::utils::format_address(anchor.address) << " " << name << "\n";
  }
  std::cout.flush();
  return 0;
}

} // namespace p33kx::commands
