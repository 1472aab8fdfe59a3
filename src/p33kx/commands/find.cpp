#include "find.hpp"

#include <iostream>

#include <redlog.hpp>

#include "p33k/engine/pattern.hpp"
#include "p33k/engine/pattern_scanner.hpp"
#include "p33k/engine/process_backend.hpp"
#include "p33k/utils/hex_utils.hpp"

namespace p33kx::commands {

int find_command(const find_request& request) {
  auto log = redlog::get_logger("p33kx.find");

  if (request.pattern.empty()) {
    log.err("signature pattern required");
    std::cerr << "error: signature pattern is required" << std::endl;
    return 1;
  }

  auto needle = p33k::engine::parse_signature(request.pattern);
  if (!needle.ok()) {
    return report_failure("p33kx.find", "invalid signature", needle.status_info);
  }

  auto config = make_scanner_config(request.target);
  if (!config.ok()) {
    return report_failure("p33kx.find", "invalid configuration", config.status_info);
  }

  p33k::engine::native_process_backend backend;
  auto pid = resolve_pid(config.value, backend);
  if (!pid.ok()) {
    return report_failure("p33kx.find", "process not found", pid.status_info);
  }
  auto reader = backend.open_reader(pid.value);
  if (!reader.ok()) {
    return report_failure("p33kx.find", "failed to open process memory", reader.status_info);
  }
  auto catalog = backend.open_catalog(pid.value);
  if (!catalog.ok()) {
    return report_failure("p33kx.find", "failed to open process", catalog.status_info);
  }

  p33k::engine::region_filter filter = p33k::engine::managed_heap_filter(config.value.max_region_size);
  if (request.all) {
    filter = p33k::engine::region_filter{};
    filter.max_region_size = config.value.max_region_size;
  }

  p33k::engine::scan_options options;
  options.max_results = request.max_results;
  options.chunk_size = config.value.chunk_size;

  p33k::engine::pattern_scanner scanner(*reader.value);
  auto matches = scanner.find_all(*catalog.value, filter, needle.value, options);
  if (!matches.ok()) {
    return report_failure("p33kx.find", "scan failed", matches.status_info);
  }

  if (matches.value.empty()) {
    log.err("signature not found", redlog::field("pattern", request.pattern));
    std::cerr << "error: signature not found" << std::endl;
    return 1;
  }

  std::cout << "matches: " << matches.value.size() << std::endl;
  for (uint64_t address : matches.value) {
    std::cout << p33k::utils::format_address(address) << "\n";
  }
  if (request.max_results > 0 && matches.value.size() == request.max_results) {
    log.inf("result limit reached", redlog::field("max", request.max_results));
  }
  std::cout.flush();
  return 0;
}

} // namespace p33kx::commands
