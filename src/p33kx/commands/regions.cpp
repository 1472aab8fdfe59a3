#include "regions.hpp"

#include <iomanip>
#include <iostream>

#include <redlog.hpp>

#include "p33k/engine/process_backend.hpp"
#include "p33k/engine/region_catalog.hpp"
#include "p33k/utils/hex_utils.hpp"

namespace p33kx::commands {

namespace {

std::string protection_string(const p33k::engine::memory_region& region) {
  using p33k::engine::has_protection;
  using p33k::engine::memory_protection;

  std::string text = "---";
  if (has_protection(region.protection, memory_protection::read)) {
    text[0] = 'r';
  }
  if (has_protection(region.protection, memory_protection::write)) {
    text[1] = 'w';
  }
  if (has_protection(region.protection, memory_protection::execute)) {
    text[2] = 'x';
  }
  text.push_back(region.is_private ? 'p' : 's');
  return text;
}

} // namespace

int regions_command(const regions_request& request) {
  auto log = redlog::get_logger("p33kx.regions");

  auto config = make_scanner_config(request.target);
  if (!config.ok()) {
    return report_failure("p33kx.regions", "invalid configuration", config.status_info);
  }

  p33k::engine::native_process_backend backend;
  auto pid = resolve_pid(config.value, backend);
  if (!pid.ok()) {
    return report_failure("p33kx.regions", "process not found", pid.status_info);
  }

  auto catalog = backend.open_catalog(pid.value);
  if (!catalog.ok()) {
    return report_failure("p33kx.regions", "failed to open process", catalog.status_info);
  }

  auto filter = request.all ? p33k::engine::region_filter{}
                            : p33k::engine::managed_heap_filter(config.value.max_region_size);
  if (request.all) {
    filter.required = p33k::engine::memory_protection::none;
    filter.max_region_size = 0;
  }

  auto regions = catalog.value->regions(filter);
  if (!regions.ok()) {
    return report_failure("p33kx.regions", "failed to read memory map", regions.status_info);
  }

  uint64_t total = 0;
  for (const auto& region : regions.value) {
    total += region.size();
    std::cout << p33k::utils::format_address(region.start) << "-" << p33k::utils::format_address(region.end) << " "
              << protection_string(region) << " " << std::setw(10) << region.size() << " " << region.path << "\n";
  }
  std::cout << "regions: " << regions.value.size() << " bytes: " << total << std::endl;
  log.vrb("listed regions", redlog::field("pid", pid.value), redlog::field("all", request.all));
  return 0;
}

} // namespace p33kx::commands
