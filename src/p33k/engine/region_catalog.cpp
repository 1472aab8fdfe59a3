#include "region_catalog.hpp"
#include "platform/process_memory.hpp"
#include "utils/hex_utils.hpp"
#include <algorithm>

namespace p33k::engine {

result<std::vector<memory_region>> region_catalog::regions(const region_filter& filter) const {
  auto all = snapshot();
  if (!all.ok()) {
    return all;
  }

  std::vector<memory_region> selected;
  for (auto& region : all.value) {
    if (region_matches(region, filter)) {
      selected.push_back(std::move(region));
    }
  }
  return ok_result(std::move(selected));
}

result<memory_region> region_catalog::region_at(uint64_t address) const {
  auto all = snapshot();
  if (!all.ok()) {
    return error_result<memory_region>(all.status_info);
  }
  for (const auto& region : all.value) {
    if (region.contains(address)) {
      return ok_result(region);
    }
  }
  return error_result<memory_region>(error_code::not_found, "no region contains " + utils::format_address(address));
}

result<memory_region> region_catalog::heap_region() const {
  auto all = snapshot();
  if (!all.ok()) {
    return error_result<memory_region>(all.status_info);
  }
  for (const auto& region : all.value) {
    if (region.path == "[heap]") {
      return ok_result(region);
    }
  }
  return error_result<memory_region>(error_code::not_found, "no [heap] region");
}

result<std::vector<memory_region>> process_region_catalog::snapshot() const {
  return platform::enumerate_regions(pid_);
}

static_region_catalog::static_region_catalog(std::vector<memory_region> regions) : regions_(std::move(regions)) {
  std::sort(regions_.begin(), regions_.end(), [](const memory_region& a, const memory_region& b) {
    return a.start < b.start;
  });
}

result<std::vector<memory_region>> static_region_catalog::snapshot() const { return ok_result(regions_); }

} // namespace p33k::engine
