#include "types.hpp"

namespace p33k::engine {

bool region_matches(const memory_region& region, const region_filter& filter) {
  if (region.size() == 0) {
    return false;
  }
  if (!has_protection(region.protection, filter.required)) {
    return false;
  }
  if (filter.only_private && !region.is_private) {
    return false;
  }
  if (filter.exclude_file_backed && region.is_file_backed()) {
    return false;
  }
  if (filter.exclude_system && region.is_system) {
    return false;
  }
  if (!filter.path_contains.empty() && region.path.find(filter.path_contains) == std::string::npos) {
    return false;
  }
  if (filter.max_region_size > 0 && region.size() > filter.max_region_size) {
    return false;
  }
  if (filter.min_address && region.end <= *filter.min_address) {
    return false;
  }
  if (filter.max_address && region.start >= *filter.max_address) {
    return false;
  }
  return true;
}

} // namespace p33k::engine
