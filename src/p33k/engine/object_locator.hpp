#pragma once

#include "engine/address_cache.hpp"
#include "engine/field_offsets.hpp"
#include "engine/memory_reader.hpp"
#include "engine/region_catalog.hpp"
#include "engine/types.hpp"
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace p33k::engine {

struct locator_options {
  std::string class_name = "Window";
  std::string class_namespace = "hackmud";
  uint64_t max_region_size = k_default_max_region_size;
  // bound on vtable hits examined per scan
  size_t max_candidates = 4096;
  size_t chunk_size = k_default_chunk_size;
};

// finds window objects by name: cached anchor first, then a vtable scan
class object_locator {
public:
  object_locator(
      const memory_reader& reader, const region_catalog& catalog, const runtime_layout& layout,
      locator_options options = {}
  );

  // ok when `address` still holds a window named `name`
  status probe(uint64_t address, std::string_view name, std::optional<uint64_t> vtable = std::nullopt) const;

  // the cached vtable if it still validates, else a fresh resolution stored into `entry`
  result<uint64_t> window_vtable(address_cache_entry& entry) const;

  // a stale anchor is replaced in `entry`; siblings are left alone
  result<uint64_t> locate(std::string_view name, address_cache_entry& entry) const;

  // one pass over the heap; the lowest-addressed match wins for each name
  result<std::map<std::string, uint64_t, std::less<>>> scan_windows(
      uint64_t vtable, const std::vector<std::string>& names
  ) const;

  // resolves the vtable and records every found window in `entry`
  status scan_all(const std::vector<std::string>& names, address_cache_entry& entry) const;

private:
  result<std::string> window_name_at(uint64_t address) const;

  const memory_reader& reader_;
  const region_catalog& catalog_;
  runtime_layout layout_;
  locator_options options_;
};

} // namespace p33k::engine
