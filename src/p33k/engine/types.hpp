#pragma once

#include "result.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace p33k::engine {

// memory protection flags as reported by the process memory map
enum class memory_protection : int {
  none = 0x00,
  read = 0x01,
  write = 0x02,
  execute = 0x04,
  read_write = read | write,
  read_execute = read | execute,
  read_write_execute = read | write | execute
};

constexpr memory_protection operator|(memory_protection a, memory_protection b) {
  return static_cast<memory_protection>(static_cast<int>(a) | static_cast<int>(b));
}

constexpr memory_protection operator&(memory_protection a, memory_protection b) {
  return static_cast<memory_protection>(static_cast<int>(a) & static_cast<int>(b));
}

constexpr bool has_protection(memory_protection flags, memory_protection check) { return (flags & check) == check; }

// one mapping of the target address space, [start, end)
struct memory_region {
  uint64_t start = 0;
  uint64_t end = 0;
  memory_protection protection = memory_protection::none;
  bool is_private = true;
  bool is_system = false;
  std::string path;

  uint64_t size() const noexcept { return end > start ? end - start : 0; }
  bool contains(uint64_t address) const noexcept { return address >= start && address < end; }
  bool is_file_backed() const noexcept { return !path.empty() && path.front() == '/'; }
};

constexpr uint64_t k_default_max_region_size = 100ull * 1024 * 1024;

struct region_filter {
  memory_protection required = memory_protection::read;
  bool only_private = false;
  bool exclude_file_backed = false;
  bool exclude_system = false;
  // substring match against the region path, empty matches all
  std::string path_contains;
  // size ceiling; 0 disables it
  uint64_t max_region_size = k_default_max_region_size;
  std::optional<uint64_t> min_address;
  std::optional<uint64_t> max_address;
};

// filter for regions that plausibly hold managed objects
inline region_filter managed_heap_filter(uint64_t max_region_size = k_default_max_region_size) {
  region_filter filter;
  filter.required = memory_protection::read_write;
  filter.only_private = true;
  filter.exclude_file_backed = true;
  filter.max_region_size = max_region_size;
  return filter;
}

bool region_matches(const memory_region& region, const region_filter& filter);

constexpr size_t k_default_chunk_size = 1024 * 1024;

struct scan_options {
  // 0 means unlimited
  size_t max_results = 0;
  size_t chunk_size = k_default_chunk_size;
  // only report matches aligned to this boundary; 0 or 1 disables
  size_t alignment = 0;
};

// identity of a live process; start_time disambiguates pid reuse
struct process_identity {
  int pid = 0;
  uint64_t start_time = 0;
};

} // namespace p33k::engine
