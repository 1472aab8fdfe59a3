#pragma once

#include "engine/memory_reader.hpp"
#include "engine/pattern.hpp"
#include "engine/region_catalog.hpp"
#include "engine/types.hpp"
#include <functional>
#include <span>
#include <vector>

namespace p33k::engine {

// one match as seen by a scan visitor; `chunk` is the buffer the match was found in
struct scan_match {
  uint64_t address = 0;
  const memory_region* region = nullptr;
  uint64_t chunk_base = 0;
  std::span<const uint8_t> chunk;
  size_t offset = 0;
};

enum class scan_action { next, stop };

using scan_visitor = std::function<scan_action(const scan_match&)>;

struct scan_stats {
  size_t regions_scanned = 0;
  size_t regions_failed = 0;
  uint64_t bytes_scanned = 0;
  size_t matches = 0;
};

// brute-force byte search over target regions, read in bounded chunks.
// adjacent chunks overlap by needle size - 1 so straddling matches are reported once.
// unreadable regions are skipped, never fatal.
class pattern_scanner {
public:
  explicit pattern_scanner(const memory_reader& reader);

  result<scan_stats> scan(
      const std::vector<memory_region>& regions, const pattern& needle, const scan_options& options,
      const scan_visitor& visitor
  ) const;

  // matches in ascending region order, truncated to options.max_results when non-zero
  result<std::vector<uint64_t>> find_all(
      const std::vector<memory_region>& regions, const pattern& needle, const scan_options& options = {}
  ) const;

  result<std::vector<uint64_t>> find_all(
      const region_catalog& catalog, const region_filter& filter, const pattern& needle,
      const scan_options& options = {}
  ) const;

  // not_found when there is no match
  result<uint64_t> find_first(
      const std::vector<memory_region>& regions, const pattern& needle, const scan_options& options = {}
  ) const;

private:
  const memory_reader& reader_;
};

} // namespace p33k::engine
