#pragma once

#include "engine/result.hpp"
#include "engine/types.hpp"
#include <vector>

namespace p33k::engine {

// source of the target's mapped memory regions, freshly snapshotted per call
class region_catalog {
public:
  virtual ~region_catalog() = default;

  // all regions in ascending address order
  virtual result<std::vector<memory_region>> snapshot() const = 0;

  result<std::vector<memory_region>> regions(const region_filter& filter) const;
  result<memory_region> region_at(uint64_t address) const;
  result<memory_region> heap_region() const;
};

// regions of a live process, parsed from the os memory map
class process_region_catalog final : public region_catalog {
public:
  explicit process_region_catalog(int pid) : pid_(pid) {}

  result<std::vector<memory_region>> snapshot() const override;

private:
  int pid_ = 0;
};

// fixed region list, for dumps and synthetic images
class static_region_catalog final : public region_catalog {
public:
  explicit static_region_catalog(std::vector<memory_region> regions);

  result<std::vector<memory_region>> snapshot() const override;

private:
  std::vector<memory_region> regions_;
};

} // namespace p33k::engine
