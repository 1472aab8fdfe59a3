#pragma once

#include "pattern.hpp"
#include <array>
#include <cstdint>
#include <vector>

namespace p33k::engine {

// Horspool search for a masked pattern. Wildcards bound the shift: no byte may skip past the
// rightmost wildcard that precedes the final position.
class pattern_matcher {
public:
  explicit pattern_matcher(pattern needle);

  // offsets of every match in [data, data + size), overlapping matches included
  std::vector<uint64_t> search(const uint8_t* data, size_t size) const;

private:
  pattern needle_;
  std::array<size_t, 256> skip_{};

  bool matches(const uint8_t* window) const;
};

} // namespace p33k::engine
