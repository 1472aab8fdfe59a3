#include "pattern_matcher.hpp"

namespace p33k::engine {

pattern_matcher::pattern_matcher(pattern needle) : needle_(std::move(needle)) {
  const size_t width = needle_.size();
  if (width == 0) {
    return;
  }

  // a wildcard at index i matches any byte, so no shift may exceed width - 1 - i
  size_t ceiling = width;
  size_t first_fixed = 0;
  for (size_t i = width - 1; i-- > 0;) {
    if (!needle_.mask[i]) {
      ceiling = width - 1 - i;
      first_fixed = i + 1;
      break;
    }
  }

  skip_.fill(ceiling);
  for (size_t i = first_fixed; i + 1 < width; ++i) {
    skip_[needle_.bytes[i]] = width - 1 - i;
  }
  for (auto& step : skip_) {
    if (step == 0) {
      step = 1;
    }
  }
}

std::vector<uint64_t> pattern_matcher::search(const uint8_t* data, size_t size) const {
  std::vector<uint64_t> hits;
  const size_t width = needle_.size();
  if (width == 0 || data == nullptr || size < width) {
    return hits;
  }

  for (size_t at = 0; at + width <= size;) {
    if (matches(data + at)) {
      hits.push_back(at);
      ++at;
      continue;
    }
    at += skip_[data[at + width - 1]];
  }
  return hits;
}

bool pattern_matcher::matches(const uint8_t* window) const {
  for (size_t i = needle_.size(); i-- > 0;) {
    if (needle_.mask[i] && needle_.bytes[i] != window[i]) {
      return false;
    }
  }
  return true;
}

} // namespace p33k::engine
