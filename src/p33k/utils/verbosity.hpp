#pragma once

#include <redlog.hpp>
#include <algorithm>
#include <array>

#include "env_config.hpp"

namespace p33k::utils {

// each -v moves one step down this ladder; extra flags stay at the bottom
inline redlog::level level_from_verbosity(int count) {
  static constexpr std::array<redlog::level, 5> ladder = {
      redlog::level::info, redlog::level::verbose, redlog::level::trace, redlog::level::debug, redlog::level::pedantic
  };
  const int step = std::clamp(count, 0, static_cast<int>(ladder.size()) - 1);
  return ladder[static_cast<size_t>(step)];
}

// the louder of the flag count and <PREFIX>_VERBOSE wins
inline void apply_verbosity(int flag_count, const env_config& env) {
  redlog::set_level(level_from_verbosity(std::max(flag_count, env.get<int>("VERBOSE", 0))));
}

} // namespace p33k::utils
