#pragma once

#include <cstddef>
#include <string>

#include "target.hpp"

namespace p33kx::commands {

struct find_request {
  target_options target;
  std::string pattern;
  size_t max_results = 100;
  // scan every readable region instead of the managed heap only
  bool all = false;
};

int find_command(const find_request& request);

} // namespace p33kx::commands
