#pragma once

#include <cstddef>
#include <string>

#include "target.hpp"

namespace p33kx::commands {

struct read_request {
  target_options target;
  std::string window;
  size_t lines = 0;
  bool colors = false;
};

int read_command(const read_request& request);

} // namespace p33kx::commands
