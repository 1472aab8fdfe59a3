#pragma once

#include "target.hpp"

namespace p33kx::commands {

struct regions_request {
  target_options target;
  // include regions the window scan skips
  bool all = false;
};

int regions_command(const regions_request& request);

} // namespace p33kx::commands
