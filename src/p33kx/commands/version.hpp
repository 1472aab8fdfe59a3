#pragma once

#include "target.hpp"

namespace p33kx::commands {

struct version_request {
  target_options target;
};

int version_command(const version_request& request);

} // namespace p33kx::commands
