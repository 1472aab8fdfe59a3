#pragma once

#include "target.hpp"

namespace p33kx::commands {

struct windows_request {
  target_options target;
  // locate every configured window, not only the cached ones
  bool locate_all = false;
};

int windows_command(const windows_request& request);

} // namespace p33kx::commands
