#pragma once

#include "engine/types.hpp"
#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace p33k::engine::platform {

// shared libraries and loader mappings the game never allocates managed objects in
inline bool is_system_region(const memory_region& region) {
  static constexpr std::array<std::string_view, 6> system_prefixes = {
      "/lib/", "/lib64/", "/usr/lib/", "/usr/lib64/", "/usr/libexec/", "[vdso]"
  };
  std::string_view path = region.path;
  for (auto prefix : system_prefixes) {
    if (path.substr(0, prefix.size()) == prefix) {
      return true;
    }
  }
  return false;
}

// the kernel truncates comm to this many characters
inline constexpr size_t k_comm_length = 15;

// compares the executable's file name when it is readable, otherwise the truncated comm
inline bool process_name_matches(
    std::string_view wanted, std::optional<std::string_view> exe_name, std::string_view comm
) {
  if (exe_name) {
    constexpr std::string_view replaced = " (deleted)";
    std::string_view exe = *exe_name;
    if (exe.size() > replaced.size() && exe.substr(exe.size() - replaced.size()) == replaced) {
      exe.remove_suffix(replaced.size());
    }
    return exe == wanted;
  }
  return !comm.empty() && comm == wanted.substr(0, k_comm_length);
}

} // namespace p33k::engine::platform
