#pragma once

#include "engine/memory_reader.hpp"
#include "engine/result.hpp"
#include "engine/types.hpp"
#include <istream>
#include <memory>
#include <string_view>
#include <vector>

namespace p33k::engine::platform {

// platform-specific access to another process
result<std::vector<memory_region>> enumerate_regions(int pid);
result<std::unique_ptr<memory_reader>> open_process_memory(int pid);
result<int> find_process(std::string_view name);
result<process_identity> query_process(int pid);
bool process_exists(int pid);

// parses the text of a linux /proc/<pid>/maps file
result<std::vector<memory_region>> parse_memory_map(std::istream& maps);

} // namespace p33k::engine::platform
