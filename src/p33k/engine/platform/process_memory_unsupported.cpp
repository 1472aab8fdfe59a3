#ifndef __linux__

#include "process_memory.hpp"

namespace p33k::engine::platform {

namespace {

constexpr const char* k_unsupported = "process memory access is only implemented for linux";

} // namespace

result<std::vector<memory_region>> enumerate_regions(int) {
  return error_result<std::vector<memory_region>>(error_code::unsupported, k_unsupported);
}

result<std::unique_ptr<memory_reader>> open_process_memory(int) {
  return error_result<std::unique_ptr<memory_reader>>(error_code::unsupported, k_unsupported);
}

result<int> find_process(std::string_view) { return error_result<int>(error_code::unsupported, k_unsupported); }

result<process_identity> query_process(int) {
  return error_result<process_identity>(error_code::unsupported, k_unsupported);
}

bool process_exists(int) { return false; }

result<std::vector<memory_region>> parse_memory_map(std::istream&) {
  return error_result<std::vector<memory_region>>(error_code::unsupported, k_unsupported);
}

} // namespace p33k::engine::platform

#endif // __linux__
