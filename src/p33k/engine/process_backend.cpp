#include "process_backend.hpp"
#include "platform/process_memory.hpp"

namespace p33k::engine {

result<int> native_process_backend::find_process(std::string_view name) const {
  return platform::find_process(name);
}

result<process_identity> native_process_backend::identity(int pid) const { return platform::query_process(pid); }

result<std::unique_ptr<memory_reader>> native_process_backend::open_reader(int pid) const {
  return platform::open_process_memory(pid);
}

result<std::unique_ptr<region_catalog>> native_process_backend::open_catalog(int pid) const {
  if (!platform::process_exists(pid)) {
    return error_result<std::unique_ptr<region_catalog>>(
        error_code::process_not_found, "process " + std::to_string(pid) + " does not exist"
    );
  }
  return ok_result<std::unique_ptr<region_catalog>>(std::make_unique<process_region_catalog>(pid));
}

bool native_process_backend::is_alive(int pid) const { return platform::process_exists(pid); }

} // namespace p33k::engine
