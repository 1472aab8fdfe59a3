#include "class_resolver.hpp"
#include "pattern_scanner.hpp"
#include "string_decoder.hpp"
#include "utils/hex_utils.hpp"
#include <redlog.hpp>
#include <string>

namespace p33k::engine {

namespace {

constexpr size_t k_max_metadata_name = 128;

} // namespace

class_resolver::class_resolver(
    const memory_reader& reader, const region_catalog& catalog, const runtime_layout& layout,
    class_resolver_options options
)
    : reader_(reader), catalog_(catalog), layout_(layout), options_(options) {}

result<uint64_t> class_resolver::vtable_for_class(uint64_t klass, std::string_view name_space) const {
  string_decoder decoder(reader_, layout_.string);

  auto namespace_ptr = reader_.read_pointer(klass + layout_.klass.name_space, layout_.pointer_width);
  if (!namespace_ptr.ok()) {
    return error_result<uint64_t>(namespace_ptr.status_info);
  }
  auto actual_namespace = decoder.decode_cstring(namespace_ptr.value, k_max_metadata_name);
  if (!actual_namespace.ok() || actual_namespace.value != name_space) {
    return error_result<uint64_t>(error_code::not_found, "namespace mismatch");
  }

  auto runtime_info = reader_.read_pointer(klass + layout_.klass.runtime_info, layout_.pointer_width);
  if (!runtime_info.ok() || runtime_info.value == 0) {
    return error_result<uint64_t>(error_code::not_found, "class has no runtime info");
  }
  auto vtable = reader_.read_pointer(runtime_info.value + layout_.klass.runtime_info_vtable, layout_.pointer_width);
  if (!vtable.ok() || vtable.value == 0) {
    return error_result<uint64_t>(error_code::not_found, "class has no vtable");
  }

  auto back = reader_.read_pointer(vtable.value + layout_.klass.vtable_klass, layout_.pointer_width);
  if (!back.ok() || back.value != klass) {
    return error_result<uint64_t>(error_code::not_found, "vtable does not point back to class");
  }
  return vtable;
}

result<uint64_t> class_resolver::resolve_vtable(std::string_view class_name, std::string_view name_space) const {
  auto log = redlog::get_logger("p33k.class_resolver");
  if (class_name.empty()) {
    return error_result<uint64_t>(error_code::invalid_argument, "class name is empty");
  }

  pattern_scanner scanner(reader_);

  region_filter name_filter;
  name_filter.exclude_system = true;
  name_filter.max_region_size = options_.max_region_size;
  auto name_regions = catalog_.regions(name_filter);
  if (!name_regions.ok()) {
    return error_result<uint64_t>(name_regions.status_info);
  }

  // class structures live in the native heap; fall back to private writable memory
  std::vector<memory_region> class_regions;
  auto heap = catalog_.heap_region();
  if (heap.ok()) {
    class_regions.push_back(heap.value);
  } else {
    auto fallback = catalog_.regions(managed_heap_filter(options_.max_region_size));
    if (!fallback.ok()) {
      return error_result<uint64_t>(fallback.status_info);
    }
    class_regions = std::move(fallback.value);
  }

  std::string terminated(class_name);
  terminated.push_back('\0');
  auto name_needle = pattern_from_bytes(
      std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(terminated.data()), terminated.size())
  );

  scan_options name_options;
  name_options.max_results = options_.max_name_hits;
  name_options.chunk_size = options_.chunk_size;
  auto name_hits = scanner.find_all(name_regions.value, name_needle, name_options);
  if (!name_hits.ok()) {
    return error_result<uint64_t>(name_hits.status_info);
  }
  log.dbg(
      "class name candidates", redlog::field("class", std::string(class_name)),
      redlog::field("hits", name_hits.value.size())
  );

  scan_options pointer_options;
  pointer_options.max_results = options_.max_pointer_hits;
  pointer_options.chunk_size = options_.chunk_size;
  pointer_options.alignment = layout_.pointer_width;

  for (uint64_t name_address : name_hits.value) {
    // a metadata name starts right after the previous terminator
    auto before = reader_.read_value<uint8_t>(name_address - 1);
    if (!before.ok() || before.value != 0) {
      continue;
    }

    auto pointer_hits =
        scanner.find_all(class_regions, pattern_from_pointer(name_address, layout_.pointer_width), pointer_options);
    if (!pointer_hits.ok()) {
      return error_result<uint64_t>(pointer_hits.status_info);
    }

    for (uint64_t field_address : pointer_hits.value) {
      if (field_address < layout_.klass.name) {
        continue;
      }
      uint64_t klass = field_address - layout_.klass.name;
      auto vtable = vtable_for_class(klass, name_space);
      if (vtable.ok()) {
        log.dbg(
            "resolved class vtable", redlog::field("class", std::string(class_name)),
            redlog::field("klass", utils::format_address(klass)),
            redlog::field("vtable", utils::format_address(vtable.value))
        );
        return vtable;
      }
    }
  }

  return error_result<uint64_t>(
      error_code::not_found, "class " + std::string(name_space) + "." + std::string(class_name) + " not found"
  );
}

status class_resolver::validate_vtable(uint64_t vtable, std::string_view class_name) const {
  auto klass = reader_.read_pointer(vtable + layout_.klass.vtable_klass, layout_.pointer_width);
  if (!klass.ok()) {
    return klass.status_info;
  }
  auto name_ptr = reader_.read_pointer(klass.value + layout_.klass.name, layout_.pointer_width);
  if (!name_ptr.ok()) {
    return name_ptr.status_info;
  }

  string_decoder decoder(reader_, layout_.string);
  auto name = decoder.decode_cstring(name_ptr.value, k_max_metadata_name);
  if (!name.ok()) {
    return name.status_info;
  }
  if (name.value != class_name) {
    return make_status(error_code::not_found, "vtable class is '" + name.value + "'");
  }
  return ok_status();
}

} // namespace p33k::engine
