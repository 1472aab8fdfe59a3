#include "object_locator.hpp"
#include "class_resolver.hpp"
#include "pattern_scanner.hpp"
#include "string_decoder.hpp"
#include "utils/hex_utils.hpp"
#include <redlog.hpp>
#include <algorithm>

namespace p33k::engine {

namespace {

redlog::logger locator_log = redlog::get_logger("p33k.locator");

} // namespace

object_locator::object_locator(
    const memory_reader& reader, const region_catalog& catalog, const runtime_layout& layout, locator_options options
)
    : reader_(reader), catalog_(catalog), layout_(layout), options_(std::move(options)) {}

result<std::string> object_locator::window_name_at(uint64_t address) const {
  auto name_ptr = reader_.read_pointer(address + layout_.window.name, layout_.pointer_width);
  if (!name_ptr.ok()) {
    return error_result<std::string>(name_ptr.status_info);
  }
  if (name_ptr.value == 0) {
    return error_result<std::string>(error_code::decode_error, "window has no name");
  }
  string_decoder decoder(reader_, layout_.string);
  return decoder.decode(name_ptr.value);
}

status object_locator::probe(uint64_t address, std::string_view name, std::optional<uint64_t> vtable) const {
  if (vtable) {
    auto header = reader_.read_pointer(address, layout_.pointer_width);
    if (!header.ok()) {
      return header.status_info;
    }
    if (header.value != *vtable) {
      return make_status(error_code::not_found, "object at " + utils::format_address(address) + " has another class");
    }
  }

  auto actual = window_name_at(address);
  if (!actual.ok()) {
    return actual.status_info;
  }
  if (actual.value != name) {
    return make_status(
        error_code::not_found, "object at " + utils::format_address(address) + " is named '" + actual.value + "'"
    );
  }
  return ok_status();
}

result<uint64_t> object_locator::window_vtable(address_cache_entry& entry) const {
  class_resolver_options resolver_options;
  resolver_options.max_region_size = options_.max_region_size;
  resolver_options.chunk_size = options_.chunk_size;
  class_resolver resolver(reader_, catalog_, layout_, resolver_options);

  if (entry.class_vtable) {
    auto valid = resolver.validate_vtable(*entry.class_vtable, options_.class_name);
    if (valid.ok()) {
      return ok_result(*entry.class_vtable);
    }
    locator_log.dbg(
        "cached vtable is stale", redlog::field("vtable", utils::format_address(*entry.class_vtable)),
        redlog::field("reason", valid.message)
    );
    entry.class_vtable.reset();
  }

  auto vtable = resolver.resolve_vtable(options_.class_name, options_.class_namespace);
  if (!vtable.ok()) {
    return vtable;
  }
  entry.class_vtable = vtable.value;
  return vtable;
}

result<std::map<std::string, uint64_t, std::less<>>> object_locator::scan_windows(
    uint64_t vtable, const std::vector<std::string>& names
) const {
  using found_map = std::map<std::string, uint64_t, std::less<>>;

  auto regions = catalog_.regions(managed_heap_filter(options_.max_region_size));
  if (!regions.ok()) {
    return error_result<found_map>(regions.status_info);
  }

  scan_options options;
  options.max_results = options_.max_candidates;
  options.chunk_size = options_.chunk_size;
  options.alignment = layout_.pointer_width;

  found_map found;
  size_t candidates = 0;
  pattern_scanner scanner(reader_);
  auto stats = scanner.scan(
      regions.value, pattern_from_pointer(vtable, layout_.pointer_width), options,
      [&](const scan_match& match) {
        ++candidates;
        auto name = window_name_at(match.address);
        if (!name.ok()) {
          return scan_action::next;
        }
        bool wanted = std::find(names.begin(), names.end(), name.value) != names.end();
        if (wanted && found.find(name.value) == found.end()) {
          locator_log.dbg(
              "found window", redlog::field("name", name.value),
              redlog::field("address", utils::format_address(match.address))
          );
          found.emplace(name.value, match.address);
        }
        return found.size() == names.size() ? scan_action::stop : scan_action::next;
      }
  );
  if (!stats.ok()) {
    return error_result<found_map>(stats.status_info);
  }

  locator_log.trc(
      "window scan completed", redlog::field("vtable", utils::format_address(vtable)),
      redlog::field("candidates", candidates), redlog::field("found", found.size()),
      redlog::field("regions_failed", stats.value.regions_failed)
  );
  return ok_result(std::move(found));
}

result<uint64_t> object_locator::locate(std::string_view name, address_cache_entry& entry) const {
  auto cached = entry.anchors.find(name);
  if (cached != entry.anchors.end()) {
    auto valid = probe(cached->second.address, name, entry.class_vtable);
    if (valid.ok()) {
      locator_log.trc(
          "cached anchor valid", redlog::field("name", std::string(name)),
          redlog::field("address", utils::format_address(cached->second.address))
      );
      return ok_result(cached->second.address);
    }
    locator_log.dbg(
        "cached anchor invalid", redlog::field("name", std::string(name)), redlog::field("reason", valid.message)
    );
    entry.anchors.erase(cached);
  }

  auto vtable = window_vtable(entry);
  if (!vtable.ok()) {
    return error_result<uint64_t>(
        error_code::window_not_found, "window '" + std::string(name) + "': " + vtable.status_info.message
    );
  }

  auto found = scan_windows(vtable.value, {std::string(name)});
  if (!found.ok()) {
    return error_result<uint64_t>(found.status_info);
  }
  auto hit = found.value.find(name);
  if (hit == found.value.end()) {
    return error_result<uint64_t>(
        error_code::window_not_found, "window '" + std::string(name) + "' not found in memory"
    );
  }

  anchor fresh;
  fresh.address = hit->second;
  fresh.discovered_at = now_millis();
  entry.anchors[std::string(name)] = fresh;
  return ok_result(fresh.address);
}

status object_locator::scan_all(const std::vector<std::string>& names, address_cache_entry& entry) const {
  auto vtable = window_vtable(entry);
  if (!vtable.ok()) {
    return vtable.status_info;
  }

  auto found = scan_windows(vtable.value, names);
  if (!found.ok()) {
    return found.status_info;
  }

  int64_t discovered_at = now_millis();
  for (const auto& [name, address] : found.value) {
    anchor fresh;
    fresh.address = address;
    fresh.discovered_at = discovered_at;
    entry.anchors[name] = fresh;
  }
  return ok_status();
}

} // namespace p33k::engine
