#include "scanner.hpp"
#include "markup.hpp"
#include "structure_walker.hpp"
#include "version_probe.hpp"
#include <redlog.hpp>
#include <algorithm>

namespace p33k::engine {

namespace {

redlog::logger scanner_log = redlog::get_logger("p33k.scanner");

} // namespace

std::vector<std::string> default_window_names() {
  return {"shell", "chat", "badge", "breach", "scratch", "binlog", "binmat", "version"};
}

scanner::scanner(scanner_config config, std::unique_ptr<process_backend> backend)
    : config_(std::move(config)), backend_(std::move(backend)) {
  if (!backend_) {
    backend_ = std::make_unique<native_process_backend>();
  }
  if (config_.use_cache) {
    const process_backend* liveness = backend_.get();
    cache_.emplace(config_.cache_path, [liveness](int pid) { return liveness->is_alive(pid); });
  }
}

scanner::~scanner() { close(); }

locator_options scanner::make_locator_options() const {
  locator_options options;
  options.class_name = config_.class_name;
  options.class_namespace = config_.class_namespace;
  options.max_region_size = config_.max_region_size;
  options.chunk_size = config_.chunk_size;
  return options;
}

status scanner::fail(status error) {
  scanner_log.dbg(
      "connect failed", redlog::field("code", error_code_name(error.code)), redlog::field("message", error.message)
  );
  close();
  return error;
}

status scanner::connect() {
  if (state_ == scanner_state::connected) {
    return ok_status();
  }

  auto layout = resolve_layout(config_.offsets);
  if (!layout.ok()) {
    return layout.status_info;
  }
  layout_ = layout.value;
  state_ = scanner_state::connecting;

  int pid = 0;
  if (config_.pid) {
    pid = *config_.pid;
    if (pid <= 0 || !backend_->is_alive(pid)) {
      return fail(make_status(error_code::process_not_found, "process " + std::to_string(pid) + " is not running"));
    }
  } else {
    auto found = backend_->find_process(config_.process_name);
    if (!found.ok()) {
      return fail(found.status_info);
    }
    pid = found.value;
  }

  auto identity = backend_->identity(pid);
  if (!identity.ok()) {
    return fail(identity.status_info);
  }
  identity_ = identity.value;

  auto reader = backend_->open_reader(pid);
  if (!reader.ok()) {
    return fail(reader.status_info);
  }
  reader_ = std::move(reader.value);

  auto catalog = backend_->open_catalog(pid);
  if (!catalog.ok()) {
    return fail(catalog.status_info);
  }
  catalog_ = std::move(catalog.value);

  scanner_log.trc("attached", redlog::field("pid", identity_.pid), redlog::field("start_time", identity_.start_time));

  if (cache_) {
    auto cached = cache_->load(identity_);
    if (cached.ok()) {
      entry_ = std::move(cached.value);
      drop_stale_anchors();
      scanner_log.dbg("using cached anchors", redlog::field("windows", entry_.anchors.size()));
      state_ = scanner_state::connected;
      return ok_status();
    }
    scanner_log.dbg("cache miss", redlog::field("reason", cached.status_info.message));
  }

  auto rebuilt = rebuild_anchors();
  if (!rebuilt.ok()) {
    return fail(rebuilt);
  }

  state_ = scanner_state::connected;
  return ok_status();
}

status scanner::rebuild_anchors() {
  entry_ = address_cache_entry{};
  entry_.process_id = identity_.pid;
  entry_.start_time = identity_.start_time;

  object_locator locator(*reader_, *catalog_, layout_, make_locator_options());
  auto scanned = locator.scan_all(config_.window_names, entry_);
  if (!scanned.ok()) {
    // the class may not be loaded yet; windows are then located on first read
    if (scanned.code != error_code::not_found) {
      return scanned;
    }
    scanner_log.dbg("window class not resolved", redlog::field("reason", scanned.message));
  }

  scanner_log.dbg(
      "scanned for windows", redlog::field("found", entry_.anchors.size()),
      redlog::field("wanted", config_.window_names.size())
  );
  persist();
  return ok_status();
}

// cached anchors that no longer point at the named window are dropped; read_window rescans for them
void scanner::drop_stale_anchors() {
  object_locator locator(*reader_, *catalog_, layout_, make_locator_options());
  size_t dropped = 0;
  for (auto it = entry_.anchors.begin(); it != entry_.anchors.end();) {
    auto valid = locator.probe(it->second.address, it->first, entry_.class_vtable);
    if (valid.ok()) {
      ++it;
      continue;
    }
    scanner_log.trc("dropping stale anchor", redlog::field("name", it->first), redlog::field("reason", valid.message));
    it = entry_.anchors.erase(it);
    ++dropped;
  }
  if (dropped > 0) {
    persist();
  }
}

void scanner::persist() {
  if (!cache_) {
    return;
  }
  auto stored = cache_->store(entry_);
  if (!stored.ok()) {
    scanner_log.dbg(
        "cache not written", redlog::field("path", cache_->path().string()), redlog::field("reason", stored.message)
    );
  }
}

void scanner::close() {
  if (state_ != scanner_state::disconnected) {
    scanner_log.trc("detached", redlog::field("pid", identity_.pid));
  }
  catalog_.reset();
  reader_.reset();
  entry_ = address_cache_entry{};
  identity_ = process_identity{};
  state_ = scanner_state::disconnected;
}

result<std::string> scanner::get_version() {
  if (state_ != scanner_state::connected) {
    return error_result<std::string>(error_code::invalid_state, "scanner is not connected");
  }

  version_probe_options options;
  options.max_region_size = config_.max_region_size;
  options.chunk_size = config_.chunk_size;
  return probe_version(*reader_, *catalog_, options);
}

result<std::vector<std::string>> scanner::read_window(std::string_view name, size_t line_count, bool preserve_markup) {
  using lines = std::vector<std::string>;

  if (state_ != scanner_state::connected) {
    return error_result<lines>(error_code::invalid_state, "scanner is not connected");
  }
  const auto& known = config_.window_names;
  if (std::find(known.begin(), known.end(), name) == known.end()) {
    return error_result<lines>(error_code::invalid_argument, "unknown window '" + std::string(name) + "'");
  }

  auto before = entry_.anchors;
  auto before_vtable = entry_.class_vtable;

  object_locator locator(*reader_, *catalog_, layout_, make_locator_options());
  auto window = locator.locate(name, entry_);
  if (!window.ok()) {
    if (window.code() == error_code::window_not_found && cache_) {
      auto dropped = cache_->invalidate(identity_.pid, name);
      if (!dropped.ok()) {
        scanner_log.dbg("anchor not invalidated", redlog::field("reason", dropped.message));
      }
    }
    return error_result<lines>(window.status_info);
  }

  bool changed = before_vtable != entry_.class_vtable || before.size() != entry_.anchors.size() ||
                 !std::equal(before.begin(), before.end(), entry_.anchors.begin(), [](const auto& a, const auto& b) {
                   return a.first == b.first && a.second.address == b.second.address;
                 });
  if (changed) {
    persist();
  }

  structure_walker walker(*reader_, layout_);
  walk_stats stats;
  auto text = walker.walk(window.value, line_count, &stats);
  if (!text.ok()) {
    return text;
  }
  scanner_log.trc(
      "read window", redlog::field("name", std::string(name)), redlog::field("lines", text.value.size()),
      redlog::field("skipped", stats.slots_skipped)
  );

  if (!preserve_markup) {
    for (auto& line : text.value) {
      line = strip_color_tags(line);
    }
  }
  return text;
}

} // namespace p33k::engine
