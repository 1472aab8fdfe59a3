#pragma once

#include "engine/address_cache.hpp"
#include "engine/field_offsets.hpp"
#include "engine/memory_reader.hpp"
#include "engine/object_locator.hpp"
#include "engine/process_backend.hpp"
#include "engine/region_catalog.hpp"
#include "engine/result.hpp"
#include "engine/types.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace p33k::engine {

inline constexpr std::string_view k_default_process_name = "hackmud_lin.x86_64";

// windows the game creates at startup
std::vector<std::string> default_window_names();

struct scanner_config {
  std::string process_name = std::string(k_default_process_name);
  // skips the process name search when set
  std::optional<int> pid;
  std::filesystem::path cache_path = address_cache::default_path();
  bool use_cache = true;
  field_offset_table offsets = field_offset_table::defaults();
  std::vector<std::string> window_names = default_window_names();
  uint64_t max_region_size = k_default_max_region_size;
  size_t chunk_size = k_default_chunk_size;
  std::string class_name = "Window";
  std::string class_namespace = "hackmud";
};

enum class scanner_state { disconnected, connecting, connected };

// one attachment to one game process. owns its reader; independent scanners may coexist.
class scanner {
public:
  explicit scanner(scanner_config config = {}, std::unique_ptr<process_backend> backend = nullptr);
  ~scanner();

  scanner(const scanner&) = delete;
  scanner& operator=(const scanner&) = delete;

  // resolves the process, opens its memory and loads or rebuilds the window anchors.
  // any failure leaves the scanner disconnected.
  status connect();

  // releases process resources; safe to call repeatedly
  void close();

  // advisory: the longest "vN.NNN" string found in the managed heap
  result<std::string> get_version();

  // the `line_count` most recent lines of a window, oldest first; 0 returns all
  result<std::vector<std::string>> read_window(std::string_view name, size_t line_count, bool preserve_markup = false);

  // 0 while disconnected
  int process_id() const noexcept { return state_ == scanner_state::connected ? identity_.pid : 0; }
  scanner_state state() const noexcept { return state_; }
  const scanner_config& config() const noexcept { return config_; }

  // located windows by name
  const std::map<std::string, anchor, std::less<>>& anchors() const noexcept { return entry_.anchors; }
  std::optional<uint64_t> window_vtable() const noexcept { return entry_.class_vtable; }

  // raw access for diagnostics; null while disconnected
  const memory_reader* reader() const noexcept { return reader_.get(); }

private:
  status fail(status error);
  status rebuild_anchors();
  void drop_stale_anchors();
  locator_options make_locator_options() const;
  void persist();

  scanner_config config_;
  std::unique_ptr<process_backend> backend_;
  std::optional<address_cache> cache_;
  runtime_layout layout_;
  scanner_state state_ = scanner_state::disconnected;
  process_identity identity_;
  std::unique_ptr<memory_reader> reader_;
  std::unique_ptr<region_catalog> catalog_;
  address_cache_entry entry_;
};

} // namespace p33k::engine
