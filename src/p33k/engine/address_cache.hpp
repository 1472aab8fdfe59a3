#pragma once

#include "engine/result.hpp"
#include "engine/types.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace p33k::engine {

constexpr uint32_t k_cache_schema_version = 1;

struct anchor {
  uint64_t address = 0;
  // milliseconds since the unix epoch
  int64_t discovered_at = 0;
};

struct address_cache_entry {
  int process_id = 0;
  uint64_t start_time = 0;
  uint32_t schema_version = k_cache_schema_version;
  std::optional<uint64_t> class_vtable;
  std::map<std::string, anchor, std::less<>> anchors;
};

int64_t now_millis();

// durable window anchors keyed by process id. a pure optimization: every entry is
// revalidated before use and the file may be deleted at any time.
class address_cache {
public:
  using liveness_check = std::function<bool(int)>;

  explicit address_cache(std::filesystem::path path, liveness_check is_alive = {});

  // cache_miss when absent, unreadable, from another schema, or from a previous process
  // holding the same pid. entries of dead processes are pruned from the file.
  result<address_cache_entry> load(const process_identity& live) const;

  // replaces the entry for entry.process_id; last writer wins
  status store(const address_cache_entry& entry) const;

  // drops one anchor and keeps its siblings
  status invalidate(int process_id, std::string_view window_name) const;

  status discard(int process_id) const;

  const std::filesystem::path& path() const noexcept { return path_; }

  // $XDG_CACHE_HOME/p33k/addresses.json, else ~/.cache/p33k/addresses.json
  static std::filesystem::path default_path();

private:
  std::filesystem::path path_;
  liveness_check is_alive_;
};

} // namespace p33k::engine
