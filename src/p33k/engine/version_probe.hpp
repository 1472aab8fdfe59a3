#pragma once

#include "engine/memory_reader.hpp"
#include "engine/region_catalog.hpp"
#include "engine/types.hpp"
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace p33k::engine {

struct version_probe_options {
  uint64_t max_region_size = k_default_max_region_size;
  size_t max_candidates = 50;
  size_t chunk_size = k_default_chunk_size;
};

struct version_candidate {
  std::string text;
  uint64_t address = 0;
  size_t minor_digits = 0;
};

// best-effort search for the game's "vN.NNN" version string. there is no structural
// anchor, so the result is advisory: candidates inside module banners (":::") are
// dropped and the one with the longest minor part wins, the greatest text on ties.
result<std::string> probe_version(
    const memory_reader& reader, const region_catalog& catalog, const version_probe_options& options = {},
    std::vector<version_candidate>* candidates = nullptr
);

// parses "v<digits>.<digits>" at the start of utf-16le `data`
std::optional<version_candidate> parse_version_at(std::span<const uint8_t> data);

} // namespace p33k::engine
