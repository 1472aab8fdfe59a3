#include "pattern_scanner.hpp"
#include "pattern_matcher.hpp"
#include "utils/hex_utils.hpp"
#include <redlog.hpp>
#include <algorithm>

namespace p33k::engine {

pattern_scanner::pattern_scanner(const memory_reader& reader) : reader_(reader) {}

result<scan_stats> pattern_scanner::scan(
    const std::vector<memory_region>& regions, const pattern& needle, const scan_options& options,
    const scan_visitor& visitor
) const {
  if (needle.empty()) {
    return error_result<scan_stats>(error_code::invalid_argument, "empty scan pattern");
  }
  if (options.chunk_size == 0) {
    return error_result<scan_stats>(error_code::invalid_argument, "chunk size must be non-zero");
  }

  auto log = redlog::get_logger("p33k.pattern_scanner");
  log.trc(
      "starting pattern scan", redlog::field("pattern", utils::format_bytes(needle.bytes)),
      redlog::field("regions", regions.size()), redlog::field("max_results", options.max_results),
      redlog::field("chunk_size", options.chunk_size)
  );

  scan_stats stats;
  pattern_matcher matcher(needle);
  const size_t overlap = needle.size() - 1;
  bool stopped = false;

  for (const auto& region : regions) {
    if (stopped) {
      break;
    }
    if (region.size() < needle.size()) {
      continue;
    }

    log.ped(
        "scanning region", redlog::field("start", utils::format_address(region.start)),
        redlog::field("size", region.size()), redlog::field("path", region.path.empty() ? "[anonymous]" : region.path)
    );

    bool region_failed = false;
    uint64_t offset = 0;
    while (offset < region.size() && !stopped) {
      uint64_t remaining = region.size() - offset;
      size_t base_chunk_size = static_cast<size_t>(std::min<uint64_t>(options.chunk_size, remaining));
      size_t read_size = base_chunk_size;
      if (base_chunk_size < remaining) {
        read_size = static_cast<size_t>(std::min<uint64_t>(remaining, base_chunk_size + overlap));
      }

      uint64_t chunk_base = region.start + offset;
      auto data = reader_.read(chunk_base, read_size);
      if (!data.ok()) {
        log.dbg(
            "skipping unreadable region", redlog::field("start", utils::format_address(region.start)),
            redlog::field("chunk", utils::format_address(chunk_base)), redlog::field("error", data.status_info.message)
        );
        region_failed = true;
        break;
      }
      stats.bytes_scanned += base_chunk_size;

      for (uint64_t match_offset : matcher.search(data.value.data(), data.value.size())) {
        // matches starting in the overlap tail belong to the next chunk
        if (match_offset >= base_chunk_size) {
          continue;
        }
        uint64_t address = chunk_base + match_offset;
        if (options.alignment > 1 && address % options.alignment != 0) {
          continue;
        }

        ++stats.matches;
        scan_match match;
        match.address = address;
        match.region = &region;
        match.chunk_base = chunk_base;
        match.chunk = std::span<const uint8_t>(data.value.data(), data.value.size());
        match.offset = static_cast<size_t>(match_offset);

        if (visitor(match) == scan_action::stop || (options.max_results > 0 && stats.matches >= options.max_results)) {
          stopped = true;
          break;
        }
      }

      offset += base_chunk_size;
    }

    if (region_failed) {
      ++stats.regions_failed;
    } else {
      ++stats.regions_scanned;
    }
  }

  log.trc(
      "pattern scan completed", redlog::field("matches", stats.matches),
      redlog::field("regions_scanned", stats.regions_scanned), redlog::field("regions_failed", stats.regions_failed)
  );
  return ok_result(stats);
}

result<std::vector<uint64_t>> pattern_scanner::find_all(
    const std::vector<memory_region>& regions, const pattern& needle, const scan_options& options
) const {
  std::vector<uint64_t> addresses;
  auto stats = scan(regions, needle, options, [&addresses](const scan_match& match) {
    addresses.push_back(match.address);
    return scan_action::next;
  });
  if (!stats.ok()) {
    return error_result<std::vector<uint64_t>>(stats.status_info);
  }
  return ok_result(std::move(addresses));
}

result<std::vector<uint64_t>> pattern_scanner::find_all(
    const region_catalog& catalog, const region_filter& filter, const pattern& needle, const scan_options& options
) const {
  auto regions = catalog.regions(filter);
  if (!regions.ok()) {
    return error_result<std::vector<uint64_t>>(regions.status_info);
  }
  return find_all(regions.value, needle, options);
}

result<uint64_t> pattern_scanner::find_first(
    const std::vector<memory_region>& regions, const pattern& needle, const scan_options& options
) const {
  scan_options first_only = options;
  first_only.max_results = 1;

  auto found = find_all(regions, needle, first_only);
  if (!found.ok()) {
    return error_result<uint64_t>(found.status_info);
  }
  if (found.value.empty()) {
    return error_result<uint64_t>(error_code::not_found, "pattern not found");
  }
  return ok_result(found.value.front());
}

} // namespace p33k::engine
