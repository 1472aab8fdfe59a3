#include "version_probe.hpp"
#include "pattern_scanner.hpp"
#include "utils/hex_utils.hpp"
#include <redlog.hpp>
#include <algorithm>
#include <cctype>
#include <iterator>
#include <tuple>

namespace p33k::engine {

namespace {

constexpr size_t k_max_version_units = 32;
constexpr size_t k_context_bytes = 64;
constexpr size_t k_min_minor_digits = 2;

bool near_module_banner(std::span<const uint8_t> chunk, size_t offset) {
  static const uint8_t banner[] = {':', 0, ':', 0, ':', 0};
  size_t first = offset > k_context_bytes ? offset - k_context_bytes : 0;
  size_t last = std::min(chunk.size(), offset + k_context_bytes);
  auto window = chunk.subspan(first, last - first);
  return std::search(window.begin(), window.end(), std::begin(banner), std::end(banner)) != window.end();
}

} // namespace

std::optional<version_candidate> parse_version_at(std::span<const uint8_t> data) {
  std::string text;
  size_t units = std::min(k_max_version_units, data.size() / 2);
  for (size_t i = 0; i < units; ++i) {
    if (data[i * 2 + 1] != 0) {
      break;
    }
    char c = static_cast<char>(data[i * 2]);
    if (c != 'v' && c != '.' && !std::isdigit(static_cast<unsigned char>(c))) {
      break;
    }
    text.push_back(c);
  }

  if (text.size() < 4 || text[0] != 'v') {
    return std::nullopt;
  }
  size_t dot = text.find('.');
  if (dot == std::string::npos || dot < 2) {
    return std::nullopt;
  }
  size_t minor_end = dot + 1;
  while (minor_end < text.size() && std::isdigit(static_cast<unsigned char>(text[minor_end]))) {
    ++minor_end;
  }
  for (size_t i = 1; i < dot; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return std::nullopt;
    }
  }
  if (minor_end == dot + 1) {
    return std::nullopt;
  }

  version_candidate candidate;
  candidate.text = text.substr(0, minor_end);
  candidate.minor_digits = minor_end - dot - 1;
  return candidate;
}

result<std::string> probe_version(
    const memory_reader& reader, const region_catalog& catalog, const version_probe_options& options,
    std::vector<version_candidate>* candidates
) {
  auto log = redlog::get_logger("p33k.version");

  auto regions = catalog.regions(managed_heap_filter(options.max_region_size));
  if (!regions.ok()) {
    return error_result<std::string>(regions.status_info);
  }

  scan_options scan;
  scan.chunk_size = options.chunk_size;
  scan.alignment = 2;

  std::vector<version_candidate> found;
  pattern_scanner scanner(reader);
  auto stats = scanner.scan(regions.value, pattern_from_utf16("v"), scan, [&](const scan_match& match) {
    std::span<const uint8_t> tail = match.chunk.subspan(match.offset);
    std::vector<uint8_t> extended;
    if (tail.size() < k_max_version_units * 2) {
      // the string may continue past the chunk; read it directly
      auto direct = reader.read(match.address, k_max_version_units * 2);
      if (direct.ok()) {
        extended = std::move(direct.value);
        tail = std::span<const uint8_t>(extended.data(), extended.size());
      }
    }

    auto candidate = parse_version_at(tail);
    if (!candidate || candidate->minor_digits < k_min_minor_digits) {
      return scan_action::next;
    }
    if (near_module_banner(match.chunk, match.offset)) {
      log.ped("skipping module version", redlog::field("text", candidate->text));
      return scan_action::next;
    }

    candidate->address = match.address;
    log.trc(
        "version candidate", redlog::field("text", candidate->text),
        redlog::field("address", utils::format_address(match.address))
    );
    found.push_back(std::move(*candidate));
    return found.size() >= options.max_candidates ? scan_action::stop : scan_action::next;
  });
  if (!stats.ok()) {
    return error_result<std::string>(stats.status_info);
  }

  if (candidates) {
    *candidates = found;
  }
  if (found.empty()) {
    return error_result<std::string>(error_code::not_found, "no version string found in memory");
  }

  // equally specific candidates are ordered by their text, so the newer release wins
  auto best = std::max_element(found.begin(), found.end(), [](const version_candidate& a, const version_candidate& b) {
    return std::tie(a.minor_digits, a.text) < std::tie(b.minor_digits, b.text);
  });
  return ok_result(best->text);
}

} // namespace p33k::engine
