#include "pattern.hpp"
#include "utils/hex_utils.hpp"
#include <cctype>
#include <string>

namespace p33k::engine {

result<pattern> parse_signature(std::string_view hex) {
  pattern parsed;

  size_t i = 0;
  while (i < hex.size()) {
    char c = hex[i];
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++i;
      continue;
    }

    if (c == '?') {
      // "?" and "??" are both a single wildcard byte
      i += (i + 1 < hex.size() && hex[i + 1] == '?') ? 2 : 1;
      parsed.bytes.push_back(0x00);
      parsed.mask.push_back(0);
      continue;
    }

    if (i + 1 >= hex.size() || !utils::is_hex_digit(c) || !utils::is_hex_digit(hex[i + 1])) {
      return error_result<pattern>(
          error_code::invalid_argument, "invalid hex pattern at offset " + std::to_string(i)
      );
    }

    uint8_t high = utils::parse_hex_digit(c);
    uint8_t low = utils::parse_hex_digit(hex[i + 1]);
    parsed.bytes.push_back(static_cast<uint8_t>((high << 4) | low));
    parsed.mask.push_back(1);
    i += 2;
  }

  if (parsed.empty()) {
    return error_result<pattern>(error_code::invalid_argument, "empty pattern");
  }
  return ok_result(std::move(parsed));
}

pattern pattern_from_bytes(std::span<const uint8_t> bytes) {
  pattern result;
  result.bytes.assign(bytes.begin(), bytes.end());
  result.mask.assign(bytes.size(), 1);
  return result;
}

pattern pattern_from_pointer(uint64_t value, size_t pointer_width) {
  pattern result;
  for (size_t i = 0; i < pointer_width; ++i) {
    result.bytes.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xff));
  }
  result.mask.assign(result.bytes.size(), 1);
  return result;
}

pattern pattern_from_utf16(std::string_view ascii) {
  pattern result;
  result.bytes.reserve(ascii.size() * 2);
  for (char c : ascii) {
    result.bytes.push_back(static_cast<uint8_t>(c));
    result.bytes.push_back(0x00);
  }
  result.mask.assign(result.bytes.size(), 1);
  return result;
}

} // namespace p33k::engine
