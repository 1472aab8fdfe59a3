#pragma once

#include "result.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace p33k::engine {

// byte pattern with mask; mask byte 1 means match, 0 means wildcard
struct pattern {
  std::vector<uint8_t> bytes;
  std::vector<uint8_t> mask;

  size_t size() const noexcept { return bytes.size(); }
  bool empty() const noexcept { return bytes.empty(); }
};

// "48 8b ?? 05" style signatures
result<pattern> parse_signature(std::string_view hex);

pattern pattern_from_bytes(std::span<const uint8_t> bytes);

// little-endian encoding of a pointer value, as stored in target memory
pattern pattern_from_pointer(uint64_t value, size_t pointer_width = 8);

// utf-16le encoding of ascii text, the managed runtime's string encoding
pattern pattern_from_utf16(std::string_view ascii);

} // namespace p33k::engine
