#pragma once

#include "engine/field_offsets.hpp"
#include "engine/memory_reader.hpp"
#include <string>
#include <string_view>

namespace p33k::engine {

// decodes length-prefixed fixed-width runtime strings into utf-8
class string_decoder {
public:
  string_decoder(const memory_reader& reader, string_layout layout);

  // read_fault if the length field is unreadable; decode_error for a null object,
  // a length outside [0, max_length], or an unreadable payload
  result<std::string> decode(uint64_t string_object) const;

  // nul-terminated single-byte string, used for runtime metadata names
  result<std::string> decode_cstring(uint64_t address, size_t max_length) const;

  const string_layout& layout() const noexcept { return layout_; }

private:
  const memory_reader& reader_;
  string_layout layout_;
};

// utf-16le code units to utf-8; unpaired surrogates become U+FFFD
std::string utf16le_to_utf8(const uint8_t* data, size_t units);

} // namespace p33k::engine
