#include "string_decoder.hpp"
#include "utils/hex_utils.hpp"
#include <algorithm>

namespace p33k::engine {

namespace {

void append_utf8(std::string& out, uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xc0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3f)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xe0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3f)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3f)));
  } else {
    out.push_back(static_cast<char>(0xf0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3f)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3f)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3f)));
  }
}

constexpr uint32_t k_replacement_char = 0xfffd;

} // namespace

std::string utf16le_to_utf8(const uint8_t* data, size_t units) {
  std::string out;
  out.reserve(units);

  auto unit_at = [data](size_t index) -> uint32_t {
    return static_cast<uint32_t>(data[index * 2]) | (static_cast<uint32_t>(data[index * 2 + 1]) << 8);
  };

  for (size_t i = 0; i < units; ++i) {
    uint32_t unit = unit_at(i);
    if (unit >= 0xd800 && unit <= 0xdbff) {
      if (i + 1 < units) {
        uint32_t low = unit_at(i + 1);
        if (low >= 0xdc00 && low <= 0xdfff) {
          append_utf8(out, 0x10000 + ((unit - 0xd800) << 10) + (low - 0xdc00));
          ++i;
          continue;
        }
      }
      append_utf8(out, k_replacement_char);
    } else if (unit >= 0xdc00 && unit <= 0xdfff) {
      append_utf8(out, k_replacement_char);
    } else {
      append_utf8(out, unit);
    }
  }
  return out;
}

string_decoder::string_decoder(const memory_reader& reader, string_layout layout)
    : reader_(reader), layout_(layout) {}

result<std::string> string_decoder::decode(uint64_t string_object) const {
  if (string_object == 0) {
    return error_result<std::string>(error_code::decode_error, "null string object");
  }

  auto length = reader_.read_value<int32_t>(string_object + layout_.length);
  if (!length.ok()) {
    return error_result<std::string>(length.status_info);
  }
  if (length.value < 0 || length.value > layout_.max_length) {
    return error_result<std::string>(
        error_code::decode_error,
        "implausible string length " + std::to_string(length.value) + " at " + utils::format_address(string_object)
    );
  }
  if (length.value == 0) {
    return ok_result(std::string());
  }

  size_t units = static_cast<size_t>(length.value);
  auto payload = reader_.read(string_object + layout_.data, units * layout_.char_width);
  if (!payload.ok()) {
    return error_result<std::string>(
        error_code::decode_error, "string payload unreadable: " + payload.status_info.message
    );
  }

  if (layout_.char_width == 1) {
    return ok_result(std::string(payload.value.begin(), payload.value.end()));
  }
  return ok_result(utf16le_to_utf8(payload.value.data(), units));
}

result<std::string> string_decoder::decode_cstring(uint64_t address, size_t max_length) const {
  if (address == 0) {
    return error_result<std::string>(error_code::decode_error, "null string pointer");
  }

  // read in small steps so a name near the end of a mapping is still readable
  size_t step = 16;
  std::string text;
  while (text.size() < max_length) {
    size_t want = std::min(step, max_length - text.size());
    auto bytes = reader_.read(address + text.size(), want);
    if (!bytes.ok()) {
      if (want > 1) {
        step = 1;
        continue;
      }
      return error_result<std::string>(bytes.status_info);
    }
    for (uint8_t byte : bytes.value) {
      if (byte == 0) {
        return ok_result(std::move(text));
      }
      text.push_back(static_cast<char>(byte));
    }
  }
  return error_result<std::string>(
      error_code::decode_error, "unterminated string at " + utils::format_address(address)
  );
}

} // namespace p33k::engine
