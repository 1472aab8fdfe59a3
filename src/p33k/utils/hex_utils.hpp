#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace p33k::utils {

// address formatting
std::string format_address(uint64_t address);
std::string format_bytes(const std::vector<uint8_t>& bytes);

// parses "0x1234", "1234" (hex) into an address
std::optional<uint64_t> parse_address(std::string_view text);

// hex digit utilities
bool is_hex_digit(char c);
uint8_t parse_hex_digit(char c);

} // namespace p33k::utils
