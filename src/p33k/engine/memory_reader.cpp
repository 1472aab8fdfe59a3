#include "memory_reader.hpp"
#include "utils/hex_utils.hpp"

namespace p33k::engine {

result<uint64_t> memory_reader::read_pointer(uint64_t address, size_t pointer_width) const {
  if (pointer_width == 4) {
    auto narrow = read_value<uint32_t>(address);
    if (!narrow.ok()) {
      return error_result<uint64_t>(narrow.status_info);
    }
    return ok_result(static_cast<uint64_t>(narrow.value));
  }
  if (pointer_width != 8) {
    return error_result<uint64_t>(error_code::invalid_argument, "unsupported pointer width");
  }
  return read_value<uint64_t>(address);
}

buffer_memory_reader::buffer_memory_reader(uint64_t base, std::span<const uint8_t> buffer)
    : base_(base), buffer_(buffer) {}

result<std::vector<uint8_t>> buffer_memory_reader::read(uint64_t address, size_t size) const {
  if (address < base_) {
    return error_result<std::vector<uint8_t>>(
        error_code::read_fault, "address below image: " + utils::format_address(address)
    );
  }
  uint64_t offset = address - base_;
  if (offset > buffer_.size() || size > buffer_.size() - offset) {
    return error_result<std::vector<uint8_t>>(
        error_code::read_fault, "address outside image: " + utils::format_address(address)
    );
  }
  auto first = buffer_.begin() + static_cast<std::ptrdiff_t>(offset);
  return ok_result(std::vector<uint8_t>(first, first + static_cast<std::ptrdiff_t>(size)));
}

} // namespace p33k::engine
