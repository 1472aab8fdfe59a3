#pragma once

#include "engine/result.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <type_traits>
#include <vector>

namespace p33k::engine {

// read-only byte access into a target address space.
// a read either returns exactly `size` bytes or fails with read_fault.
class memory_reader {
public:
  virtual ~memory_reader() = default;

  virtual result<std::vector<uint8_t>> read(uint64_t address, size_t size) const = 0;

  template <typename T> result<T> read_value(uint64_t address) const {
    static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");
    auto bytes = read(address, sizeof(T));
    if (!bytes.ok()) {
      return error_result<T>(bytes.status_info);
    }
    T value{};
    std::memcpy(&value, bytes.value.data(), sizeof(T));
    return ok_result(value);
  }

  // reads a pointer of the given width (4 or 8 bytes, little endian)
  result<uint64_t> read_pointer(uint64_t address, size_t pointer_width = 8) const;
};

// reader over an in-memory image mapped at `base`
class buffer_memory_reader final : public memory_reader {
public:
  buffer_memory_reader(uint64_t base, std::span<const uint8_t> buffer);

  result<std::vector<uint8_t>> read(uint64_t address, size_t size) const override;

  uint64_t base() const noexcept { return base_; }
  uint64_t end() const noexcept { return base_ + buffer_.size(); }

private:
  uint64_t base_ = 0;
  std::span<const uint8_t> buffer_;
};

} // namespace p33k::engine
