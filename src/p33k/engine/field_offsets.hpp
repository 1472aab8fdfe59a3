#pragma once

#include "engine/result.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace p33k::engine {

constexpr uint32_t k_offsets_schema_version = 1;
constexpr int32_t k_default_max_string_length = 1000000;

// hand-calibrated byte offsets of runtime structures, keyed structure -> field.
// valid for one build of the target runtime; never derived at runtime.
class field_offset_table {
public:
  using field_map = std::map<std::string, uint64_t, std::less<>>;
  using structure_map = std::map<std::string, field_map, std::less<>>;

  field_offset_table() = default;

  // calibration for the current linux build of the game
  static field_offset_table defaults();

  // defaults overridden field by field by the json file at `path`
  static result<field_offset_table> load(const std::filesystem::path& path);
  static result<field_offset_table> parse(std::string_view json_text);

  result<uint64_t> get(std::string_view structure, std::string_view field) const;
  void set(const std::string& structure, const std::string& field, uint64_t offset);

  uint32_t schema_version() const noexcept { return schema_version_; }
  const structure_map& structures() const noexcept { return structures_; }

private:
  uint32_t schema_version_ = k_offsets_schema_version;
  structure_map structures_;
};

struct string_layout {
  uint64_t length = 0x10;
  uint64_t data = 0x14;
  size_t char_width = 2;
  int32_t max_length = k_default_max_string_length;
};

struct class_layout {
  uint64_t name = 0x40;
  uint64_t name_space = 0x48;
  uint64_t runtime_info = 0xc8;
  uint64_t runtime_info_vtable = 0x8;
  uint64_t vtable_klass = 0x0;
};

struct window_layout {
  uint64_t name = 0x90;
  uint64_t output = 0x78;
};

// output container -> ring-buffer queue -> backing array
struct queue_layout {
  uint64_t output_queue = 0x10;
  uint64_t array = 0x10;
  uint64_t head = 0x20;
  uint64_t size = 0x28;
  uint64_t array_capacity = 0x18;
  uint64_t array_data = 0x20;
};

struct runtime_layout {
  size_t pointer_width = 8;
  string_layout string;
  class_layout klass;
  window_layout window;
  queue_layout queue;
};

// fails with invalid_argument naming the first missing field
result<runtime_layout> resolve_layout(const field_offset_table& table);

} // namespace p33k::engine
