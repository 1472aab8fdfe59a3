#pragma once

#include "engine/field_offsets.hpp"
#include "engine/memory_reader.hpp"
#include "engine/region_catalog.hpp"
#include "engine/types.hpp"
#include <string_view>

namespace p33k::engine {

struct class_resolver_options {
  uint64_t max_region_size = k_default_max_region_size;
  size_t max_name_hits = 256;
  size_t max_pointer_hits = 64;
  size_t chunk_size = k_default_chunk_size;
};

// finds the vtable shared by every instance of a managed class.
// the class name string is located first, then the class structure that points at it,
// then the vtable through the class runtime info.
class class_resolver {
public:
  class_resolver(
      const memory_reader& reader, const region_catalog& catalog, const runtime_layout& layout,
      class_resolver_options options = {}
  );

  result<uint64_t> resolve_vtable(std::string_view class_name, std::string_view name_space) const;

  // ok when the vtable's class is still named `class_name`
  status validate_vtable(uint64_t vtable, std::string_view class_name) const;

private:
  result<uint64_t> vtable_for_class(uint64_t klass, std::string_view name_space) const;

  const memory_reader& reader_;
  const region_catalog& catalog_;
  runtime_layout layout_;
  class_resolver_options options_;
};

} // namespace p33k::engine
