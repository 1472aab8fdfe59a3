#pragma once

#include "engine/field_offsets.hpp"
#include "engine/memory_reader.hpp"
#include "engine/string_decoder.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace p33k::engine {

// transient view of the ring-buffer queue, recomputed on every read
struct queue_snapshot {
  uint64_t queue = 0;
  uint64_t array = 0;
  int32_t head = 0;
  int32_t size = 0;
  int32_t capacity = 0;
};

struct walk_stats {
  size_t slots_visited = 0;
  size_t slots_skipped = 0;
};

// physical slots for logical indices [first, size) of a ring buffer, oldest first.
// corrupt_structure when size > 0 and capacity == 0, or size > capacity.
result<std::vector<uint32_t>> slot_sequence(uint32_t head, uint32_t size, uint32_t capacity, uint32_t first = 0);

// walks window -> output container -> queue -> array -> string objects
class structure_walker {
public:
  structure_walker(const memory_reader& reader, const runtime_layout& layout);

  result<queue_snapshot> snapshot(uint64_t window) const;

  // the `line_count` most recent lines in chronological order; 0 returns all
  result<std::vector<std::string>> walk(uint64_t window, size_t line_count, walk_stats* stats = nullptr) const;

private:
  result<uint64_t> read_required_pointer(uint64_t address, const char* hop) const;

  const memory_reader& reader_;
  runtime_layout layout_;
  string_decoder decoder_;
};

} // namespace p33k::engine
