#include "structure_walker.hpp"
#include "utils/hex_utils.hpp"
#include <redlog.hpp>

namespace p33k::engine {

result<std::vector<uint32_t>> slot_sequence(uint32_t head, uint32_t size, uint32_t capacity, uint32_t first) {
  std::vector<uint32_t> slots;
  if (size == 0 || first >= size) {
    return ok_result(std::move(slots));
  }
  if (capacity == 0) {
    return error_result<std::vector<uint32_t>>(error_code::corrupt_structure, "queue has elements but no capacity");
  }
  if (size > capacity) {
    return error_result<std::vector<uint32_t>>(
        error_code::corrupt_structure,
        "queue size " + std::to_string(size) + " exceeds capacity " + std::to_string(capacity)
    );
  }

  uint64_t base = head % capacity;
  slots.reserve(size - first);
  for (uint32_t i = first; i < size; ++i) {
    slots.push_back(static_cast<uint32_t>((base + i) % capacity));
  }
  return ok_result(std::move(slots));
}

structure_walker::structure_walker(const memory_reader& reader, const runtime_layout& layout)
    : reader_(reader), layout_(layout), decoder_(reader, layout.string) {}

result<uint64_t> structure_walker::read_required_pointer(uint64_t address, const char* hop) const {
  auto pointer = reader_.read_pointer(address, layout_.pointer_width);
  if (!pointer.ok()) {
    return error_result<uint64_t>(error_code::read_fault, std::string(hop) + ": " + pointer.status_info.message);
  }
  if (pointer.value == 0) {
    return error_result<uint64_t>(
        error_code::read_fault, std::string(hop) + " is null at " + utils::format_address(address)
    );
  }
  return pointer;
}

result<queue_snapshot> structure_walker::snapshot(uint64_t window) const {
  auto output = read_required_pointer(window + layout_.window.output, "output container");
  if (!output.ok()) {
    return error_result<queue_snapshot>(output.status_info);
  }
  auto queue = read_required_pointer(output.value + layout_.queue.output_queue, "output queue");
  if (!queue.ok()) {
    return error_result<queue_snapshot>(queue.status_info);
  }

  queue_snapshot snap;
  snap.queue = queue.value;

  // fields are read one at a time; the target may mutate the queue in between
  auto size = reader_.read_value<int32_t>(snap.queue + layout_.queue.size);
  if (!size.ok()) {
    return error_result<queue_snapshot>(error_code::read_fault, "queue size: " + size.status_info.message);
  }
  if (size.value < 0) {
    return error_result<queue_snapshot>(
        error_code::corrupt_structure, "negative queue size " + std::to_string(size.value)
    );
  }
  snap.size = size.value;
  if (snap.size == 0) {
    return ok_result(snap);
  }

  auto head = reader_.read_value<int32_t>(snap.queue + layout_.queue.head);
  if (!head.ok()) {
    return error_result<queue_snapshot>(error_code::read_fault, "queue head: " + head.status_info.message);
  }
  if (head.value < 0) {
    return error_result<queue_snapshot>(
        error_code::corrupt_structure, "negative queue head " + std::to_string(head.value)
    );
  }
  snap.head = head.value;

  auto array = read_required_pointer(snap.queue + layout_.queue.array, "queue array");
  if (!array.ok()) {
    return error_result<queue_snapshot>(array.status_info);
  }
  snap.array = array.value;

  auto capacity = reader_.read_value<int32_t>(snap.array + layout_.queue.array_capacity);
  if (!capacity.ok()) {
    return error_result<queue_snapshot>(error_code::read_fault, "array capacity: " + capacity.status_info.message);
  }
  if (capacity.value < 0) {
    return error_result<queue_snapshot>(
        error_code::corrupt_structure, "negative array capacity " + std::to_string(capacity.value)
    );
  }
  snap.capacity = capacity.value;
  return ok_result(snap);
}

result<std::vector<std::string>> structure_walker::walk(uint64_t window, size_t line_count, walk_stats* stats) const {
  auto log = redlog::get_logger("p33k.walker");

  auto snap = snapshot(window);
  if (!snap.ok()) {
    return error_result<std::vector<std::string>>(snap.status_info);
  }
  log.trc(
      "queue snapshot", redlog::field("window", utils::format_address(window)),
      redlog::field("queue", utils::format_address(snap.value.queue)),
      redlog::field("array", utils::format_address(snap.value.array)), redlog::field("head", snap.value.head),
      redlog::field("size", snap.value.size), redlog::field("capacity", snap.value.capacity)
  );

  uint32_t size = static_cast<uint32_t>(snap.value.size);
  uint32_t first = 0;
  if (line_count > 0 && line_count < size) {
    first = size - static_cast<uint32_t>(line_count);
  }

  auto slots = slot_sequence(
      static_cast<uint32_t>(snap.value.head), size, static_cast<uint32_t>(snap.value.capacity), first
  );
  if (!slots.ok()) {
    return error_result<std::vector<std::string>>(slots.status_info);
  }

  walk_stats local;
  std::vector<std::string> lines;
  lines.reserve(slots.value.size());
  for (uint32_t slot : slots.value) {
    ++local.slots_visited;
    uint64_t element_address = snap.value.array + layout_.queue.array_data + uint64_t(slot) * layout_.pointer_width;

    auto element = reader_.read_pointer(element_address, layout_.pointer_width);
    if (!element.ok() || element.value == 0) {
      ++local.slots_skipped;
      continue;
    }

    auto text = decoder_.decode(element.value);
    if (!text.ok()) {
      log.ped("skipping slot", redlog::field("slot", slot), redlog::field("error", text.status_info.message));
      ++local.slots_skipped;
      continue;
    }
    lines.push_back(std::move(text.value));
  }

  if (stats) {
    *stats = local;
  }
  return ok_result(std::move(lines));
}

} // namespace p33k::engine
