#include "field_offsets.hpp"
#include "utils/hex_utils.hpp"
#include <nlohmann/json.hpp>
#include <redlog.hpp>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace p33k::engine {

namespace {

result<uint64_t> offset_from_json(const nlohmann::json& value) {
  if (value.is_number_unsigned()) {
    return ok_result(value.get<uint64_t>());
  }
  if (value.is_number_integer()) {
    auto signed_value = value.get<int64_t>();
    if (signed_value < 0) {
      return error_result<uint64_t>(error_code::parse_error, "negative offset");
    }
    return ok_result(static_cast<uint64_t>(signed_value));
  }
  if (value.is_string()) {
    auto parsed = utils::parse_address(value.get<std::string>());
    if (!parsed) {
      return error_result<uint64_t>(error_code::parse_error, "invalid hex offset '" + value.get<std::string>() + "'");
    }
    return ok_result(*parsed);
  }
  return error_result<uint64_t>(error_code::parse_error, "offset must be a number or hex string");
}

} // namespace

field_offset_table field_offset_table::defaults() {
  field_offset_table table;
  table.structures_ = {
      {"runtime", {{"pointer_width", 8}, {"char_width", 2}}},
      {"mono_class", {{"name", 0x40}, {"namespace", 0x48}, {"runtime_info", 0xc8}}},
      {"mono_runtime_info", {{"vtable", 0x8}}},
      {"mono_vtable", {{"klass", 0x0}}},
      {"mono_string", {{"length", 0x10}, {"data", 0x14}}},
      {"mono_array", {{"max_length", 0x18}, {"data", 0x20}}},
      {"window", {{"name", 0x90}, {"output", 0x78}}},
      {"output", {{"queue", 0x10}}},
      {"queue", {{"array", 0x10}, {"head", 0x20}, {"size", 0x28}}},
  };
  return table;
}

result<field_offset_table> field_offset_table::load(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return error_result<field_offset_table>(error_code::io_error, "failed to open offsets file " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parse(buffer.str());
}

result<field_offset_table> field_offset_table::parse(std::string_view json_text) {
  auto log = redlog::get_logger("p33k.offsets");

  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error& e) {
    return error_result<field_offset_table>(error_code::parse_error, std::string("invalid offsets json: ") + e.what());
  }
  if (!doc.is_object()) {
    return error_result<field_offset_table>(error_code::parse_error, "offsets json must be an object");
  }

  field_offset_table table = defaults();
  if (doc.contains("schema_version")) {
    const auto& version = doc["schema_version"];
    if (!version.is_number_unsigned() || version.get<uint32_t>() != k_offsets_schema_version) {
      return error_result<field_offset_table>(error_code::parse_error, "unsupported offsets schema version");
    }
  }

  auto structures = doc.find("structures");
  if (structures == doc.end()) {
    return ok_result(std::move(table));
  }
  if (!structures->is_object()) {
    return error_result<field_offset_table>(error_code::parse_error, "'structures' must be an object");
  }

  for (const auto& [structure_name, fields] : structures->items()) {
    if (!fields.is_object()) {
      return error_result<field_offset_table>(
          error_code::parse_error, "structure '" + structure_name + "' must be an object"
      );
    }
    for (const auto& [field_name, value] : fields.items()) {
      auto offset = offset_from_json(value);
      if (!offset.ok()) {
        return error_result<field_offset_table>(
            error_code::parse_error, structure_name + "." + field_name + ": " + offset.status_info.message
        );
      }
      log.dbg(
          "offset override", redlog::field("structure", structure_name), redlog::field("field", field_name),
          redlog::field("offset", utils::format_address(offset.value))
      );
      table.set(structure_name, field_name, offset.value);
    }
  }

  return ok_result(std::move(table));
}

result<uint64_t> field_offset_table::get(std::string_view structure, std::string_view field) const {
  auto structure_it = structures_.find(structure);
  if (structure_it != structures_.end()) {
    auto field_it = structure_it->second.find(field);
    if (field_it != structure_it->second.end()) {
      return ok_result(field_it->second);
    }
  }
  return error_result<uint64_t>(
      error_code::invalid_argument, "missing offset " + std::string(structure) + "." + std::string(field)
  );
}

void field_offset_table::set(const std::string& structure, const std::string& field, uint64_t offset) {
  structures_[structure][field] = offset;
}

result<runtime_layout> resolve_layout(const field_offset_table& table) {
  runtime_layout layout;
  status failure;

  auto take = [&](std::string_view structure, std::string_view field, auto& out) {
    if (!failure.ok()) {
      return;
    }
    auto value = table.get(structure, field);
    if (!value.ok()) {
      failure = value.status_info;
      return;
    }
    out = static_cast<std::remove_reference_t<decltype(out)>>(value.value);
  };

  take("runtime", "pointer_width", layout.pointer_width);
  take("runtime", "char_width", layout.string.char_width);
  take("mono_class", "name", layout.klass.name);
  take("mono_class", "namespace", layout.klass.name_space);
  take("mono_class", "runtime_info", layout.klass.runtime_info);
  take("mono_runtime_info", "vtable", layout.klass.runtime_info_vtable);
  take("mono_vtable", "klass", layout.klass.vtable_klass);
  take("mono_string", "length", layout.string.length);
  take("mono_string", "data", layout.string.data);
  take("mono_array", "max_length", layout.queue.array_capacity);
  take("mono_array", "data", layout.queue.array_data);
  take("window", "name", layout.window.name);
  take("window", "output", layout.window.output);
  take("output", "queue", layout.queue.output_queue);
  take("queue", "array", layout.queue.array);
  take("queue", "head", layout.queue.head);
  take("queue", "size", layout.queue.size);

  if (!failure.ok()) {
    return error_result<runtime_layout>(failure);
  }
  if (layout.pointer_width != 4 && layout.pointer_width != 8) {
    return error_result<runtime_layout>(error_code::invalid_argument, "pointer width must be 4 or 8");
  }
  if (layout.string.char_width != 1 && layout.string.char_width != 2) {
    return error_result<runtime_layout>(error_code::invalid_argument, "char width must be 1 or 2");
  }
  return ok_result(layout);
}

} // namespace p33k::engine
