#include "address_cache.hpp"
#include "platform/process_memory.hpp"
#include "utils/env_config.hpp"
#include "utils/hex_utils.hpp"
#include <nlohmann/json.hpp>
#include <redlog.hpp>
#include <chrono>
#include <fstream>
#include <system_error>

namespace p33k::engine {

namespace {

using json = nlohmann::json;

json entry_to_json(const address_cache_entry& entry) {
  json anchors = json::object();
  for (const auto& [name, value] : entry.anchors) {
    anchors[name] = {{"address", utils::format_address(value.address)}, {"discovered_at", value.discovered_at}};
  }

  json out = {
      {"process_id", entry.process_id},
      {"start_time", entry.start_time},
      {"schema_version", entry.schema_version},
      {"anchors", anchors},
  };
  if (entry.class_vtable) {
    out["class_vtable"] = utils::format_address(*entry.class_vtable);
  }
  return out;
}

result<address_cache_entry> entry_from_json(const json& in) {
  try {
    address_cache_entry entry;
    entry.process_id = in.at("process_id").get<int>();
    entry.start_time = in.value("start_time", uint64_t{0});
    entry.schema_version = in.value("schema_version", k_cache_schema_version);

    if (in.contains("class_vtable")) {
      auto vtable = utils::parse_address(in.at("class_vtable").get<std::string>());
      if (!vtable) {
        return error_result<address_cache_entry>(error_code::parse_error, "invalid class_vtable");
      }
      entry.class_vtable = *vtable;
    }

    for (const auto& [name, value] : in.at("anchors").items()) {
      auto address = utils::parse_address(value.at("address").get<std::string>());
      if (!address || *address == 0) {
        return error_result<address_cache_entry>(error_code::parse_error, "invalid address for anchor " + name);
      }
      anchor parsed;
      parsed.address = *address;
      parsed.discovered_at = value.value("discovered_at", int64_t{0});
      entry.anchors[name] = parsed;
    }
    return ok_result(std::move(entry));
  } catch (const json::exception& e) {
    return error_result<address_cache_entry>(error_code::parse_error, e.what());
  }
}

json empty_document() { return {{"schema_version", k_cache_schema_version}, {"entries", json::object()}}; }

// a missing file is an empty document
result<json> read_document(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return ok_result(empty_document());
  }

  std::ifstream in(path);
  if (!in) {
    return error_result<json>(error_code::io_error, "failed to open " + path.string());
  }
  try {
    json doc = json::parse(in);
    if (!doc.is_object() || !doc.contains("entries") || !doc["entries"].is_object()) {
      return error_result<json>(error_code::parse_error, "malformed cache document");
    }
    return ok_result(std::move(doc));
  } catch (const json::exception& e) {
    return error_result<json>(error_code::parse_error, e.what());
  }
}

bool document_schema_matches(const json& doc) {
  auto version = doc.find("schema_version");
  return version != doc.end() && version->is_number_unsigned() && version->get<uint32_t>() == k_cache_schema_version;
}

status write_document(const std::filesystem::path& path, const json& doc) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return make_status(error_code::io_error, "failed to create " + path.parent_path().string() + ": " + ec.message());
    }
  }

  auto temp = path;
  temp += ".tmp";
  {
    std::ofstream out(temp, std::ios::trunc);
    if (!out) {
      return make_status(error_code::io_error, "failed to open " + temp.string());
    }
    out << doc.dump(2) << "\n";
    if (!out) {
      return make_status(error_code::io_error, "failed to write " + temp.string());
    }
  }

  std::filesystem::rename(temp, path, ec);
  if (ec) {
    return make_status(error_code::io_error, "failed to replace " + path.string() + ": " + ec.message());
  }
  return ok_status();
}

// reads the document for modification; anything unusable starts over
json document_for_update(const std::filesystem::path& path) {
  auto doc = read_document(path);
  if (!doc.ok() || !document_schema_matches(doc.value)) {
    return empty_document();
  }
  return doc.value;
}

} // namespace

int64_t now_millis() {
  auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

address_cache::address_cache(std::filesystem::path path, liveness_check is_alive)
    : path_(std::move(path)), is_alive_(std::move(is_alive)) {
  if (!is_alive_) {
    is_alive_ = platform::process_exists;
  }
}

result<address_cache_entry> address_cache::load(const process_identity& live) const {
  auto log = redlog::get_logger("p33k.cache");

  auto doc = read_document(path_);
  if (!doc.ok()) {
    log.dbg("cache unreadable", redlog::field("path", path_.string()), redlog::field("error", doc.status_info.message));
    return error_result<address_cache_entry>(error_code::cache_miss, doc.status_info.message);
  }
  if (!document_schema_matches(doc.value)) {
    log.dbg("cache schema mismatch", redlog::field("path", path_.string()));
    return error_result<address_cache_entry>(error_code::cache_miss, "cache schema mismatch");
  }

  auto& entries = doc.value["entries"];
  bool changed = false;

  for (auto it = entries.begin(); it != entries.end();) {
    int pid = 0;
    try {
      pid = std::stoi(it.key());
    } catch (const std::exception&) {
      pid = 0;
    }
    if (pid != live.pid && (pid <= 0 || !is_alive_(pid))) {
      log.dbg("pruning entry of dead process", redlog::field("pid", it.key()));
      it = entries.erase(it);
      changed = true;
    } else {
      ++it;
    }
  }

  result<address_cache_entry> outcome =
      error_result<address_cache_entry>(error_code::cache_miss, "no entry for pid " + std::to_string(live.pid));

  std::string key = std::to_string(live.pid);
  auto found = entries.find(key);
  if (found != entries.end()) {
    auto entry = entry_from_json(*found);
    if (!entry.ok()) {
      outcome =
          error_result<address_cache_entry>(error_code::cache_miss, "discarded entry: " + entry.status_info.message);
    } else if (entry.value.process_id != live.pid || entry.value.schema_version != k_cache_schema_version) {
      outcome = error_result<address_cache_entry>(error_code::cache_miss, "discarded mismatched entry");
    } else if (entry.value.start_time != 0 && live.start_time != 0 && entry.value.start_time != live.start_time) {
      outcome = error_result<address_cache_entry>(
          error_code::cache_miss, "discarded entry of a previous process with the same pid"
      );
    } else {
      outcome = std::move(entry);
    }

    if (!outcome.ok()) {
      log.dbg(
          "discarding stale entry", redlog::field("pid", live.pid),
          redlog::field("reason", outcome.status_info.message)
      );
      entries.erase(found);
      changed = true;
    }
  }

  if (changed) {
    auto written = write_document(path_, doc.value);
    if (!written.ok()) {
      log.dbg("failed to rewrite pruned cache", redlog::field("error", written.message));
    }
  }

  if (outcome.ok()) {
    log.dbg("cache hit", redlog::field("pid", live.pid), redlog::field("anchors", outcome.value.anchors.size()));
  }
  return outcome;
}

status address_cache::store(const address_cache_entry& entry) const {
  if (entry.process_id <= 0) {
    return make_status(error_code::invalid_argument, "cache entry has no process id");
  }

  json doc = document_for_update(path_);
  doc["entries"][std::to_string(entry.process_id)] = entry_to_json(entry);

  auto log = redlog::get_logger("p33k.cache");
  log.dbg(
      "storing cache entry", redlog::field("pid", entry.process_id), redlog::field("anchors", entry.anchors.size())
  );
  return write_document(path_, doc);
}

status address_cache::invalidate(int process_id, std::string_view window_name) const {
  json doc = document_for_update(path_);
  auto& entries = doc["entries"];
  auto found = entries.find(std::to_string(process_id));
  if (found == entries.end() || !found->contains("anchors")) {
    return ok_status();
  }

  auto& anchors = (*found)["anchors"];
  if (anchors.erase(std::string(window_name)) == 0) {
    return ok_status();
  }
  return write_document(path_, doc);
}

status address_cache::discard(int process_id) const {
  json doc = document_for_update(path_);
  if (doc["entries"].erase(std::to_string(process_id)) == 0) {
    return ok_status();
  }
  return write_document(path_, doc);
}

std::filesystem::path address_cache::default_path() {
  utils::env_config env;
  std::string base = env.get<std::string>("XDG_CACHE_HOME", "");
  if (base.empty()) {
    std::string home = env.get<std::string>("HOME", "");
    if (home.empty()) {
      return std::filesystem::path("p33k_addresses.json");
    }
    base = (std::filesystem::path(home) / ".cache").string();
  }
  return std::filesystem::path(base) / "p33k" / "addresses.json";
}

} // namespace p33k::engine
