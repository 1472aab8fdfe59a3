#include <doctest/doctest.h>

#include "p33k/engine/address_cache.hpp"
#include "test_helpers.hpp"

#include <fstream>
#include <set>

#include <nlohmann/json.hpp>

namespace {

using p33k::engine::address_cache;
using p33k::engine::address_cache_entry;
using p33k::engine::error_code;
using p33k::engine::process_identity;
using p33k::test_helpers::temp_cache_path;

address_cache_entry make_entry(int pid, uint64_t start_time) {
  address_cache_entry entry;
  entry.process_id = pid;
  entry.start_time = start_time;
  entry.class_vtable = 0x7f0000103000ULL;
  entry.anchors["shell"] = {0x7f0000200000ULL, 1700000000000};
  entry.anchors["chat"] = {0x7f0000200400ULL, 1700000000001};
  return entry;
}

process_identity identity(int pid, uint64_t start_time) {
  process_identity id;
  id.pid = pid;
  id.start_time = start_time;
  return id;
}

address_cache::liveness_check alive_set(std::set<int> pids) {
  return [pids](int pid) { return pids.count(pid) > 0; };
}

} // namespace

TEST_CASE("stored entry loads back for the same process") {
  temp_cache_path file("round_trip");
  address_cache cache(file.path(), alive_set({100}));

  REQUIRE(cache.store(make_entry(100, 55)).ok());

  auto loaded = cache.load(identity(100, 55));
  REQUIRE(loaded.ok());
  CHECK(loaded.value.process_id == 100);
  CHECK(loaded.value.start_time == 55);
  CHECK(loaded.value.class_vtable == 0x7f0000103000ULL);
  REQUIRE(loaded.value.anchors.size() == 2);
  CHECK(loaded.value.anchors.at("shell").address == 0x7f0000200000ULL);
  CHECK(loaded.value.anchors.at("chat").discovered_at == 1700000000001);
}

TEST_CASE("missing cache file is a miss") {
  temp_cache_path file("missing");
  address_cache cache(file.path(), alive_set({100}));

  auto loaded = cache.load(identity(100, 55));
  CHECK_FALSE(loaded.ok());
  CHECK(loaded.status_info.code == error_code::cache_miss);
}

TEST_CASE("corrupt cache file is a miss and is replaced on store") {
  temp_cache_path file("corrupt");
  {
    std::ofstream out(file.path());
    out << "{ not json";
  }
  address_cache cache(file.path(), alive_set({100}));

  auto loaded = cache.load(identity(100, 55));
  CHECK_FALSE(loaded.ok());
  CHECK(loaded.status_info.code == error_code::cache_miss);

  REQUIRE(cache.store(make_entry(100, 55)).ok());
  CHECK(cache.load(identity(100, 55)).ok());
}

TEST_CASE("other schema versions are ignored") {
  temp_cache_path file("schema");
  {
    std::ofstream out(file.path());
    out << R"({"schema_version": 99, "entries": {}})";
  }
  address_cache cache(file.path(), alive_set({100}));

  auto loaded = cache.load(identity(100, 55));
  CHECK_FALSE(loaded.ok());
  CHECK(loaded.status_info.code == error_code::cache_miss);
}

TEST_CASE("entries of dead processes are pruned") {
  temp_cache_path file("prune");
  address_cache writer(file.path(), alive_set({100, 200}));
  REQUIRE(writer.store(make_entry(100, 55)).ok());
  REQUIRE(writer.store(make_entry(200, 66)).ok());

  // process 100 has exited and 300 is now running
  address_cache reader(file.path(), alive_set({300}));
  auto loaded = reader.load(identity(300, 77));
  CHECK_FALSE(loaded.ok());
  CHECK(loaded.status_info.code == error_code::cache_miss);

  std::ifstream in(file.path());
  auto doc = nlohmann::json::parse(in);
  CHECK(doc["entries"].empty());
}

TEST_CASE("reused pid with another start time is discarded") {
  temp_cache_path file("pid_reuse");
  address_cache cache(file.path(), alive_set({100}));
  REQUIRE(cache.store(make_entry(100, 55)).ok());

  auto loaded = cache.load(identity(100, 56));
  CHECK_FALSE(loaded.ok());
  CHECK(loaded.status_info.code == error_code::cache_miss);

  // the stale entry is gone even for the original identity
  CHECK_FALSE(cache.load(identity(100, 55)).ok());
}

TEST_CASE("invalidating one anchor keeps its siblings") {
  temp_cache_path file("invalidate");
  address_cache cache(file.path(), alive_set({100}));
  REQUIRE(cache.store(make_entry(100, 55)).ok());

  REQUIRE(cache.invalidate(100, "shell").ok());
  REQUIRE(cache.invalidate(100, "not-a-window").ok());
  REQUIRE(cache.invalidate(4321, "shell").ok());

  auto loaded = cache.load(identity(100, 55));
  REQUIRE(loaded.ok());
  CHECK(loaded.value.anchors.count("shell") == 0);
  CHECK(loaded.value.anchors.count("chat") == 1);
  CHECK(loaded.value.class_vtable.has_value());
}

TEST_CASE("discarding an entry removes it") {
  temp_cache_path file("discard");
  address_cache cache(file.path(), alive_set({100}));
  REQUIRE(cache.store(make_entry(100, 55)).ok());
  REQUIRE(cache.discard(100).ok());
  CHECK_FALSE(cache.load(identity(100, 55)).ok());
}

TEST_CASE("store rejects entries without a process") {
  temp_cache_path file("no_pid");
  address_cache cache(file.path(), alive_set({}));
  auto stored = cache.store(address_cache_entry{});
  CHECK_FALSE(stored.ok());
  CHECK(stored.code == error_code::invalid_argument);
}

TEST_CASE("cache file uses hex addresses") {
  temp_cache_path file("format");
  address_cache cache(file.path(), alive_set({100}));
  REQUIRE(cache.store(make_entry(100, 55)).ok());

  std::ifstream in(file.path());
  auto doc = nlohmann::json::parse(in);
  CHECK(doc["schema_version"] == 1);
  const auto& entry = doc["entries"]["100"];
  CHECK(entry["process_id"] == 100);
  CHECK(entry["anchors"]["shell"]["address"].get<std::string>().rfind("0x", 0) == 0);
  CHECK(entry["class_vtable"].is_string());
}
