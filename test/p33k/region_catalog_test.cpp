#include <doctest/doctest.h>

#include "p33k/engine/platform/process_memory.hpp"
#include "p33k/engine/platform/process_memory_common.hpp"
#include "p33k/engine/region_catalog.hpp"
#include "p33k/engine/types.hpp"
#include "test_helpers.hpp"

#include <optional>
#include <sstream>
#include <string_view>

#if defined(__linux__)
#include <unistd.h>
#endif

namespace {

using p33k::engine::error_code;
using p33k::engine::managed_heap_filter;
using p33k::engine::memory_protection;
using p33k::engine::region_filter;
using p33k::engine::static_region_catalog;
using p33k::test_helpers::make_region;

} // namespace

TEST_CASE("static catalog sorts and filters regions") {
  auto big = make_region(0x900000, 0x900000 + 200 * 1024 * 1024);
  static_region_catalog catalog({
      make_region(0x500000, 0x501000, "/usr/lib/libc.so.6", memory_protection::read_execute),
      make_region(0x100000, 0x180000, "[heap]"),
      make_region(0x300000, 0x340000),
      big,
  });

  auto all = catalog.snapshot();
  REQUIRE(all.ok());
  REQUIRE(all.value.size() == 4);
  CHECK(all.value[0].start == 0x100000);

  auto heap = catalog.regions(managed_heap_filter());
  REQUIRE(heap.ok());
  REQUIRE(heap.value.size() == 2);
  CHECK(heap.value[0].path == "[heap]");
  CHECK(heap.value[1].start == 0x300000);

  region_filter unbounded = managed_heap_filter(0);
  auto with_big = catalog.regions(unbounded);
  REQUIRE(with_big.ok());
  CHECK(with_big.value.size() == 3);
}

TEST_CASE("catalog locates regions by address and the native heap") {
  static_region_catalog catalog({make_region(0x100000, 0x180000, "[heap]"), make_region(0x300000, 0x340000)});

  auto hit = catalog.region_at(0x300010);
  REQUIRE(hit.ok());
  CHECK(hit.value.start == 0x300000);

  auto miss = catalog.region_at(0x200000);
  CHECK_FALSE(miss.ok());
  CHECK(miss.status_info.code == error_code::not_found);

  auto heap = catalog.heap_region();
  REQUIRE(heap.ok());
  CHECK(heap.value.end == 0x180000);
}

TEST_CASE("process names match the executable before the truncated comm") {
  using p33k::engine::platform::process_name_matches;

  CHECK(process_name_matches("hackmud_lin.x86_64", std::string_view("hackmud_lin.x86_64"), ""));
  CHECK(process_name_matches("hackmud_lin.x86_64", std::string_view("hackmud_lin.x86_64 (deleted)"), ""));

  // comm is shared by both, only the executable tells them apart
  CHECK_FALSE(process_name_matches("hackmud_lin.x86_64", std::string_view("hackmud_lin.x86"), "hackmud_lin.x86"));

  // no readable executable: fall back to comm
  CHECK(process_name_matches("hackmud_lin.x86_64", std::nullopt, "hackmud_lin.x86"));
  CHECK_FALSE(process_name_matches("hackmud_lin.x86_64", std::nullopt, "bash"));
  CHECK_FALSE(process_name_matches("hackmud_lin.x86_64", std::nullopt, ""));
}

#if defined(__linux__)

TEST_CASE("memory map parsing reads permissions and paths") {
  std::istringstream maps(
      "55d0c0a00000-55d0c0a21000 rw-p 00000000 00:00 0                          [heap]\n"
      "7f1200000000-7f1200400000 rw-p 00000000 00:00 0 \n"
      "7f1300000000-7f1300028000 r-xp 00000000 08:01 1048602                    /usr/lib/x86_64-linux-gnu/libc.so.6\n"
      "7f1400000000-7f1400001000 rw-s 00000000 00:05 4                          /dev/shm/game data\n"
  );

  auto regions = p33k::engine::platform::parse_memory_map(maps);
  REQUIRE(regions.ok());
  REQUIRE(regions.value.size() == 4);

  CHECK(regions.value[0].start == 0x55d0c0a00000ULL);
  CHECK(regions.value[0].end == 0x55d0c0a21000ULL);
  CHECK(regions.value[0].path == "[heap]");
  CHECK(regions.value[0].protection == memory_protection::read_write);
  CHECK(regions.value[0].is_private);

  CHECK(regions.value[1].path.empty());
  CHECK_FALSE(regions.value[1].is_file_backed());

  CHECK(regions.value[2].protection == memory_protection::read_execute);
  CHECK(regions.value[2].is_system);

  CHECK_FALSE(regions.value[3].is_private);
  CHECK(regions.value[3].path == "/dev/shm/game data");
}

TEST_CASE("memory map parsing rejects malformed lines") {
  std::istringstream maps("not a maps line\n");
  auto regions = p33k::engine::platform::parse_memory_map(maps);
  CHECK_FALSE(regions.ok());
  CHECK(regions.status_info.code == error_code::parse_error);
}

TEST_CASE("own process memory is readable") {
  int pid = static_cast<int>(getpid());
  static const uint64_t marker = 0x5033336b5033336bULL;

  auto reader = p33k::engine::platform::open_process_memory(pid);
  REQUIRE(reader.ok());
  auto value = reader.value->read_value<uint64_t>(reinterpret_cast<uint64_t>(&marker));
  REQUIRE(value.ok());
  CHECK(value.value == marker);

  p33k::engine::process_region_catalog catalog(pid);
  auto region = catalog.region_at(reinterpret_cast<uint64_t>(&marker));
  REQUIRE(region.ok());
  CHECK(p33k::engine::has_protection(region.value.protection, memory_protection::read));

  auto identity = p33k::engine::platform::query_process(pid);
  REQUIRE(identity.ok());
  CHECK(identity.value.pid == pid);
  CHECK(identity.value.start_time > 0);
  CHECK(p33k::engine::platform::process_exists(pid));
}

#endif
