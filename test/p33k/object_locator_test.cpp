#include <doctest/doctest.h>

#include "p33k/engine/address_cache.hpp"
#include "p33k/engine/field_offsets.hpp"
#include "p33k/engine/object_locator.hpp"
#include "p33k/engine/region_catalog.hpp"
#include "test_helpers.hpp"

#include <string>
#include <vector>

namespace {

using p33k::engine::address_cache_entry;
using p33k::engine::error_code;
using p33k::engine::object_locator;
using p33k::engine::runtime_layout;
using p33k::engine::static_region_catalog;
using p33k::test_helpers::game_image;

} // namespace

TEST_CASE("scan finds every named window") {
  game_image game;
  uint64_t shell = game.add_window("shell", {"hello"});
  uint64_t chat = game.add_window("chat", {"hi"});
  auto reader = game.image.reader();
  static_region_catalog catalog(game.regions());

  object_locator locator(reader, catalog, runtime_layout{});
  address_cache_entry entry;
  REQUIRE(locator.scan_all({"shell", "chat", "badge"}, entry).ok());

  CHECK(entry.class_vtable == game_image::k_vtable);
  REQUIRE(entry.anchors.size() == 2);
  CHECK(entry.anchors.at("shell").address == shell);
  CHECK(entry.anchors.at("chat").address == chat);
  CHECK(entry.anchors.at("shell").discovered_at > 0);
}

TEST_CASE("lowest addressed window wins when names repeat") {
  game_image game;
  uint64_t first = game.add_window("shell", {"old"});
  game.add_window("shell", {"new"});
  auto reader = game.image.reader();
  static_region_catalog catalog(game.regions());

  object_locator locator(reader, catalog, runtime_layout{});
  auto found = locator.scan_windows(game_image::k_vtable, {"shell"});
  REQUIRE(found.ok());
  CHECK(found.value.at("shell") == first);
}

TEST_CASE("probe validates both class and name") {
  game_image game;
  uint64_t shell = game.add_window("shell", {"x"});
  auto reader = game.image.reader();
  static_region_catalog catalog(game.regions());

  object_locator locator(reader, catalog, runtime_layout{});
  CHECK(locator.probe(shell, "shell", game_image::k_vtable).ok());
  CHECK(locator.probe(shell, "shell").ok());
  CHECK_FALSE(locator.probe(shell, "chat", game_image::k_vtable).ok());
  CHECK_FALSE(locator.probe(shell, "shell", game_image::k_vtable + 8).ok());
}

TEST_CASE("stale anchor is replaced and siblings survive") {
  game_image game;
  uint64_t shell = game.add_window("shell", {"a"});
  uint64_t chat = game.add_window("chat", {"b"});
  auto reader = game.image.reader();
  static_region_catalog catalog(game.regions());

  object_locator locator(reader, catalog, runtime_layout{});
  address_cache_entry entry;
  entry.class_vtable = game_image::k_vtable;
  entry.anchors["shell"] = {shell + 0x40, 1};
  entry.anchors["chat"] = {chat, 2};

  auto located = locator.locate("shell", entry);
  REQUIRE(located.ok());
  CHECK(located.value == shell);
  CHECK(entry.anchors.at("shell").address == shell);
  CHECK(entry.anchors.at("shell").discovered_at > 1);
  CHECK(entry.anchors.at("chat").address == chat);
  CHECK(entry.anchors.at("chat").discovered_at == 2);
}

TEST_CASE("valid cached anchor is returned without rescanning") {
  game_image game;
  uint64_t shell = game.add_window("shell", {"a"});
  auto reader = game.image.reader();
  static_region_catalog catalog(game.regions());

  object_locator locator(reader, catalog, runtime_layout{});
  address_cache_entry entry;
  entry.class_vtable = game_image::k_vtable;
  entry.anchors["shell"] = {shell, 7};

  auto located = locator.locate("shell", entry);
  REQUIRE(located.ok());
  CHECK(located.value == shell);
  CHECK(entry.anchors.at("shell").discovered_at == 7);
}

TEST_CASE("missing window is reported and not recorded") {
  game_image game;
  game.add_window("shell", {"a"});
  auto reader = game.image.reader();
  static_region_catalog catalog(game.regions());

  object_locator locator(reader, catalog, runtime_layout{});
  address_cache_entry entry;
  auto located = locator.locate("binmat", entry);
  CHECK_FALSE(located.ok());
  CHECK(located.status_info.code == error_code::window_not_found);
  CHECK(entry.anchors.count("binmat") == 0);
}

TEST_CASE("stale cached vtable is resolved again") {
  game_image game;
  uint64_t shell = game.add_window("shell", {"a"});
  auto reader = game.image.reader();
  static_region_catalog catalog(game.regions());

  object_locator locator(reader, catalog, runtime_layout{});
  address_cache_entry entry;
  entry.class_vtable = 0x100010;

  auto vtable = locator.window_vtable(entry);
  REQUIRE(vtable.ok());
  CHECK(vtable.value == game_image::k_vtable);
  CHECK(entry.class_vtable == game_image::k_vtable);

  auto located = locator.locate("shell", entry);
  REQUIRE(located.ok());
  CHECK(located.value == shell);
}
