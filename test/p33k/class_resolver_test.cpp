#include <doctest/doctest.h>

#include "p33k/engine/class_resolver.hpp"
#include "p33k/engine/field_offsets.hpp"
#include "p33k/engine/region_catalog.hpp"
#include "test_helpers.hpp"

namespace {

using p33k::engine::class_resolver;
using p33k::engine::error_code;
using p33k::engine::runtime_layout;
using p33k::engine::static_region_catalog;
using p33k::test_helpers::game_image;

} // namespace

TEST_CASE("class resolver finds the window vtable") {
  game_image game;
  auto reader = game.image.reader();
  static_region_catalog catalog(game.regions());

  class_resolver resolver(reader, catalog, runtime_layout{});
  auto vtable = resolver.resolve_vtable("Window", "hackmud");
  REQUIRE(vtable.ok());
  CHECK(vtable.value == game_image::k_vtable);
  CHECK(resolver.validate_vtable(vtable.value, "Window").ok());
}

TEST_CASE("class resolver ignores a class from another namespace") {
  game_image game;
  // a second "Window" class in another namespace, at a lower address than the real one
  uint64_t other_name = 0x100020;
  uint64_t other_namespace = 0x100040;
  uint64_t other_klass = 0x100800;
  game.image.write_cstring(other_name, "Window");
  game.image.write_cstring(other_namespace, "UnityEngine");
  game.image.write_u64(other_klass + 0x40, other_name);
  game.image.write_u64(other_klass + 0x48, other_namespace);

  auto reader = game.image.reader();
  static_region_catalog catalog(game.regions());

  class_resolver resolver(reader, catalog, runtime_layout{});
  auto vtable = resolver.resolve_vtable("Window", "hackmud");
  REQUIRE(vtable.ok());
  CHECK(vtable.value == game_image::k_vtable);
}

TEST_CASE("class resolver rejects a vtable that does not point back") {
  game_image game;
  game.image.write_u64(game_image::k_vtable, 0xdeadbeef);
  auto reader = game.image.reader();
  static_region_catalog catalog(game.regions());

  class_resolver resolver(reader, catalog, runtime_layout{});
  auto vtable = resolver.resolve_vtable("Window", "hackmud");
  CHECK_FALSE(vtable.ok());
  CHECK(vtable.status_info.code == error_code::not_found);
}

TEST_CASE("vtable validation detects another class") {
  game_image game;
  auto reader = game.image.reader();
  static_region_catalog catalog(game.regions());

  class_resolver resolver(reader, catalog, runtime_layout{});
  auto wrong_name = resolver.validate_vtable(game_image::k_vtable, "Shell");
  CHECK_FALSE(wrong_name.ok());
  CHECK(wrong_name.code == error_code::not_found);

  auto unmapped = resolver.validate_vtable(0x10, "Window");
  CHECK_FALSE(unmapped.ok());
  CHECK(unmapped.code == error_code::read_fault);
}
