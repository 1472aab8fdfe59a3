#include <doctest/doctest.h>

#include "p33k/engine/markup.hpp"

namespace {

using p33k::engine::strip_color_tags;

} // namespace

TEST_CASE("color tags are removed") {
  CHECK(strip_color_tags("<color=#1EFF00FF>ok</color>") == "ok");
  CHECK(strip_color_tags("a<color=red>b</color>c<color=#fff>d") == "abcd");
}

TEST_CASE("other text is untouched") {
  CHECK(strip_color_tags("") == "");
  CHECK(strip_color_tags("plain >> text < 3") == "plain >> text < 3");
  CHECK(strip_color_tags("<b>bold</b>") == "<b>bold</b>");
  CHECK(strip_color_tags("<color=>x") == "<color=>x");
  CHECK(strip_color_tags("<color=unterminated") == "<color=unterminated");
}
