#include <doctest/doctest.h>

#include "p33k/engine/field_offsets.hpp"
#include "p33k/engine/string_decoder.hpp"
#include "test_helpers.hpp"

#include <memory>

namespace {

using p33k::engine::buffer_memory_reader;
using p33k::engine::error_code;
using p33k::engine::string_decoder;
using p33k::engine::string_layout;
using p33k::engine::utf16le_to_utf8;
using p33k::test_helpers::counting_reader;
using p33k::test_helpers::memory_image;

constexpr uint64_t k_base = 0x7000;

} // namespace

TEST_CASE("string decoder reads utf16 payloads") {
  memory_image image(k_base, 0x100);
  image.write_mono_string(k_base, "kernel.hardline");
  auto reader = image.reader();

  string_decoder decoder(reader, string_layout{});
  auto text = decoder.decode(k_base);
  REQUIRE(text.ok());
  CHECK(text.value == "kernel.hardline");
}

TEST_CASE("zero length string decodes to empty text") {
  memory_image image(k_base, 0x40);
  image.write_i32(k_base + 0x10, 0);
  auto reader = image.reader();

  string_decoder decoder(reader, string_layout{});
  auto text = decoder.decode(k_base);
  REQUIRE(text.ok());
  CHECK(text.value.empty());
}

TEST_CASE("implausible length fails without reading the payload") {
  memory_image image(k_base, 0x40);
  image.write_i32(k_base + 0x10, 2000000);

  auto reads = std::make_shared<size_t>(0);
  auto bytes = std::make_shared<size_t>(0);
  counting_reader reader(
      std::make_unique<buffer_memory_reader>(image.base(), std::span<const uint8_t>(image.bytes())), reads, bytes
  );

  string_decoder decoder(reader, string_layout{});
  auto text = decoder.decode(k_base);
  CHECK_FALSE(text.ok());
  CHECK(text.status_info.code == error_code::decode_error);
  CHECK(*reads == 1);
  CHECK(*bytes == 4);
}

TEST_CASE("negative length is a decode error") {
  memory_image image(k_base, 0x40);
  image.write_i32(k_base + 0x10, -4);
  auto reader = image.reader();

  string_decoder decoder(reader, string_layout{});
  auto text = decoder.decode(k_base);
  CHECK_FALSE(text.ok());
  CHECK(text.status_info.code == error_code::decode_error);
}

TEST_CASE("null string object is a decode error") {
  memory_image image(k_base, 0x40);
  auto reader = image.reader();

  string_decoder decoder(reader, string_layout{});
  auto text = decoder.decode(0);
  CHECK_FALSE(text.ok());
  CHECK(text.status_info.code == error_code::decode_error);
}

TEST_CASE("unreadable length field is a read fault") {
  memory_image image(k_base, 0x40);
  auto reader = image.reader();

  string_decoder decoder(reader, string_layout{});
  auto text = decoder.decode(0x1000);
  CHECK_FALSE(text.ok());
  CHECK(text.status_info.code == error_code::read_fault);
}

TEST_CASE("payload running off the mapping is a decode error") {
  memory_image image(k_base, 0x40);
  image.write_i32(k_base + 0x10, 100);
  auto reader = image.reader();

  string_decoder decoder(reader, string_layout{});
  auto text = decoder.decode(k_base);
  CHECK_FALSE(text.ok());
  CHECK(text.status_info.code == error_code::decode_error);
}

TEST_CASE("utf16 conversion handles surrogate pairs") {
  // U+00E9, U+1F600, unpaired high surrogate
  const uint8_t units[] = {0xe9, 0x00, 0x3d, 0xd8, 0x00, 0xde, 0x3d, 0xd8};
  auto text = utf16le_to_utf8(units, 4);
  CHECK(text == "\xc3\xa9\xf0\x9f\x98\x80\xef\xbf\xbd");
}

TEST_CASE("c strings stop at the terminator") {
  memory_image image(k_base, 0x40);
  image.write_cstring(k_base + 0x38, "Window");
  auto reader = image.reader();

  string_decoder decoder(reader, string_layout{});
  // starts near the end of the mapping; a full 16-byte step would fault
  auto text = decoder.decode_cstring(k_base + 0x38, 64);
  REQUIRE(text.ok());
  CHECK(text.value == "Window");
}
