#include <doctest/doctest.h>

#include "p33k/utils/env_config.hpp"
#include "p33k/utils/hex_utils.hpp"
#include "p33k/utils/verbosity.hpp"

#include <cstdlib>

namespace {

using p33k::utils::env_config;
using p33k::utils::format_address;
using p33k::utils::format_bytes;
using p33k::utils::parse_address;

} // namespace

TEST_CASE("addresses format as fixed width hex") {
  CHECK(format_address(0x1234) == "0x0000000000001234");
  CHECK(format_bytes({0xde, 0xad, 0x01}) == "de ad 01");
}

TEST_CASE("addresses parse with or without prefix") {
  CHECK(parse_address("0x7f00dead") == 0x7f00deadULL);
  CHECK(parse_address("7F00DEAD") == 0x7f00deadULL);
  CHECK(parse_address(" 0x10 ") == 0x10ULL);
  CHECK_FALSE(parse_address("").has_value());
  CHECK_FALSE(parse_address("0x").has_value());
  CHECK_FALSE(parse_address("0x12g4").has_value());
  CHECK_FALSE(parse_address("0x11112222333344445").has_value());
}

TEST_CASE("env config reads prefixed variables") {
  setenv("P33KTEST_PROCESS", "  hackmud_lin.x86_64 ", 1);
  setenv("P33KTEST_PID", "4242", 1);
  setenv("P33KTEST_NO_CACHE", "yes", 1);
  setenv("P33KTEST_MAX_REGION_MB", "256", 1);
  setenv("P33KTEST_WINDOWS", "shell, chat,,badge", 1);

  env_config env("P33KTEST");
  CHECK(env.get<std::string>("PROCESS", "") == "hackmud_lin.x86_64");
  CHECK(env.get<int>("PID", 0) == 4242);
  CHECK(env.get<bool>("NO_CACHE", false));
  CHECK(env.get<uint64_t>("MAX_REGION_MB", 0) == 256);
  CHECK(env.get<int>("UNSET", 7) == 7);
  CHECK_FALSE(env.has("UNSET"));

  auto windows = env.get_list("WINDOWS");
  REQUIRE(windows.size() == 3);
  CHECK(windows[1] == "chat");

  unsetenv("P33KTEST_PROCESS");
  unsetenv("P33KTEST_PID");
  unsetenv("P33KTEST_NO_CACHE");
  unsetenv("P33KTEST_MAX_REGION_MB");
  unsetenv("P33KTEST_WINDOWS");
}

TEST_CASE("env config falls back on unparsable numbers") {
  setenv("P33KTEST_PID", "12ab", 1);
  setenv("P33KTEST_MAX_REGION_MB", "0x40", 1);
  setenv("P33KTEST_NO_CACHE", "   ", 1);

  env_config env("P33KTEST_");
  CHECK(env.get<int>("PID", -1) == -1);
  CHECK(env.get<uint64_t>("MAX_REGION_MB", 0) == 0x40);
  CHECK_FALSE(env.has("NO_CACHE"));
  CHECK(env.variable_name("PID") == "P33KTEST_PID");

  unsetenv("P33KTEST_PID");
  unsetenv("P33KTEST_MAX_REGION_MB");
  unsetenv("P33KTEST_NO_CACHE");
}

TEST_CASE("verbosity count maps to log levels") {
  CHECK(p33k::utils::level_from_verbosity(0) == redlog::level::info);
  CHECK(p33k::utils::level_from_verbosity(1) == redlog::level::verbose);
  CHECK(p33k::utils::level_from_verbosity(2) == redlog::level::trace);
  CHECK(p33k::utils::level_from_verbosity(3) == redlog::level::debug);
  CHECK(p33k::utils::level_from_verbosity(9) == redlog::level::pedantic);
  CHECK(p33k::utils::level_from_verbosity(-2) == redlog::level::info);
}
