#include "util/duration.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <stdexcept>

using namespace gri;
using namespace std::chrono;

TEST_CASE("parse_duration supports combined units", "[duration]") {
  CHECK(parse_duration("1h30m") == seconds{3600 + 30 * 60});
  CHECK(parse_duration("2m5s") == seconds{125});
  CHECK(parse_duration("250ms") == milliseconds{250});
  CHECK(parse_duration("1s500ms") == milliseconds{1500});
  CHECK(parse_duration("10") == seconds{10});
  CHECK(parse_duration("10S") == seconds{10});
  CHECK(parse_duration("") == seconds{0});
}

TEST_CASE("parse_duration rejects invalid strings", "[duration]") {
  CHECK_THROWS_AS(parse_duration("1h30"), std::runtime_error);
  CHECK_THROWS_AS(parse_duration("abc"), std::runtime_error);
  CHECK_THROWS_AS(parse_duration("1.5h"), std::runtime_error);
  CHECK_THROWS_AS(parse_duration("5d"), std::runtime_error);
  CHECK_THROWS_AS(parse_duration("-5s"), std::runtime_error);
}
