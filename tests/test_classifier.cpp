#include "classifier.h"

#include <catch2/catch.hpp>

#include <cstdint>
#include <vector>

using keygap::ClassifierConfig;
using keygap::InvalidHighKeyError;
using std::uint64_t;
using std::vector;

// NOLINTBEGIN(readability-magic-numbers)
TEST_CASE("Low keys pass through and high keys are rescaled", "[classifier]") {
  auto out = keygap::classify(vector<uint64_t>{100, 0x10000, 0x10008});
  CHECK(out.low == vector<uint64_t>{100});
  CHECK(out.high == vector<uint64_t>{0x10000, 0x10002});
}

TEST_CASE("High key not divisible by the divisor is rejected", "[classifier]") {
  CHECK_THROWS_AS(keygap::classify(vector<uint64_t>{0x10001}),
                  InvalidHighKeyError);
  try {
    keygap::classify(vector<uint64_t>{5, 0x10004, 0x10006});
    FAIL("expected InvalidHighKeyError");
  } catch (const InvalidHighKeyError& err) {
    CHECK(err.value() == 0x10006);
  }
}

TEST_CASE("Relative order is kept within each range", "[classifier]") {
  auto out = keygap::classify(
      vector<uint64_t>{0x10010, 7, 0x10000, 3, 0xFFFF, 0x10004});
  CHECK(out.low == vector<uint64_t>{7, 3, 0xFFFF});
  CHECK(out.high == vector<uint64_t>{0x10004, 0x10000, 0x10001});
}

TEST_CASE("Classifier honours explicit configuration", "[classifier]") {
  ClassifierConfig config;
  config.cutoff = 100;
  config.divisor = 10;
  auto out = keygap::classify(vector<uint64_t>{99, 100, 150, 1000}, config);
  CHECK(out.low == vector<uint64_t>{99});
  CHECK(out.high == vector<uint64_t>{100, 105, 190});

  CHECK(keygap::scale_high_key(120, config) == 102);
  CHECK_THROWS_AS(keygap::scale_high_key(101, config), InvalidHighKeyError);
  CHECK_THROWS_AS(keygap::scale_high_key(50, config), std::invalid_argument);

  config.divisor = 0;
  CHECK_THROWS_AS(keygap::classify(vector<uint64_t>{1}, config),
                  std::invalid_argument);
}

TEST_CASE("Empty input classifies into two empty ranges", "[classifier]") {
  auto out = keygap::classify(vector<uint64_t>{});
  CHECK(out.low.empty());
  CHECK(out.high.empty());
}
// NOLINTEND(readability-magic-numbers)
