#include "group_stats.h"

#include <catch2/catch.hpp>

#include <cstdint>
#include <vector>

using keygap::Group;
using std::uint64_t;
using std::vector;

// NOLINTBEGIN(readability-magic-numbers)
TEST_CASE("Internal gap sum counts integers skipped inside groups",
          "[stats]") {
  vector<uint64_t> keys{1, 2, 3, 10, 11, 50};
  CHECK(keygap::internal_gap_sum(keygap::build_groups(keys, 1)) == 0);
  CHECK(keygap::internal_gap_sum(keygap::build_groups(keys, 10)) == 6);
  CHECK(keygap::internal_gap_sum(keygap::build_groups(keys, 64)) == 44);
}

TEST_CASE("Equal neighbours do not add to the gap sum", "[stats]") {
  CHECK(keygap::internal_gap_sum(vector<Group>{{4, 4, 6}, {9, 9}}) == 1);
}

TEST_CASE("Gap ratio is relative to keys plus gaps", "[stats]") {
  CHECK(keygap::gap_ratio(6, 6) == Approx(0.5));
  CHECK(keygap::gap_ratio(3, 1) == Approx(0.25));
  CHECK(keygap::gap_ratio(10, 0) == 0.0);
  CHECK(keygap::gap_ratio(0, 0) == 0.0);
}

TEST_CASE("Summaries carry the tolerance and counts", "[stats]") {
  auto groups = keygap::build_groups({1, 2, 3, 10, 11, 50}, 10);
  auto summary = keygap::summarize_groups(groups, 10);
  CHECK(summary.tolerance == 10);
  CHECK(summary.group_count == 2);
  CHECK(summary.key_count == 6);
  CHECK(summary.gap_sum == 6);
}
// NOLINTEND(readability-magic-numbers)
