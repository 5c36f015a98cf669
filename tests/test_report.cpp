#include "report.h"

#include <catch2/catch.hpp>

#include <cstdint>
#include <sstream>
#include <vector>

using keygap::AnalysisConfig;
using keygap::GroupSummary;
using std::uint64_t;
using std::vector;

namespace {

// Raw keys whose scaled high range is 0x10000 + {1,2,3,10,11,50}.
vector<uint64_t> scenario_keys() {
  vector<uint64_t> keys{5, 17};
  for (uint64_t offset : {1, 2, 3, 10, 11, 50}) {
    keys.push_back(0x10000 + offset * 4);
  }
  return keys;
}

} // namespace

// NOLINTBEGIN(readability-magic-numbers)
TEST_CASE("Summary lines show groups, gaps and percentage", "[report]") {
  GroupSummary summary;
  summary.tolerance = 10;
  summary.group_count = 2;
  summary.key_count = 6;
  summary.gap_sum = 6;
  CHECK(keygap::format_summary(summary) == "10: 2 (6 - 50.00%)");

  summary.tolerance = 1;
  summary.group_count = 3;
  summary.gap_sum = 0;
  CHECK(keygap::format_summary(summary) == "1: 3 (0 - 0.00%)");
}

TEST_CASE("Analysis reports every tolerance in order", "[report]") {
  AnalysisConfig config;
  config.tolerances = {1, 10, 64};
  auto threads = GENERATE(1u, 3u);
  config.threads = threads;

  auto report = keygap::analyze_keys(scenario_keys(), config);
  CHECK(report.low_count == 2);
  CHECK(report.high_count == 6);
  REQUIRE(report.summaries.size() == 3);
  CHECK(report.summaries[0].tolerance == 1);
  CHECK(report.summaries[0].group_count == 3);
  CHECK(report.summaries[0].gap_sum == 0);
  CHECK(report.summaries[1].group_count == 2);
  CHECK(report.summaries[1].gap_sum == 6);
  CHECK(report.summaries[2].group_count == 1);
  CHECK(report.summaries[2].gap_sum == 44);

  std::ostringstream out;
  keygap::print_report(out, report, true);
  CHECK(out.str() == "Low keys: 2\n"
                     "High keys: 6\n"
                     "1: 3 (0 - 0.00%)\n"
                     "10: 2 (6 - 50.00%)\n"
                     "64: 1 (44 - 88.00%)\n");
}

TEST_CASE("Unsorted high keys are sorted before grouping", "[report]") {
  AnalysisConfig config;
  config.tolerances = {1};
  auto report =
      keygap::analyze_keys({0x10000 + 8, 0x10000, 0x10000 + 4}, config);
  REQUIRE(report.summaries.size() == 1);
  CHECK(report.summaries[0].group_count == 1);
}

TEST_CASE("Analysis without high keys has no summaries", "[report]") {
  auto report = keygap::analyze_keys({1, 2, 3});
  CHECK(report.low_count == 3);
  CHECK(report.high_count == 0);
  CHECK(report.summaries.empty());
}

TEST_CASE("Invalid high keys abort the analysis", "[report]") {
  CHECK_THROWS_AS(keygap::analyze_keys({0x10003}),
                  keygap::InvalidHighKeyError);
}
// NOLINTEND(readability-magic-numbers)
