#pragma once

#include "classifier.h"
#include "group_stats.h"

#include<cstddef>
#include<cstdint>
#include<ostream>
#include<string>
#include<vector>

namespace keygap{

struct AnalysisConfig{
	ClassifierConfig classifier;
	std::vector<std::uint64_t> tolerances{1,2,4,8,16,32,64};
	unsigned threads=1;
};

struct AnalysisReport{
	std::size_t low_count=0;
	std::size_t high_count=0;
	std::vector<GroupSummary> summaries; // same order as the tolerances
};

AnalysisReport analyze_keys(const std::vector<std::uint64_t>&keys,
							const AnalysisConfig&config=AnalysisConfig{});

// "<tolerance>: <groups> (<gap sum> - <ratio>%)"
std::string format_summary(const GroupSummary&summary);

void print_report(std::ostream&out,const AnalysisReport&report,
				  bool show_stats=false);

} // namespace keygap
