#pragma once

#include "grouping.h"

#include<cstddef>
#include<cstdint>
#include<vector>

namespace keygap{

struct GroupSummary{
	std::uint64_t tolerance=0;
	std::size_t group_count=0;
	std::size_t key_count=0;
	std::uint64_t gap_sum=0;
};

// Number of integers missing strictly between neighbouring members of the
// same group. Equal neighbours contribute nothing.
std::uint64_t internal_gap_sum(const std::vector<Group>&groups);

// gap_sum/(key_count+gap_sum), or 0 for an empty denominator.
double gap_ratio(std::size_t key_count,std::uint64_t gap_sum);

GroupSummary summarize_groups(const std::vector<Group>&groups,
							  std::uint64_t tolerance);

} // namespace keygap
