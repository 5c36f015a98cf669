#include "group_stats.h"

namespace keygap{

std::uint64_t internal_gap_sum(const std::vector<Group>&groups){
	std::uint64_t total=0;
	for(const Group&group : groups){
		for(std::size_t i=1;i<group.size();++i){
			std::uint64_t prev=group[i-1];
			std::uint64_t value=group[i];
			if(value>prev){
				total+=value-prev-1;
			}
		}
	}
	return total;
}

double gap_ratio(std::size_t key_count,std::uint64_t gap_sum){
	long double denominator=static_cast<long double>(key_count)+
							static_cast<long double>(gap_sum);
	if(denominator<=0.0L){
		return 0.0;
	}
	return static_cast<double>(static_cast<long double>(gap_sum)/denominator);
}

GroupSummary summarize_groups(const std::vector<Group>&groups,
							  std::uint64_t tolerance){
	GroupSummary summary;
	summary.tolerance=tolerance;
	summary.group_count=groups.size();
	for(const Group&group : groups){
		summary.key_count+=group.size();
	}
	summary.gap_sum=internal_gap_sum(groups);
	return summary;
}

} // namespace keygap
