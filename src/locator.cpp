#include "locator.h"

#include<algorithm>
#include<stdexcept>
#include<utility>

namespace keygap{
namespace{

std::vector<std::uint64_t> extract_starts(const std::vector<Group>&groups){
	std::vector<std::uint64_t> starts;
	starts.reserve(groups.size());
	for(const Group&group : groups){
		if(group.empty()){
			throw std::invalid_argument("group list contains an empty group");
		}
		starts.push_back(group.front());
	}
	return starts;
}

std::uint64_t abs_diff(std::uint64_t lhs,std::uint64_t rhs){
	return lhs>rhs?lhs-rhs:rhs-lhs;
}

} // namespace

GroupLocator::GroupLocator(const std::vector<Group>&groups,std::uint64_t page)
	: GroupLocator(page,extract_starts(groups)){}

GroupLocator::GroupLocator(std::uint64_t page,std::vector<std::uint64_t> starts)
	: page_(page),starts_(std::move(starts)){
	if(!std::is_sorted(starts_.begin(),starts_.end())){
		throw std::invalid_argument("group starts must be ascending");
	}
}

GroupLocator GroupLocator::from_starts(std::vector<std::uint64_t> starts,
									   std::uint64_t page){
	return GroupLocator(page,std::move(starts));
}

bool GroupLocator::within_page(std::size_t index,std::uint64_t value) const{
	return abs_diff(starts_[index],value)<page_;
}

std::optional<std::size_t> GroupLocator::locate(std::uint64_t value) const{
	if(starts_.empty()){
		return std::nullopt;
	}
	auto it=std::lower_bound(starts_.begin(),starts_.end(),value);
	std::size_t pos=static_cast<std::size_t>(it-starts_.begin());

	// Earlier index first.
	if(pos>0&&within_page(pos-1,value)){
		return pos-1;
	}
	if(pos<starts_.size()&&within_page(pos,value)){
		return pos;
	}
	return std::nullopt;
}

std::vector<std::optional<std::size_t>> GroupLocator::locate_batch(
	const std::vector<std::uint64_t>&values) const{
	std::vector<std::optional<std::size_t>> out;
	out.reserve(values.size());
	for(std::uint64_t value : values){
		out.push_back(locate(value));
	}
	return out;
}

} // namespace keygap
