#include "grouping.h"

#include<string>
#include<utility>

namespace keygap{

EmptyInputError::EmptyInputError()
	: std::invalid_argument("cannot build groups from an empty key sequence"){}

GroupBuilder::GroupBuilder(std::uint64_t gap) : gap_(gap),key_count_(0){}

void GroupBuilder::push(std::uint64_t value){
	if(groups_.empty()){
		groups_.push_back(Group{value});
		++key_count_;
		return;
	}
	Group&current=groups_.back();
	std::uint64_t last=current.back();
	if(value<last){
		throw std::invalid_argument("keys must be ascending: "+
									std::to_string(value)+" follows "+
									std::to_string(last));
	}
	if(value-last>gap_){
		groups_.push_back(Group{value});
	}else{
		current.push_back(value);
	}
	++key_count_;
}

std::vector<Group> GroupBuilder::finish(){
	if(groups_.empty()){
		throw EmptyInputError();
	}
	std::vector<Group> out=std::move(groups_);
	groups_.clear();
	key_count_=0;
	return out;
}

std::vector<Group> build_groups(const std::vector<std::uint64_t>&sorted_keys,
								std::uint64_t gap){
	if(sorted_keys.empty()){
		throw EmptyInputError();
	}
	GroupBuilder builder(gap);
	for(std::uint64_t value : sorted_keys){
		builder.push(value);
	}
	return builder.finish();
}

} // namespace keygap
