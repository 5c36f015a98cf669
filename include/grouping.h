#pragma once

#include<cstddef>
#include<cstdint>
#include<stdexcept>
#include<vector>

namespace keygap{

using Group=std::vector<std::uint64_t>;

class EmptyInputError : public std::invalid_argument{
  public:
	EmptyInputError();
};

// Splits an ascending key stream into maximal runs. A new group starts
// whenever the distance to the previous key exceeds the gap tolerance;
// the span of a group is not bounded.
class GroupBuilder{
  public:
	explicit GroupBuilder(std::uint64_t gap);

	void push(std::uint64_t value);

	// Returns the finished groups and resets the builder. Throws
	// EmptyInputError when nothing was pushed.
	std::vector<Group> finish();

	std::uint64_t gap() const{ return gap_; }
	std::size_t group_count() const{ return groups_.size(); }
	std::size_t key_count() const{ return key_count_; }

  private:
	std::uint64_t gap_;
	std::size_t key_count_;
	std::vector<Group> groups_;
};

std::vector<Group> build_groups(const std::vector<std::uint64_t>&sorted_keys,
								std::uint64_t gap);

} // namespace keygap
