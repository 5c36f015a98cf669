#pragma once

#include "grouping.h"

#include<cstddef>
#include<cstdint>
#include<optional>
#include<vector>

namespace keygap{

constexpr std::uint64_t kDefaultPageSize=1024;

// Nearest-group lookup over the ascending start table of a finished group
// list. A group matches a query when its start lies strictly closer than
// one page; of the two neighbours around the insertion point the earlier
// group wins.
class GroupLocator{
  public:
	GroupLocator(const std::vector<Group>&groups,
				 std::uint64_t page=kDefaultPageSize);

	static GroupLocator from_starts(std::vector<std::uint64_t> starts,
									std::uint64_t page=kDefaultPageSize);

	std::optional<std::size_t> locate(std::uint64_t value) const;
	std::vector<std::optional<std::size_t>> locate_batch(
		const std::vector<std::uint64_t>&values) const;

	const std::vector<std::uint64_t>&starts() const{ return starts_; }
	std::uint64_t page() const{ return page_; }
	std::size_t size() const{ return starts_.size(); }
	bool empty() const{ return starts_.empty(); }

  private:
	GroupLocator(std::uint64_t page,std::vector<std::uint64_t> starts);

	bool within_page(std::size_t index,std::uint64_t value) const;

	std::uint64_t page_;
	std::vector<std::uint64_t> starts_;
};

} // namespace keygap
