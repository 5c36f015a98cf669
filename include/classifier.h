#pragma once

#include<cstdint>
#include<stdexcept>
#include<vector>

namespace keygap{

constexpr std::uint64_t kDefaultCutoff=0x10000;
constexpr std::uint64_t kDefaultDivisor=4;

struct ClassifierConfig{
	std::uint64_t cutoff=kDefaultCutoff;
	std::uint64_t divisor=kDefaultDivisor;
};

struct ClassifiedKeys{
	std::vector<std::uint64_t> low;
	std::vector<std::uint64_t> high;
};

// Thrown when a key at or above the cutoff is not a multiple of the
// divisor and therefore cannot be rescaled exactly.
class InvalidHighKeyError : public std::invalid_argument{
  public:
	explicit InvalidHighKeyError(std::uint64_t value);

	std::uint64_t value() const noexcept{ return value_; }

  private:
	std::uint64_t value_;
};

// Maps a high key onto cutoff + (value - cutoff) / divisor.
std::uint64_t scale_high_key(std::uint64_t value,const ClassifierConfig&config);

ClassifiedKeys classify(const std::vector<std::uint64_t>&keys,
						const ClassifierConfig&config=ClassifierConfig{});

} // namespace keygap
