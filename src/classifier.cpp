#include "classifier.h"

#include<string>

namespace keygap{
namespace{

void validate_config(const ClassifierConfig&config){
	if(config.divisor==0){
		throw std::invalid_argument("divisor must be positive");
	}
}

} // namespace

InvalidHighKeyError::InvalidHighKeyError(std::uint64_t value)
	: std::invalid_argument("high key "+std::to_string(value)+
							" is not divisible by the scaling divisor"),
	  value_(value){}

std::uint64_t scale_high_key(std::uint64_t value,const ClassifierConfig&config){
	validate_config(config);
	if(value<config.cutoff){
		throw std::invalid_argument("key "+std::to_string(value)+
									" is below the cutoff");
	}
	std::uint64_t offset=value-config.cutoff;
	if(offset%config.divisor!=0||value%config.divisor!=0){
		throw InvalidHighKeyError(value);
	}
	return config.cutoff+offset/config.divisor;
}

ClassifiedKeys classify(const std::vector<std::uint64_t>&keys,
						const ClassifierConfig&config){
	validate_config(config);
	ClassifiedKeys out;
	for(std::uint64_t value : keys){
		if(value<config.cutoff){
			out.low.push_back(value);
		}else{
			out.high.push_back(scale_high_key(value,config));
		}
	}
	return out;
}

} // namespace keygap
