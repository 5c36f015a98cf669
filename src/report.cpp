#include "report.h"

#include "grouping.h"

#include<algorithm>
#include<atomic>
#include<cstdio>
#include<exception>
#include<mutex>
#include<thread>

namespace keygap{
namespace{

unsigned choose_thread_count(unsigned requested,std::size_t batches){
	unsigned threads=requested;
	if(threads==0){
		threads=std::thread::hardware_concurrency();
	}
	if(threads==0){
		threads=1;
	}
	if(batches<threads){
		threads=static_cast<unsigned>(batches);
	}
	return threads?threads:1;
}

} // namespace

AnalysisReport analyze_keys(const std::vector<std::uint64_t>&keys,
							const AnalysisConfig&config){
	ClassifiedKeys classified=classify(keys,config.classifier);

	AnalysisReport report;
	report.low_count=classified.low.size();
	report.high_count=classified.high.size();

	std::vector<std::uint64_t>&high=classified.high;
	if(high.empty()){
		std::fprintf(stderr,"[keygap] warning: no keys at or above the cutoff; "
							"nothing to group.\n");
		return report;
	}
	if(!std::is_sorted(high.begin(),high.end())){
		std::fprintf(stderr,"[keygap] warning: high keys are not ascending; "
							"sorting %zu keys before grouping.\n",
					 high.size());
		std::sort(high.begin(),high.end());
	}

	const std::vector<std::uint64_t>&tolerances=config.tolerances;
	report.summaries.resize(tolerances.size());
	if(tolerances.empty()){
		return report;
	}

	unsigned threads=choose_thread_count(config.threads,tolerances.size());
	std::atomic<std::size_t> next{0};
	std::mutex error_mutex;
	std::exception_ptr first_error;

	auto worker=[&](){
		for(;;){
			std::size_t index=next.fetch_add(1,std::memory_order_relaxed);
			if(index>=tolerances.size()){
				return;
			}
			try{
				std::uint64_t tolerance=tolerances[index];
				report.summaries[index]=
					summarize_groups(build_groups(high,tolerance),tolerance);
			}catch(...){
				std::lock_guard<std::mutex> lock(error_mutex);
				if(!first_error){
					first_error=std::current_exception();
				}
				return;
			}
		}
	};

	if(threads<=1){
		worker();
	}else{
		std::vector<std::thread> workers;
		workers.reserve(threads);
		for(unsigned t=0;t<threads;++t){
			workers.emplace_back(worker);
		}
		for(auto&th : workers){
			th.join();
		}
	}
	if(first_error){
		std::rethrow_exception(first_error);
	}
	return report;
}

std::string format_summary(const GroupSummary&summary){
	double percent=gap_ratio(summary.key_count,summary.gap_sum)*100.0;
	char line[128];
	std::snprintf(line,sizeof(line),"%llu: %zu (%llu - %.2f%%)",
				  static_cast<unsigned long long>(summary.tolerance),
				  summary.group_count,
				  static_cast<unsigned long long>(summary.gap_sum),percent);
	return line;
}

void print_report(std::ostream&out,const AnalysisReport&report,
				  bool show_stats){
	if(show_stats){
		out<<"Low keys: "<<report.low_count<<"\n";
		out<<"High keys: "<<report.high_count<<"\n";
	}
	for(const GroupSummary&summary : report.summaries){
		out<<format_summary(summary)<<"\n";
	}
}

} // namespace keygap
