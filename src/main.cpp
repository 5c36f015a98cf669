#include "classifier.h"
#include "grouping.h"
#include "key_codec.h"
#include "locator.h"
#include "report.h"
#include "writer.h"

#include<algorithm>
#include<chrono>
#include<cstdint>
#include<cstdio>
#include<exception>
#include<iostream>
#include<optional>
#include<stdexcept>
#include<string>
#include<vector>

namespace keygap{

constexpr std::uint64_t kDefaultLocateGap=4;

struct Options{
	std::string input_path="keys.hex";
	KeyFileFormat input_format=KeyFileFormat::Binary;
	std::string convert_path;
	std::string output_path;
	KeyFileFormat output_format=KeyFileFormat::Binary;
	bool use_zstd=false;
	std::uint64_t cutoff=kDefaultCutoff;
	std::uint64_t divisor=kDefaultDivisor;
	std::vector<std::uint64_t> tolerances{1,2,4,8,16,32,64};
	std::uint64_t page=kDefaultPageSize;
	std::vector<std::uint64_t> locate_values;
	std::uint64_t locate_gap=kDefaultLocateGap;
	unsigned threads=1;
	bool show_stats=false;
	bool show_time=false;
	bool help=false;
};

std::uint64_t parse_u64(const std::string&value){
	if(value.empty()||value[0]=='-'||value[0]=='+'){
		throw std::invalid_argument("invalid integer: "+value);
	}
	std::size_t idx=0;
	std::uint64_t result=0;
	try{
		result=std::stoull(value,&idx,0);
	}catch(const std::exception&){
		throw std::invalid_argument("invalid integer: "+value);
	}
	if(idx!=value.size()){
		throw std::invalid_argument("invalid integer: "+value);
	}
	return result;
}

std::vector<std::uint64_t> parse_u64_list(const std::string&value){
	std::vector<std::uint64_t> out;
	std::size_t begin=0;
	while(begin<=value.size()){
		std::size_t end=value.find(',',begin);
		if(end==std::string::npos){
			end=value.size();
		}
		out.push_back(parse_u64(value.substr(begin,end-begin)));
		begin=end+1;
	}
	return out;
}

KeyFileFormat parse_format(const std::string&fmt){
	if(fmt=="text"){
		return KeyFileFormat::Text;
	}
	if(fmt=="binary"){
		return KeyFileFormat::Binary;
	}
	throw std::invalid_argument("unsupported key format: "+fmt);
}

Options parse_options(int argc,char**argv){
	Options opts;
	bool has_input=false;
	for(int i=1;i<argc;++i){
		std::string arg=argv[i];
		auto require_value=[&](const char*what){
			if(i+1>=argc){
				throw std::invalid_argument(arg+" requires "+what);
			}
			return std::string(argv[++i]);
		};

		if(arg=="--help"||arg=="-h"){
			opts.help=true;
			return opts;
		}else if(arg=="--convert"){
			opts.convert_path=require_value("a path");
		}else if(arg=="--out"){
			opts.output_path=require_value("a path");
		}else if(arg=="--out-format"){
			opts.output_format=parse_format(require_value("a value"));
		}else if(arg=="--in-format"){
			opts.input_format=parse_format(require_value("a value"));
		}else if(arg=="--zstd"){
			opts.use_zstd=true;
		}else if(arg=="--cutoff"){
			opts.cutoff=parse_u64(require_value("a value"));
		}else if(arg=="--divisor"){
			opts.divisor=parse_u64(require_value("a value"));
			if(opts.divisor==0){
				throw std::invalid_argument("--divisor must be positive");
			}
		}else if(arg=="--tolerances"){
			opts.tolerances=parse_u64_list(require_value("a list"));
		}else if(arg=="--page"){
			opts.page=parse_u64(require_value("a value"));
		}else if(arg=="--locate"){
			opts.locate_values.push_back(parse_u64(require_value("a value")));
		}else if(arg=="--locate-gap"){
			opts.locate_gap=parse_u64(require_value("a value"));
		}else if(arg=="--threads"){
			opts.threads=static_cast<unsigned>(parse_u64(require_value("a value")));
		}else if(arg=="--stats"){
			opts.show_stats=true;
		}else if(arg=="--time"){
			opts.show_time=true;
		}else if(!arg.empty()&&arg[0]=='-'){
			throw std::invalid_argument("unknown option: "+arg);
		}else{
			if(has_input){
				throw std::invalid_argument("unexpected argument: "+arg);
			}
			opts.input_path=arg;
			has_input=true;
		}
	}
	return opts;
}

void print_usage(){
	std::cout
		<<"keygap [options] [PATH]\n"
		<<"  PATH                Key file to analyze (default keys.hex)\n"
		<<"  --in-format FMT     Input format: binary (default), text\n"
		<<"  --convert TEXT      Convert a comma-separated key list\n"
		<<"  --out PATH          Destination for --convert (default stdout)\n"
		<<"  --out-format FMT    Output format: binary (default), text\n"
		<<"  --zstd              Compress converted output with zstd\n"
		<<"  --cutoff N          Low/high boundary (default 0x10000)\n"
		<<"  --divisor N         High key scaling divisor (default 4)\n"
		<<"  --tolerances LIST   Gap tolerances (default 1,2,4,8,16,32,64)\n"
		<<"  --page N            Locator window size (default 1024)\n"
		<<"  --locate X          Find the group near X (repeatable)\n"
		<<"  --locate-gap G      Gap tolerance used for --locate (default 4)\n"
		<<"  --threads N         Worker threads, 0 for all cores (default 1)\n"
		<<"  --stats             Print low/high key counts\n"
		<<"  --time              Print elapsed time\n";
}

int run_convert(const Options&opts){
	std::vector<std::uint64_t> keys=
		load_keys(opts.convert_path,KeyFileFormat::Text);
	KeyWriter writer(opts.output_path,opts.output_format,opts.use_zstd);
	writer.write_keys(keys);
	writer.finish();
	if(opts.show_stats){
		std::cerr<<"Converted keys: "<<writer.keys_written()<<"\n";
	}
	return 0;
}

void run_locate(const Options&opts,const std::vector<std::uint64_t>&keys,
				const ClassifierConfig&classifier){
	ClassifiedKeys classified=classify(keys,classifier);
	if(classified.high.empty()){
		for(std::uint64_t value : opts.locate_values){
			std::cout<<"locate "<<value<<": not found\n";
		}
		return;
	}
	std::vector<std::uint64_t>&high=classified.high;
	std::sort(high.begin(),high.end());
	GroupLocator locator(build_groups(high,opts.locate_gap),opts.page);
	auto results=locator.locate_batch(opts.locate_values);
	for(std::size_t i=0;i<results.size();++i){
		std::cout<<"locate "<<opts.locate_values[i]<<": ";
		if(results[i].has_value()){
			std::size_t index=results[i].value();
			std::cout<<"group "<<index<<" (start "<<locator.starts()[index]
					 <<")\n";
		}else{
			std::cout<<"not found\n";
		}
	}
}

int run_cli(int argc,char**argv){
	try{
		Options opts=parse_options(argc,argv);
		if(opts.help){
			print_usage();
			return 0;
		}
#if !defined(KEYGAP_HAS_ZSTD)
		if(opts.use_zstd){
			throw std::invalid_argument("zstd not supported in this build");
		}
#endif
		if(!opts.convert_path.empty()){
			return run_convert(opts);
		}

		auto start_time=std::chrono::steady_clock::now();

		std::vector<std::uint64_t> keys=
			load_keys(opts.input_path,opts.input_format);

		AnalysisConfig config;
		config.classifier.cutoff=opts.cutoff;
		config.classifier.divisor=opts.divisor;
		config.tolerances=opts.tolerances;
		config.threads=opts.threads;

		AnalysisReport report=analyze_keys(keys,config);
		print_report(std::cout,report,opts.show_stats);

		if(!opts.locate_values.empty()){
			run_locate(opts,keys,config.classifier);
		}

		if(opts.show_time){
			auto end_time=std::chrono::steady_clock::now();
			auto elapsed=std::chrono::duration_cast<std::chrono::microseconds>(
							 end_time-start_time)
							 .count();
			std::cout<<"Elapsed: "<<elapsed<<" us\n";
		}
		return 0;
	}catch(const std::exception&ex){
		std::cerr<<"Error: "<<ex.what()<<"\n";
		return 1;
	}
}

} // namespace keygap

int main(int argc,char**argv){ return keygap::run_cli(argc,argv); }
