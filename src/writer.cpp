#include "writer.h"

#include<cerrno>
#include<cstring>
#include<exception>
#include<stdexcept>

#if defined(KEYGAP_HAS_ZSTD)
#include<zstd.h>
#endif

namespace keygap{

namespace{

constexpr std::size_t kDefaultFileBuffer=1u<<20; // 1 MiB
constexpr std::size_t kDefaultBufferThreshold=1u<<20; // 1 MiB

} // namespace

KeyWriter::KeyWriter(const std::string&path,KeyFileFormat format,
					 bool use_zstd)
	: file_(nullptr),owns_file_(false),finished_(false),
	  buffer_threshold_(kDefaultBufferThreshold),format_(format),
	  use_zstd_(use_zstd),text_started_(false),keys_written_(0),
	  zstd_cctx_(nullptr),io_error_(false){
	if(path.empty()){
		file_=stdout;
		owns_file_=false;
		if(format_==KeyFileFormat::Binary){
			std::fprintf(stderr,"[keygap] warning: writing binary keys to "
								"stdout. Consider using --out <path>.\n");
		}
	}else{
		file_=std::fopen(path.c_str(),"wb");
		if(!file_){
			throw std::runtime_error("Failed to open output file: "+path);
		}
		owns_file_=true;
	}

	if(std::setvbuf(file_,nullptr,_IOFBF,kDefaultFileBuffer)!=0){
		if(owns_file_){
			std::fclose(file_);
		}
		throw std::runtime_error("Failed to set file buffer");
	}

	if(use_zstd_){
#if defined(KEYGAP_HAS_ZSTD)
		ZSTD_CCtx*cctx=ZSTD_createCCtx();
		if(!cctx){
			if(owns_file_){
				std::fclose(file_);
			}
			throw std::runtime_error("Failed to create zstd context");
		}
		std::size_t configured=ZSTD_CCtx_setParameter(
			cctx,ZSTD_c_compressionLevel,3);
		if(ZSTD_isError(configured)){
			std::string message="Failed to configure zstd context: ";
			message.append(ZSTD_getErrorName(configured));
			ZSTD_freeCCtx(cctx);
			if(owns_file_){
				std::fclose(file_);
			}
			throw std::runtime_error(message);
		}
		zstd_cctx_=cctx;
		zstd_out_buffer_.resize(ZSTD_CStreamOutSize());
#else
		if(owns_file_){
			std::fclose(file_);
		}
		throw std::runtime_error("zstd not supported in this build");
#endif
	}

	buffer_.reserve(buffer_threshold_);
}

KeyWriter::~KeyWriter(){
	try{
		finish();
	}catch(const std::exception&ex){
		std::fprintf(stderr,"[keygap] error: %s\n",ex.what());
	}
}

void KeyWriter::write_keys(const std::vector<std::uint64_t>&keys){
	if(finished_){
		throw std::runtime_error("Writer has been finished");
	}
	check_io_error();
	if(keys.empty()){
		return;
	}

	switch(format_){
	case KeyFileFormat::Text:{
		for(std::uint64_t value : keys){
			if(text_started_){
				buffer_.push_back(',');
			}
			buffer_.append(std::to_string(value));
			text_started_=true;
			if(buffer_.size()>=buffer_threshold_){
				flush_buffer();
			}
		}
		break;
	}
	case KeyFileFormat::Binary:{
		buffer_.append(encode_keys_le32(keys));
		if(buffer_.size()>=buffer_threshold_){
			flush_buffer();
		}
		break;
	}
	}
	keys_written_+=keys.size();
	check_io_error();
}

void KeyWriter::flush(){
	if(finished_){
		return;
	}
	flush_buffer();
	if(use_zstd_){
		flush_zstd_stream(false);
	}
	if(file_&&std::fflush(file_)!=0){
		set_error(std::strerror(errno));
	}
	check_io_error();
}

void KeyWriter::finish(){
	if(finished_){
		return;
	}
	finished_=true;

	if(format_==KeyFileFormat::Text&&text_started_){
		buffer_.push_back('\n');
	}
	flush_buffer();
	if(use_zstd_){
		flush_zstd_stream(true);
	}

#if defined(KEYGAP_HAS_ZSTD)
	if(zstd_cctx_){
		ZSTD_freeCCtx(static_cast<ZSTD_CCtx*>(zstd_cctx_));
		zstd_cctx_=nullptr;
	}
#endif

	if(file_){
		if(owns_file_){
			if(std::fclose(file_)!=0){
				set_error("Failed to close output file");
			}
		}else{
			if(std::fflush(file_)!=0){
				set_error("Failed to flush output stream");
			}
		}
		file_=nullptr;
	}

	check_io_error();
}

void KeyWriter::flush_buffer(){
	if(!file_||buffer_.empty()){
		return;
	}

	if(!use_zstd_){
		write_file_bytes(buffer_.data(),buffer_.size());
		if(!io_error_){
			buffer_.clear();
		}
		return;
	}

#if defined(KEYGAP_HAS_ZSTD)
	if(!zstd_cctx_){
		set_error("zstd context is not initialized");
		return;
	}
	ZSTD_inBuffer input{buffer_.data(),buffer_.size(),0};
	while(input.pos<input.size){
		ZSTD_outBuffer output{zstd_out_buffer_.data(),zstd_out_buffer_.size(),0};
		std::size_t code=ZSTD_compressStream2(
			static_cast<ZSTD_CCtx*>(zstd_cctx_),&output,&input,ZSTD_e_continue);
		if(ZSTD_isError(code)){
			std::string message="zstd compress error: ";
			message.append(ZSTD_getErrorName(code));
			set_error(message);
			break;
		}
		if(output.pos>0){
			write_file_bytes(zstd_out_buffer_.data(),output.pos);
			if(io_error_){
				break;
			}
		}
	}
	if(!io_error_){
		buffer_.clear();
	}
#else
	set_error("zstd not supported in this build");
#endif
}

void KeyWriter::check_io_error() const{
	if(!io_error_){
		return;
	}
	throw std::runtime_error(error_message_.empty()?"I/O error":error_message_);
}

void KeyWriter::set_error(const std::string&message){
	if(!io_error_){
		io_error_=true;
		error_message_=message;
	}
}

void KeyWriter::write_file_bytes(const char*data,std::size_t size){
	if(!file_||size==0){
		return;
	}
	const char*cursor=data;
	std::size_t remaining=size;
	while(remaining>0){
		std::size_t written=std::fwrite(cursor,1,remaining,file_);
		if(written==0){
			set_error(std::ferror(file_)?std::strerror(errno)
										:"short write to output file");
			break;
		}
		cursor+=written;
		remaining-=written;
	}
}

void KeyWriter::flush_zstd_stream(bool final_frame){
#if defined(KEYGAP_HAS_ZSTD)
	if(!zstd_cctx_||!file_){
		set_error("zstd context is not initialized");
		return;
	}
	ZSTD_EndDirective mode=final_frame?ZSTD_e_end:ZSTD_e_flush;
	ZSTD_inBuffer input{nullptr,0,0};
	for(;;){
		ZSTD_outBuffer output{zstd_out_buffer_.data(),zstd_out_buffer_.size(),0};
		std::size_t code=ZSTD_compressStream2(
			static_cast<ZSTD_CCtx*>(zstd_cctx_),&output,&input,mode);
		if(ZSTD_isError(code)){
			std::string message="zstd compress error: ";
			message.append(ZSTD_getErrorName(code));
			set_error(message);
			return;
		}
		if(output.pos>0){
			write_file_bytes(zstd_out_buffer_.data(),output.pos);
			if(io_error_){
				return;
			}
		}
		if(code==0){
			return;
		}
	}
#else
	(void)final_frame;
	set_error("zstd not supported in this build");
#endif
}

} // namespace keygap
