#include "key_codec.h"

#include<cctype>
#include<cstdio>
#include<cstring>
#include<fstream>
#include<iterator>
#include<limits>
#include<stdexcept>

#if defined(KEYGAP_HAS_ZSTD)
#include<zstd.h>
#endif

namespace keygap{
namespace{

constexpr unsigned char kZstdMagic[4]={0x28,0xB5,0x2F,0xFD};

bool is_blank(std::string_view token){
	for(char ch : token){
		if(!std::isspace(static_cast<unsigned char>(ch))){
			return false;
		}
	}
	return true;
}

std::uint64_t parse_token(std::string_view token){
	std::uint64_t value=0;
	bool has_digit=false;
	for(char ch : token){
		if(ch<'0'||ch>'9'){
			continue;
		}
		std::uint64_t digit=static_cast<std::uint64_t>(ch-'0');
		if(value>(std::numeric_limits<std::uint64_t>::max()-digit)/10ULL){
			throw std::out_of_range("key too large: "+std::string(token));
		}
		value=value*10ULL+digit;
		has_digit=true;
	}
	if(!has_digit){
		throw std::invalid_argument("invalid key token: '"+std::string(token)+
									"'");
	}
	return value;
}

} // namespace

std::vector<std::uint64_t> parse_key_text(std::string_view text){
	std::vector<std::uint64_t> keys;
	std::size_t begin=0;
	while(begin<=text.size()){
		std::size_t end=text.find(',',begin);
		if(end==std::string_view::npos){
			end=text.size();
		}
		std::string_view token=text.substr(begin,end-begin);
		if(!is_blank(token)){
			keys.push_back(parse_token(token));
		}
		begin=end+1;
	}
	return keys;
}

std::string format_key_text(const std::vector<std::uint64_t>&keys){
	std::string out;
	out.reserve(keys.size()*8);
	for(std::size_t i=0;i<keys.size();++i){
		if(i>0){
			out.push_back(',');
		}
		out.append(std::to_string(keys[i]));
	}
	out.push_back('\n');
	return out;
}

std::string encode_keys_le32(const std::vector<std::uint64_t>&keys){
	std::string blob;
	blob.resize(keys.size()*kKeyWidthBytes);
	char*dest=blob.data();
	for(std::uint64_t value : keys){
		if(value>kMaxEncodableKey){
			throw std::out_of_range("key "+std::to_string(value)+
									" does not fit in 4 bytes");
		}
		for(std::size_t b=0;b<kKeyWidthBytes;++b){
			dest[b]=static_cast<char>((value>>(8*b))&0xFFu);
		}
		dest+=kKeyWidthBytes;
	}
	return blob;
}

std::vector<std::uint64_t> decode_keys_le32(std::string_view blob){
	std::size_t count=blob.size()/kKeyWidthBytes;
	std::size_t trailing=blob.size()%kKeyWidthBytes;
	if(trailing!=0){
		std::fprintf(stderr,
					 "[keygap] warning: ignoring %zu trailing byte(s) in key "
					 "blob\n",
					 trailing);
	}
	std::vector<std::uint64_t> keys;
	keys.reserve(count);
	const unsigned char*src=
		reinterpret_cast<const unsigned char*>(blob.data());
	for(std::size_t i=0;i<count;++i){
		std::uint64_t value=0;
		for(std::size_t b=0;b<kKeyWidthBytes;++b){
			value|=static_cast<std::uint64_t>(src[b])<<(8*b);
		}
		keys.push_back(value);
		src+=kKeyWidthBytes;
	}
	return keys;
}

bool is_zstd_frame(std::string_view blob){
	return blob.size()>=sizeof(kZstdMagic)&&
		   std::memcmp(blob.data(),kZstdMagic,sizeof(kZstdMagic))==0;
}

std::string zstd_decompress(std::string_view blob){
#if defined(KEYGAP_HAS_ZSTD)
	ZSTD_DCtx*dctx=ZSTD_createDCtx();
	if(!dctx){
		throw std::runtime_error("Failed to create zstd context");
	}
	std::string out;
	std::string chunk(ZSTD_DStreamOutSize(),'\0');
	ZSTD_inBuffer input{blob.data(),blob.size(),0};
	std::size_t code=0;
	for(;;){
		ZSTD_outBuffer output{chunk.data(),chunk.size(),0};
		code=ZSTD_decompressStream(dctx,&output,&input);
		if(ZSTD_isError(code)){
			std::string message="zstd decompress error: ";
			message.append(ZSTD_getErrorName(code));
			ZSTD_freeDCtx(dctx);
			throw std::runtime_error(message);
		}
		out.append(chunk.data(),output.pos);
		// A full output buffer may still hold pending data.
		if(input.pos==input.size&&output.pos<output.size){
			break;
		}
	}
	ZSTD_freeDCtx(dctx);
	if(code!=0){
		throw std::runtime_error("zstd frame is truncated");
	}
	return out;
#else
	(void)blob;
	throw std::runtime_error("zstd not supported in this build");
#endif
}

std::string read_file_bytes(const std::string&path){
	std::ifstream in(path,std::ios::binary);
	if(!in){
		throw std::runtime_error("Failed to open input file: "+path);
	}
	std::string data((std::istreambuf_iterator<char>(in)),
					 std::istreambuf_iterator<char>());
	if(in.bad()){
		throw std::runtime_error("Failed to read input file: "+path);
	}
	return data;
}

std::vector<std::uint64_t> load_keys(const std::string&path,
									 KeyFileFormat format){
	std::string data=read_file_bytes(path);
	if(is_zstd_frame(data)){
		data=zstd_decompress(data);
	}
	switch(format){
	case KeyFileFormat::Text:
		return parse_key_text(data);
	case KeyFileFormat::Binary:
		return decode_keys_le32(data);
	}
	throw std::invalid_argument("unsupported key file format");
}

} // namespace keygap
