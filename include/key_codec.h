#pragma once

#include<cstddef>
#include<cstdint>
#include<string>
#include<string_view>
#include<vector>

namespace keygap{

enum class KeyFileFormat{
	Text,
	Binary,
};

constexpr std::size_t kKeyWidthBytes=4;
constexpr std::uint64_t kMaxEncodableKey=0xFFFFFFFFULL;

// Comma-separated keys. Each token contributes its decimal digits only, so
// "[12," and " 34]" parse as 12 and 34.
std::vector<std::uint64_t> parse_key_text(std::string_view text);
std::string format_key_text(const std::vector<std::uint64_t>&keys);

std::string encode_keys_le32(const std::vector<std::uint64_t>&keys);
std::vector<std::uint64_t> decode_keys_le32(std::string_view blob);

bool is_zstd_frame(std::string_view blob);
std::string zstd_decompress(std::string_view blob);

std::string read_file_bytes(const std::string&path);

// Reads a key file, transparently unwrapping zstd frames.
std::vector<std::uint64_t> load_keys(const std::string&path,
									 KeyFileFormat format);

} // namespace keygap
