#pragma once

#include "key_codec.h"

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace keygap {

class KeyWriter {
public:
    KeyWriter(const std::string &path = "",
              KeyFileFormat format = KeyFileFormat::Binary,
              bool use_zstd = false);
    ~KeyWriter();

    KeyWriter(const KeyWriter &) = delete;
    KeyWriter &operator=(const KeyWriter &) = delete;

    void write_keys(const std::vector<std::uint64_t> &keys);
    void flush();
    void finish();

    std::uint64_t keys_written() const { return keys_written_; }

private:
    void flush_buffer();
    void write_file_bytes(const char *data, std::size_t size);
    void check_io_error() const;
    void set_error(const std::string &message);
    void flush_zstd_stream(bool final_frame);

    std::FILE *file_;
    bool owns_file_;
    bool finished_;

    std::string buffer_;
    std::size_t buffer_threshold_;

    KeyFileFormat format_;
    bool use_zstd_;
    bool text_started_;
    std::uint64_t keys_written_;

    void *zstd_cctx_;
    std::vector<char> zstd_out_buffer_;

    bool io_error_;
    std::string error_message_;
};

} // namespace keygap
