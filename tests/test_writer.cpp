#include "writer.h"

#include <catch2/catch.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

using std::uint64_t;
using std::vector;

namespace {

std::string temp_path(const char* name) {
  return (std::filesystem::temp_directory_path() / name).string();
}

} // namespace

// NOLINTBEGIN(readability-magic-numbers)
TEST_CASE("Binary writer produces a decodable key file", "[writer][io]") {
  auto path = temp_path("keygap_writer_test.hex");
  {
    keygap::KeyWriter writer(path, keygap::KeyFileFormat::Binary);
    writer.write_keys({1, 2, 3});
    writer.write_keys({0x10000});
    writer.finish();
    CHECK(writer.keys_written() == 4);
  }
  CHECK(keygap::read_file_bytes(path).size() == 16);
  CHECK(keygap::load_keys(path, keygap::KeyFileFormat::Binary) ==
        vector<uint64_t>{1, 2, 3, 0x10000});
  std::filesystem::remove(path);
}

TEST_CASE("Text writer joins keys across batches", "[writer][io]") {
  auto path = temp_path("keygap_writer_test.txt");
  {
    keygap::KeyWriter writer(path, keygap::KeyFileFormat::Text);
    writer.write_keys({10, 20});
    writer.write_keys({30});
  }
  CHECK(keygap::read_file_bytes(path) == "10,20,30\n");
  std::filesystem::remove(path);
}

TEST_CASE("Writing after finish fails", "[writer][io]") {
  auto path = temp_path("keygap_writer_finished.hex");
  keygap::KeyWriter writer(path);
  writer.finish();
  CHECK_THROWS_AS(writer.write_keys({1}), std::runtime_error);
  std::filesystem::remove(path);
}

TEST_CASE("Unwritable destination is reported", "[writer][io]") {
  CHECK_THROWS_AS(
      keygap::KeyWriter(temp_path("keygap_no_such_dir/out.hex")),
      std::runtime_error);
}

#if defined(KEYGAP_HAS_ZSTD)
TEST_CASE("Zstd-compressed key files load transparently", "[writer][zstd]") {
  auto path = temp_path("keygap_writer_test.hex.zst");
  vector<uint64_t> keys;
  for (uint64_t v = 0x10000; v < 0x10000 + 4096; v += 4) {
    keys.push_back(v);
  }
  {
    keygap::KeyWriter writer(path, keygap::KeyFileFormat::Binary, true);
    writer.write_keys(keys);
    writer.finish();
  }
  CHECK(keygap::is_zstd_frame(keygap::read_file_bytes(path)));
  CHECK(keygap::load_keys(path, keygap::KeyFileFormat::Binary) == keys);
  std::filesystem::remove(path);
}
#endif
// NOLINTEND(readability-magic-numbers)
