#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include "partpipe/stream/parts_manifest.hpp"
#include "stream_test_helpers.hpp"

using partpipe::stream::PartsManifest;
using partpipe::stream::PartsManifestEntry;
using partpipe::stream::load_parts_manifest;
using partpipe::stream::save_parts_manifest;
using partpipe::stream::verify_parts_manifest;
using partpipe::core::error_code;
namespace fs = std::filesystem;
namespace h = stream_test_helpers;

namespace {

PartsManifest sample_with_files(const fs::path& dir) {
  PartsManifest m{};
  for (std::uint64_t i = 0; i < 3; ++i) {
    const std::string name = "home.tar.gz.part_00" + std::to_string(i);
    auto bytes = h::make_bytes(100 + i, static_cast<std::uint32_t>(i));
    h::write_file(dir / name, bytes);
    m.entries.push_back(PartsManifestEntry{name, i, bytes.size()});
  }
  return m;
}

void write_text(const fs::path& p, const std::string& text) {
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out << text;
}

} // namespace

TEST_CASE("parts_manifest: atomic save leaves only the final file", "[parts_manifest]") {
  auto dir = h::make_test_dir("manifest_atomic");
  auto file = dir / "home.tar.gz.manifest";
  // stale tmp from an interrupted save
  write_text(dir / "home.tar.gz.manifest.tmp", "garbage");
  auto m = sample_with_files(dir);
  REQUIRE(save_parts_manifest(file, m).has_value());
  REQUIRE(fs::exists(file));
  REQUIRE_FALSE(fs::exists(dir / "home.tar.gz.manifest.tmp"));

  std::ifstream in(file);
  std::string hdr; std::getline(in, hdr);
  REQUIRE(hdr == "partpipe-parts-manifest v1");
  std::string l1; std::getline(in, l1);
  REQUIRE(l1 == "file=home.tar.gz.part_000 seq=0 bytes=100");
  h::cleanup_dir(dir);
}

TEST_CASE("parts_manifest: load returns entries in seq order", "[parts_manifest]") {
  auto dir = h::make_test_dir("manifest_load");
  auto file = dir / "x.manifest";
  write_text(file,
      "partpipe-parts-manifest v1\n"
      "file=x.part_001 seq=1 bytes=5\n"
      "\n"
      "file=x.part_000 seq=0 bytes=7\n");
  auto m = load_parts_manifest(file);
  REQUIRE(m.has_value());
  REQUIRE(m->entries.size() == 2);
  REQUIRE(m->entries[0].file == "x.part_000");
  REQUIRE(m->entries[1].bytes == 5);
  REQUIRE(m->total_bytes() == 12);
  h::cleanup_dir(dir);
}

TEST_CASE("parts_manifest: parse errors", "[parts_manifest]") {
  auto dir = h::make_test_dir("manifest_parse");
  auto file = dir / "bad.manifest";

  write_text(file, "some-other-format v9\n");
  REQUIRE(load_parts_manifest(file).error().code == error_code::data_integrity);

  write_text(file, "partpipe-parts-manifest v1\nfile=a seq=x bytes=1\n");
  auto bad_seq = load_parts_manifest(file);
  REQUIRE(bad_seq.error().code == error_code::data_integrity);
  REQUIRE(bad_seq.error().message.find("line 2") != std::string::npos);

  write_text(file, "partpipe-parts-manifest v1\nfile=../escape seq=0 bytes=1\n");
  REQUIRE(load_parts_manifest(file).error().code == error_code::data_integrity);

  write_text(file, "partpipe-parts-manifest v1\nfile=a seq=0\n");
  REQUIRE(load_parts_manifest(file).error().code == error_code::data_integrity);

  REQUIRE(load_parts_manifest(dir / "absent.manifest").error().code == error_code::not_found);
  h::cleanup_dir(dir);
}

TEST_CASE("parts_manifest: verify detects missing, resized and non-contiguous parts", "[parts_manifest]") {
  auto dir = h::make_test_dir("manifest_verify");
  auto file = dir / "home.tar.gz.manifest";
  auto m = sample_with_files(dir);
  REQUIRE(save_parts_manifest(file, m).has_value());
  REQUIRE(verify_parts_manifest(file).has_value());

  // resized part
  h::write_file(dir / "home.tar.gz.part_001", h::make_bytes(3, 99));
  auto resized = verify_parts_manifest(file);
  REQUIRE_FALSE(resized.has_value());
  REQUIRE(resized.error().code == error_code::data_integrity);

  // missing part
  fs::remove(dir / "home.tar.gz.part_001");
  auto missing = verify_parts_manifest(file);
  REQUIRE(missing.error().code == error_code::not_found);

  // gap in the sequence
  PartsManifest gap{};
  gap.entries.push_back(m.entries[0]);
  gap.entries.push_back(m.entries[2]);
  REQUIRE(save_parts_manifest(file, gap).has_value());
  auto g = verify_parts_manifest(file);
  REQUIRE(g.error().code == error_code::data_integrity);
  REQUIRE(g.error().message.find("seq=1") != std::string::npos);
  h::cleanup_dir(dir);
}
