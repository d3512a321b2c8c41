#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include "partpipe/codec/codec.hpp"
#include "stream_test_helpers.hpp"

using partpipe::codec::codec_kind;
using partpipe::core::error_code;
namespace codec = partpipe::codec;

namespace {

std::vector<codec_kind> compiled_codecs() {
  std::vector<codec_kind> out{codec_kind::gzip};
  if (codec::is_available(codec_kind::zstd)) out.push_back(codec_kind::zstd);
  return out;
}

std::vector<std::uint8_t> frame_of(codec_kind kind, const std::vector<std::uint8_t>& raw, int level = 1) {
  auto f = codec::compress_frame(kind, level, raw);
  REQUIRE(f.has_value());
  return *f;
}

} // namespace

TEST_CASE("codec: names, extensions and parsing", "[codec]") {
  REQUIRE(std::string(codec::codec_name(codec_kind::gzip)) == "gzip");
  REQUIRE(std::string(codec::file_extension(codec_kind::gzip)) == ".gz");
  REQUIRE(std::string(codec::file_extension(codec_kind::zstd)) == ".zst");
  REQUIRE(codec::parse_codec("gzip").value() == codec_kind::gzip);
  REQUIRE(codec::parse_codec("zst").value() == codec_kind::zstd);
  auto bad = codec::parse_codec("brotli");
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().code == error_code::invalid_argument);
  REQUIRE((codec::available_codecs() & codec::cap_gzip) != 0);
  REQUIRE((codec::level_range(codec_kind::gzip) == std::pair<int, int>{1, 9}));
}

TEST_CASE("codec: gzip frames carry the gzip magic", "[codec]") {
  auto raw = stream_test_helpers::make_bytes(1000, 1);
  auto f = frame_of(codec_kind::gzip, raw);
  REQUIRE(f.size() > 18);
  REQUIRE(f[0] == 0x1f);
  REQUIRE(f[1] == 0x8b);
  REQUIRE(codec::detect_codec(f) == codec_kind::gzip);
  const std::vector<std::uint8_t> junk{'t', 'a', 'r'};
  REQUIRE_FALSE(codec::detect_codec(junk).has_value());
}

TEST_CASE("codec: concatenated frames decode to the concatenated input", "[codec]") {
  for (auto kind : compiled_codecs()) {
    CAPTURE(codec::codec_name(kind));
    std::vector<std::uint8_t> expected, stream;
    for (std::uint32_t i = 0; i < 5; ++i) {
      auto raw = stream_test_helpers::make_bytes(10000 + i * 777, i, i % 2 == 0);
      expected.insert(expected.end(), raw.begin(), raw.end());
      auto f = frame_of(kind, raw, 3);
      stream.insert(stream.end(), f.begin(), f.end());
    }
    auto dec = codec::FrameDecoder::create(kind);
    REQUIRE(dec.has_value());
    std::vector<std::uint8_t> out;
    REQUIRE(dec->feed(stream, out).has_value());
    REQUIRE(dec->finish().has_value());
    REQUIRE(dec->frames() == 5);
    REQUIRE(out == expected);
  }
}

TEST_CASE("codec: decoding survives arbitrary slice boundaries", "[codec]") {
  for (auto kind : compiled_codecs()) {
    CAPTURE(codec::codec_name(kind));
    auto a = stream_test_helpers::make_bytes(4096, 7);
    auto b = stream_test_helpers::make_bytes(3000, 8, false);
    auto stream = frame_of(kind, a);
    auto fb = frame_of(kind, b);
    stream.insert(stream.end(), fb.begin(), fb.end());
    std::vector<std::uint8_t> expected = a;
    expected.insert(expected.end(), b.begin(), b.end());

    for (std::size_t step : {std::size_t{1}, std::size_t{3}, std::size_t{17}, std::size_t{1000}}) {
      CAPTURE(step);
      auto dec = codec::FrameDecoder::create(kind);
      REQUIRE(dec.has_value());
      std::vector<std::uint8_t> out;
      for (std::size_t off = 0; off < stream.size(); off += step) {
        const auto n = std::min(step, stream.size() - off);
        REQUIRE(dec->feed(std::span<const std::uint8_t>(stream.data() + off, n), out).has_value());
      }
      REQUIRE(dec->finish().has_value());
      REQUIRE(out == expected);
    }
  }
}

TEST_CASE("codec: empty input", "[codec]") {
  auto dec = codec::FrameDecoder::create(codec_kind::gzip);
  REQUIRE(dec.has_value());
  std::vector<std::uint8_t> out;
  REQUIRE(dec->feed({}, out).has_value());
  REQUIRE(dec->finish().has_value());
  REQUIRE(out.empty());
  REQUIRE(dec->frames() == 0);

  // an empty chunk still makes a valid frame
  auto f = frame_of(codec_kind::gzip, {});
  REQUIRE(stream_test_helpers::decode_all(codec_kind::gzip, f).empty());
}

TEST_CASE("codec: truncated final frame is a data integrity error", "[codec]") {
  auto raw = stream_test_helpers::make_bytes(20000, 11);
  auto f = frame_of(codec_kind::gzip, raw);
  f.resize(f.size() - 4);
  auto dec = codec::FrameDecoder::create(codec_kind::gzip);
  REQUIRE(dec.has_value());
  std::vector<std::uint8_t> out;
  REQUIRE(dec->feed(f, out).has_value());
  auto fin = dec->finish();
  REQUIRE_FALSE(fin.has_value());
  REQUIRE(fin.error().code == error_code::data_integrity);
}

TEST_CASE("codec: corrupt data is rejected", "[codec]") {
  auto raw = stream_test_helpers::make_bytes(5000, 12);
  auto f = frame_of(codec_kind::gzip, raw);
  std::vector<std::uint8_t> trailing_garbage = f;
  trailing_garbage.push_back(0x00);
  trailing_garbage.push_back(0x42);
  auto dec = codec::FrameDecoder::create(codec_kind::gzip);
  REQUIRE(dec.has_value());
  std::vector<std::uint8_t> out;
  auto r = dec->feed(trailing_garbage, out);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == partpipe::core::error_code::data_integrity);
  REQUIRE(r.error().component == "codec.gzip");
}

TEST_CASE("codec: zstd availability is reported consistently", "[codec]") {
  const bool have = codec::is_available(codec_kind::zstd);
  auto f = codec::compress_frame(codec_kind::zstd, 3, std::vector<std::uint8_t>{1, 2, 3});
  REQUIRE(f.has_value() == have);
  if (!have) {
    REQUIRE(f.error().code == error_code::unsupported);
    REQUIRE(codec::FrameDecoder::create(codec_kind::zstd).error().code == error_code::unsupported);
  } else {
    REQUIRE(codec::detect_codec(*f) == codec_kind::zstd);
  }
}
