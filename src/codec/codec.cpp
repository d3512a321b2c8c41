#include "partpipe/codec/codec.hpp"

#include <string>

#include "backends.hpp"

namespace partpipe::codec {

using core::error;
using core::error_code;

auto available_codecs() noexcept -> std::uint32_t {
  static const std::uint32_t caps = [] {
    std::uint32_t c = cap_gzip;
#ifdef PARTPIPE_HAS_ZSTD
    c |= cap_zstd;
#endif
    return c;
  }();
  return caps;
}

auto is_available(codec_kind kind) noexcept -> bool {
  switch (kind) {
    case codec_kind::gzip: return (available_codecs() & cap_gzip) != 0;
    case codec_kind::zstd: return (available_codecs() & cap_zstd) != 0;
  }
  return false;
}

auto codec_name(codec_kind kind) noexcept -> const char* {
  return kind == codec_kind::zstd ? "zstd" : "gzip";
}

auto file_extension(codec_kind kind) noexcept -> const char* {
  return kind == codec_kind::zstd ? ".zst" : ".gz";
}

auto level_range(codec_kind kind) noexcept -> std::pair<int, int> {
  return kind == codec_kind::zstd ? std::pair<int, int>{1, 22} : std::pair<int, int>{1, 9};
}

auto parse_codec(std::string_view name) -> std::expected<codec_kind, error> {
  if (name == "gzip" || name == "gz") return codec_kind::gzip;
  if (name == "zstd" || name == "zst") return codec_kind::zstd;
  return std::unexpected(error{error_code::invalid_argument, "unknown codec \"" + std::string(name) + "\"", "codec"});
}

auto detect_codec(std::span<const std::uint8_t> head) noexcept -> std::optional<codec_kind> {
  if (head.size() >= 2 && head[0] == 0x1f && head[1] == 0x8b) return codec_kind::gzip;
  if (head.size() >= 4 && head[0] == 0x28 && head[1] == 0xb5 && head[2] == 0x2f && head[3] == 0xfd) {
    return codec_kind::zstd;
  }
  return std::nullopt;
}

auto compress_frame(codec_kind kind, int level, std::span<const std::uint8_t> raw)
    -> std::expected<std::vector<std::uint8_t>, error> {
  switch (kind) {
    case codec_kind::gzip:
      return detail::gzip_compress(level, raw);
    case codec_kind::zstd:
#ifdef PARTPIPE_HAS_ZSTD
      return detail::zstd_compress(level, raw);
#else
      break;
#endif
  }
  return std::unexpected(error{error_code::unsupported, std::string(codec_name(kind)) + " not compiled in", "codec"});
}

FrameDecoder::FrameDecoder(codec_kind kind, std::unique_ptr<Backend> backend)
    : kind_(kind), backend_(std::move(backend)) {}
FrameDecoder::FrameDecoder(FrameDecoder&&) noexcept = default;
FrameDecoder& FrameDecoder::operator=(FrameDecoder&&) noexcept = default;
FrameDecoder::~FrameDecoder() = default;

auto FrameDecoder::create(codec_kind kind) -> std::expected<FrameDecoder, error> {
  std::expected<std::unique_ptr<Backend>, error> backend =
      std::unexpected(error{error_code::unsupported, std::string(codec_name(kind)) + " not compiled in", "codec"});
  switch (kind) {
    case codec_kind::gzip: backend = detail::make_gzip_decoder(); break;
    case codec_kind::zstd:
#ifdef PARTPIPE_HAS_ZSTD
      backend = detail::make_zstd_decoder();
#endif
      break;
  }
  if (!backend) return std::unexpected(backend.error());
  return FrameDecoder(kind, std::move(*backend));
}

auto FrameDecoder::feed(std::span<const std::uint8_t> input, std::vector<std::uint8_t>& out)
    -> std::expected<void, error> {
  if (!backend_) return std::unexpected(error{error_code::precondition_failed, "decoder moved-from", "codec"});
  if (input.empty()) return {};
  return backend_->feed(input, out);
}

auto FrameDecoder::finish() -> std::expected<void, error> {
  if (!backend_) return std::unexpected(error{error_code::precondition_failed, "decoder moved-from", "codec"});
  if (backend_->in_frame()) {
    return std::unexpected(error{error_code::data_integrity, "stream ended inside a frame", "codec"});
  }
  return {};
}

auto FrameDecoder::frames() const noexcept -> std::uint64_t { return backend_ ? backend_->frames() : 0; }
auto FrameDecoder::kind() const noexcept -> codec_kind { return kind_; }

} // namespace partpipe::codec
