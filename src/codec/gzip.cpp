#include "backends.hpp"

#include <zlib.h>

#include <limits>
#include <string>

namespace partpipe::codec::detail {

using core::error;
using core::error_code;

namespace {

constexpr int kGzipWindowBits = 15 + 16;  // deflate window + gzip wrapper
constexpr std::size_t kOutChunk = 64 * 1024;

auto zerr(error_code code, std::string what, int ret) -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(what) + " (" + std::to_string(ret) + ")", "codec.gzip"});
}

class GzipDecoder final : public FrameDecoder::Backend {
public:
  GzipDecoder() = default;
  GzipDecoder(const GzipDecoder&) = delete;
  GzipDecoder& operator=(const GzipDecoder&) = delete;
  ~GzipDecoder() override { if (initialized_) inflateEnd(&strm_); }

  auto init() -> std::expected<void, error> {
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;
    strm_.avail_in = 0;
    strm_.next_in = Z_NULL;
    int ret = inflateInit2(&strm_, kGzipWindowBits);
    if (ret != Z_OK) return zerr(error_code::internal, "inflateInit2 failed", ret);
    initialized_ = true;
    return {};
  }

  auto feed(std::span<const std::uint8_t> input, std::vector<std::uint8_t>& out)
      -> std::expected<void, error> override {
    if (input.size() > std::numeric_limits<uInt>::max()) {
      return std::unexpected(error{error_code::invalid_argument, "input slice too large", "codec.gzip"});
    }
    strm_.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    strm_.avail_in = static_cast<uInt>(input.size());

    std::uint8_t buf[kOutChunk];
    while (strm_.avail_in > 0) {
      if (!in_frame_) {
        // next member starts here
        if (member_started_) {
          int rr = inflateReset(&strm_);
          if (rr != Z_OK) return zerr(error_code::internal, "inflateReset failed", rr);
        }
        member_started_ = true;
        in_frame_ = true;
      }
      int ret = Z_OK;
      do {
        strm_.next_out = buf;
        strm_.avail_out = static_cast<uInt>(kOutChunk);
        ret = inflate(&strm_, Z_NO_FLUSH);
        switch (ret) {
          case Z_NEED_DICT:
          case Z_DATA_ERROR:
            return zerr(error_code::data_integrity, "corrupt gzip data", ret);
          case Z_MEM_ERROR:
            return zerr(error_code::out_of_memory, "inflate out of memory", ret);
          case Z_STREAM_ERROR:
            return zerr(error_code::internal, "inflate stream error", ret);
          default:
            break;
        }
        const std::size_t have = kOutChunk - strm_.avail_out;
        out.insert(out.end(), buf, buf + have);
        if (ret == Z_STREAM_END) {
          in_frame_ = false;
          ++frames_;
          break;
        }
        if (ret == Z_BUF_ERROR) {
          if (strm_.avail_in > 0) return zerr(error_code::internal, "inflate made no progress", ret);
          break; // needs more input
        }
      } while (strm_.avail_out == 0 || strm_.avail_in > 0);
      if (ret != Z_STREAM_END && strm_.avail_in == 0) break;
    }
    return {};
  }

  auto in_frame() const noexcept -> bool override { return in_frame_; }
  auto frames() const noexcept -> std::uint64_t override { return frames_; }

private:
  z_stream strm_{};
  bool initialized_{false};
  bool member_started_{false};
  bool in_frame_{false};
  std::uint64_t frames_{0};
};

} // namespace

auto gzip_compress(int level, std::span<const std::uint8_t> raw)
    -> std::expected<std::vector<std::uint8_t>, error> {
  if (raw.size() > std::numeric_limits<uInt>::max()) {
    return std::unexpected(error{error_code::invalid_argument, "chunk too large for one gzip member", "codec.gzip"});
  }
  z_stream strm{};
  strm.zalloc = Z_NULL;
  strm.zfree = Z_NULL;
  strm.opaque = Z_NULL;

  int ret = deflateInit2(&strm, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY);
  if (ret != Z_OK) return zerr(error_code::internal, "deflateInit2 failed", ret);

  std::vector<std::uint8_t> frame(deflateBound(&strm, static_cast<uLong>(raw.size())));
  strm.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(raw.data()));
  strm.avail_in = static_cast<uInt>(raw.size());

  // deflateBound covers a single Z_FINISH pass; grow if it ever does not
  std::size_t produced = 0;
  do {
    if (produced == frame.size()) frame.resize(frame.size() + kOutChunk);
    strm.next_out = frame.data() + produced;
    strm.avail_out = static_cast<uInt>(frame.size() - produced);
    ret = deflate(&strm, Z_FINISH);
    if (ret == Z_STREAM_ERROR) {
      deflateEnd(&strm);
      return zerr(error_code::internal, "deflate failed", ret);
    }
    produced = frame.size() - strm.avail_out;
  } while (ret != Z_STREAM_END);

  deflateEnd(&strm);
  frame.resize(produced);
  return frame;
}

auto make_gzip_decoder() -> std::expected<std::unique_ptr<FrameDecoder::Backend>, error> {
  auto dec = std::make_unique<GzipDecoder>();
  if (auto r = dec->init(); !r) return std::unexpected(r.error());
  return std::unique_ptr<FrameDecoder::Backend>(std::move(dec));
}

} // namespace partpipe::codec::detail
