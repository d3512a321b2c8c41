#include "backends.hpp"

#ifdef PARTPIPE_HAS_ZSTD

#include <zstd.h>

#include <string>

namespace partpipe::codec::detail {

using core::error;
using core::error_code;

namespace {

auto zstd_err(error_code code, const char* what, std::size_t rc) -> std::unexpected<error> {
  return std::unexpected(error{code, std::string(what) + ": " + ZSTD_getErrorName(rc), "codec.zstd"});
}

class ZstdDecoder final : public FrameDecoder::Backend {
public:
  ZstdDecoder() : dctx_(ZSTD_createDCtx()) {}
  ZstdDecoder(const ZstdDecoder&) = delete;
  ZstdDecoder& operator=(const ZstdDecoder&) = delete;
  ~ZstdDecoder() override { ZSTD_freeDCtx(dctx_); }

  auto valid() const noexcept -> bool { return dctx_ != nullptr; }

  auto feed(std::span<const std::uint8_t> input, std::vector<std::uint8_t>& out)
      -> std::expected<void, error> override {
    ZSTD_inBuffer in{input.data(), input.size(), 0};
    std::vector<std::uint8_t> buf(ZSTD_DStreamOutSize());
    bool output_full = false;
    while (in.pos < in.size || output_full) {
      ZSTD_outBuffer o{buf.data(), buf.size(), 0};
      const std::size_t before = in.pos;
      const std::size_t rc = ZSTD_decompressStream(dctx_, &o, &in);
      if (ZSTD_isError(rc)) return zstd_err(error_code::data_integrity, "corrupt zstd data", rc);
      out.insert(out.end(), buf.data(), buf.data() + o.pos);
      if (rc == 0) {
        // frame fully decoded and flushed
        if (in_frame_ || in.pos > before) ++frames_;
        in_frame_ = false;
      } else {
        in_frame_ = true;
      }
      output_full = (o.pos == o.size);
    }
    return {};
  }

  auto in_frame() const noexcept -> bool override { return in_frame_; }
  auto frames() const noexcept -> std::uint64_t override { return frames_; }

private:
  ZSTD_DCtx* dctx_;
  bool in_frame_{false};
  std::uint64_t frames_{0};
};

} // namespace

auto zstd_compress(int level, std::span<const std::uint8_t> raw)
    -> std::expected<std::vector<std::uint8_t>, error> {
  std::vector<std::uint8_t> frame(ZSTD_compressBound(raw.size()));
  ZSTD_CCtx* cctx = ZSTD_createCCtx();
  if (cctx == nullptr) {
    return std::unexpected(error{error_code::out_of_memory, "ZSTD_createCCtx failed", "codec.zstd"});
  }
  const std::size_t got = ZSTD_compressCCtx(cctx, frame.data(), frame.size(), raw.data(), raw.size(), level);
  ZSTD_freeCCtx(cctx);
  if (ZSTD_isError(got)) return zstd_err(error_code::internal, "ZSTD_compressCCtx failed", got);
  frame.resize(got);
  return frame;
}

auto make_zstd_decoder() -> std::expected<std::unique_ptr<FrameDecoder::Backend>, error> {
  auto dec = std::make_unique<ZstdDecoder>();
  if (!dec->valid()) {
    return std::unexpected(error{error_code::out_of_memory, "ZSTD_createDCtx failed", "codec.zstd"});
  }
  return std::unique_ptr<FrameDecoder::Backend>(std::move(dec));
}

} // namespace partpipe::codec::detail

#endif // PARTPIPE_HAS_ZSTD
