#pragma once

/** \file codec.hpp
 *  \brief Self-contained compressed frames and a streaming decoder for their concatenation.
 *
 * Every frame is a complete container unit (a gzip member or a zstd frame), so
 * frames produced independently can be concatenated byte-for-byte and still
 * decode, read sequentially, into the concatenation of their inputs.
 *
 * Codec availability is a build property resolved once (see available_codecs()).
 * Thread-safety: compress_frame is stateless and thread-safe; a FrameDecoder is
 * owned by a single thread.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "partpipe/error.hpp"

namespace partpipe::codec {

enum class codec_kind : std::uint8_t { gzip = 0, zstd = 1 };

/** Capability bits reported by available_codecs(). */
enum capability : std::uint32_t {
  cap_gzip = 1u << 0,
  cap_zstd = 1u << 1,
};

/** Codecs compiled into this build; computed on first call and cached. */
auto available_codecs() noexcept -> std::uint32_t;
auto is_available(codec_kind kind) noexcept -> bool;

auto codec_name(codec_kind kind) noexcept -> const char*;
/** ".gz" or ".zst" */
auto file_extension(codec_kind kind) noexcept -> const char*;
/** Inclusive level range accepted by compress_frame. */
auto level_range(codec_kind kind) noexcept -> std::pair<int, int>;

/** Accepts "gzip"/"gz" and "zstd"/"zst" (case-sensitive). */
auto parse_codec(std::string_view name) -> std::expected<codec_kind, core::error>;

/** Identify a codec from the first bytes of a stream (gzip 1f 8b, zstd 28 b5 2f fd). */
auto detect_codec(std::span<const std::uint8_t> head) noexcept -> std::optional<codec_kind>;

/** Compress `raw` into one complete frame. */
[[nodiscard]] auto compress_frame(codec_kind kind, int level, std::span<const std::uint8_t> raw)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

/** \brief Incremental decoder for a sequence of concatenated frames.
 *
 * Input may be fed in slices cut at arbitrary offsets, including inside frame
 * headers and trailers. Decoded bytes are appended to the caller's vector.
 */
class FrameDecoder {
public:
  FrameDecoder(FrameDecoder&&) noexcept;
  FrameDecoder& operator=(FrameDecoder&&) noexcept;
  FrameDecoder(const FrameDecoder&) = delete;
  FrameDecoder& operator=(const FrameDecoder&) = delete;
  ~FrameDecoder();

  static auto create(codec_kind kind) -> std::expected<FrameDecoder, core::error>;

  auto feed(std::span<const std::uint8_t> input, std::vector<std::uint8_t>& out)
      -> std::expected<void, core::error>;

  /** Fails with data_integrity when the input ended inside a frame. */
  auto finish() -> std::expected<void, core::error>;

  /** Number of frames fully decoded so far. */
  auto frames() const noexcept -> std::uint64_t;
  auto kind() const noexcept -> codec_kind;

  /** Backend interface; one implementation per codec. */
  class Backend {
  public:
    virtual ~Backend() = default;
    virtual auto feed(std::span<const std::uint8_t> input, std::vector<std::uint8_t>& out)
        -> std::expected<void, core::error> = 0;
    virtual auto in_frame() const noexcept -> bool = 0;
    virtual auto frames() const noexcept -> std::uint64_t = 0;
  };

private:
  FrameDecoder(codec_kind kind, std::unique_ptr<Backend> backend);

  codec_kind kind_;
  std::unique_ptr<Backend> backend_;
};

} // namespace partpipe::codec
