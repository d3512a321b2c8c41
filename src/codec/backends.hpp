#pragma once

// Per-codec entry points used by codec.cpp. Not installed.

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <vector>

#include "partpipe/codec/codec.hpp"

namespace partpipe::codec::detail {

auto gzip_compress(int level, std::span<const std::uint8_t> raw)
    -> std::expected<std::vector<std::uint8_t>, core::error>;
auto make_gzip_decoder() -> std::expected<std::unique_ptr<FrameDecoder::Backend>, core::error>;

#ifdef PARTPIPE_HAS_ZSTD
auto zstd_compress(int level, std::span<const std::uint8_t> raw)
    -> std::expected<std::vector<std::uint8_t>, core::error>;
auto make_zstd_decoder() -> std::expected<std::unique_ptr<FrameDecoder::Backend>, core::error>;
#endif

} // namespace partpipe::codec::detail
