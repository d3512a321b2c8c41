#pragma once

/** \file config.hpp
 *  \brief Pipeline tunables, their defaults and the sources they are merged from.
 *
 * Priority when merging: command line > config file > environment > defaults.
 * Each source only overwrites the fields it names.
 *
 * Config file format (one assignment per line, '#' starts a comment):
 *   split_size_gb = 3.5
 *   chunk_bytes = 2097152
 *   workers = 8
 *   compression_level = 6
 *   pending_threshold = 16
 *   codec = gzip
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string_view>

#include "partpipe/codec/codec.hpp"
#include "partpipe/core/platform_utils.hpp"
#include "partpipe/error.hpp"

namespace partpipe::core {

constexpr std::size_t kDefaultChunkBytes = 2u * 1024u * 1024u;                    // 2 MiB
constexpr std::uint64_t kDefaultSegmentBytes = 3584ull * 1024ull * 1024ull;       // 3.5 GiB
constexpr std::uint64_t kFatSegmentLimit = 3993ull * 1024ull * 1024ull;           // ~3.9 GiB, below the FAT32 4 GiB file cap
constexpr int kDefaultLevel = 1;

struct PipelineConfig {
  std::uint64_t segment_bytes{kDefaultSegmentBytes}; /**< bytes per part; 0 = single output file */
  std::size_t chunk_bytes{kDefaultChunkBytes};        /**< raw bytes per compression chunk */
  std::size_t workers{hardware_workers()};            /**< compression threads */
  int level{kDefaultLevel};                           /**< forwarded to every chunk */
  std::size_t pending_threshold{0};                   /**< max in-flight chunks; 0 = 2 x workers */
  codec::codec_kind codec{codec::codec_kind::gzip};

  [[nodiscard]] auto resolved_pending_threshold() const noexcept -> std::size_t {
    return pending_threshold != 0 ? pending_threshold : 2 * workers;
  }
};

/** Reject zero chunk size or workers, out-of-range level and codecs not compiled in. */
[[nodiscard]] auto validate(const PipelineConfig& cfg) -> std::expected<void, error>;

/** Overlay PARTPIPE_SEGMENT_BYTES, PARTPIPE_CHUNK_BYTES, PARTPIPE_WORKERS,
 *  PARTPIPE_LEVEL, PARTPIPE_PENDING and PARTPIPE_CODEC when set. */
[[nodiscard]] auto apply_env(PipelineConfig& cfg) -> std::expected<void, error>;

/** Overlay the assignments found in a config file. Unknown keys are errors. */
[[nodiscard]] auto load_config_file(const std::filesystem::path& path, PipelineConfig& cfg)
    -> std::expected<void, error>;

/** Apply one assignment (same keys as the config file). */
[[nodiscard]] auto apply_setting(std::string_view key, std::string_view value, PipelineConfig& cfg)
    -> std::expected<void, error>;

/** True when `dir` lives on a FAT-family filesystem (vfat/msdos/exfat). */
auto is_fat_filesystem(const std::filesystem::path& dir) noexcept -> bool;

/** Cap segment_bytes at kFatSegmentLimit on FAT-family destinations; returns true if clamped. */
auto clamp_segment_bytes_for(const std::filesystem::path& dir, PipelineConfig& cfg) noexcept -> bool;

} // namespace partpipe::core
