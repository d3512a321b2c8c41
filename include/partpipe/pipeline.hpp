#pragma once

/** \file pipeline.hpp
 *  \brief End-to-end drivers: stream -> parallel compression -> segments, and back.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "partpipe/codec/codec.hpp"
#include "partpipe/core/config.hpp"
#include "partpipe/error.hpp"
#include "partpipe/stream/segmented_sink.hpp"

namespace partpipe::pipeline {

struct BackupOptions {
  std::filesystem::path dir;             /**< destination directory */
  std::string name;                      /**< archive stem, e.g. "home" -> "home.tar.gz.part_000" */
  core::PipelineConfig config{};
  bool write_manifest{false};
  bool fsync_segments{false};
  bool collapse_single_segment{false};   /**< a one-part result is renamed to "<name>.tar<ext>" */
  stream::SegmentClosedFn on_segment_closed;
};

struct BackupReport {
  std::uint64_t parts{};
  std::uint64_t bytes_in{};
  std::uint64_t bytes_out{};
  bool single_file{false};
  std::vector<stream::SegmentInfo> segments;
};

struct RestoreOptions {
  std::size_t buffer_bytes{0};                 /**< per-segment read buffer; 0 = adaptive */
  std::size_t read_bytes{1024u * 1024u};       /**< compressed bytes fed to the decoder per step */
  std::optional<codec::codec_kind> codec;      /**< detected from the stream when unset */
};

struct RestoreReport {
  std::uint64_t parts{};
  std::uint64_t bytes_in{};
  std::uint64_t bytes_out{};
};

/** "<name>.tar" + codec extension. */
auto archive_file_name(const std::string& name, codec::codec_kind kind) -> std::string;

/** Compress everything readable from `in` into segments under opts.dir.
 *  config.segment_bytes == 0 writes one un-suffixed file. */
auto backup_stream(std::istream& in, const BackupOptions& opts)
    -> std::expected<BackupReport, core::error>;

/** Decode the segments matched by `pattern` (see stream::resolve_segments) into `out`. */
auto restore_stream(const std::string& pattern, std::ostream& out, const RestoreOptions& opts = {})
    -> std::expected<RestoreReport, core::error>;

} // namespace partpipe::pipeline
