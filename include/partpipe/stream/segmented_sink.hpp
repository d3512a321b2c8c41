#pragma once

/** \file segmented_sink.hpp
 *  \brief Writes one byte stream across numbered, size-bounded segment files.
 *
 * Naming: dir / (base_name + part_tag + zero-padded index), e.g.
 * "home.tar.gz.part_000", "home.tar.gz.part_001", ...
 *
 * Notes
 * - Segments are created lazily; a stream of zero bytes produces no segment.
 * - No segment ever exceeds segment_bytes; a write larger than the remaining
 *   space is split and continues in as many new segments as it needs.
 * - A segment is announced (callback + closed_segments()) only after it has
 *   been fully written and closed.
 * - Not thread-safe; one writer per sink.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <functional>
#include <span>
#include <string>
#include <vector>

#include "partpipe/error.hpp"
#include "partpipe/stream/byte_sink.hpp"

namespace partpipe::stream {

struct SegmentInfo {
  std::filesystem::path path;
  std::uint64_t index{};
  std::uint64_t bytes{};
};

/** Invoked once per segment, after the segment file is closed. */
using SegmentClosedFn = std::function<void(const SegmentInfo&)>;

struct SegmentedSinkOptions {
  std::filesystem::path dir;          /**< directory receiving the segments (created if missing) */
  std::string base_name;              /**< e.g. "home.tar.gz" */
  std::string part_tag{".part_"};     /**< separator between base name and index */
  std::uint64_t segment_bytes{};      /**< capacity of every segment; must be > 0 */
  unsigned suffix_width{3};           /**< zero-padded digits in the index */
  bool collapse_single_segment{false};/**< rename a lone segment to dir/base_name on close */
  bool fsync_on_close{false};         /**< sync each segment when it is finalized */
  bool write_manifest{false};         /**< write dir/(base_name + ".manifest") on close */
  SegmentClosedFn on_segment_closed;  /**< upload hook; may be empty */
};

struct SegmentedSinkStats {
  std::uint64_t segments_opened{};
  std::uint64_t segments_closed{};
  std::uint64_t bytes{};
  std::uint64_t syncs{};
};

class SegmentedSink final : public ByteSink {
public:
  SegmentedSink() = default;
  ~SegmentedSink() override;
  SegmentedSink(SegmentedSink&&) noexcept = default;
  SegmentedSink& operator=(SegmentedSink&&) noexcept = default;
  SegmentedSink(const SegmentedSink&) = delete;
  SegmentedSink& operator=(const SegmentedSink&) = delete;

  static auto open(const SegmentedSinkOptions& opts) -> std::expected<SegmentedSink, core::error>;

  auto write(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error> override;

  /** Finalize the current segment. Idempotent. */
  auto close() -> std::expected<void, core::error> override;

  /** Path of segment `index` before any single-segment collapse. */
  auto segment_path(std::uint64_t index) const -> std::filesystem::path;

  [[nodiscard]] bool closed() const noexcept { return closed_; }
  /** Segments created so far (open one included). */
  [[nodiscard]] std::uint64_t segment_count() const noexcept { return stats_.segments_opened; }
  /** Exactly one segment was produced. */
  [[nodiscard]] bool single_segment() const noexcept { return stats_.segments_opened == 1; }
  [[nodiscard]] std::uint64_t bytes_written() const noexcept { return stats_.bytes; }
  const std::vector<SegmentInfo>& closed_segments() const noexcept { return closed_segments_; }
  const SegmentedSinkStats& stats() const noexcept { return stats_; }

private:
  auto open_next() -> std::expected<void, core::error>;
  auto finish_current(bool last) -> std::expected<void, core::error>;

  SegmentedSinkOptions opts_;
  std::filesystem::path cur_path_;
  std::uint64_t cur_index_{};
  std::uint64_t cur_bytes_{};
  bool closed_{false};
  SegmentedSinkStats stats_{};
  std::vector<SegmentInfo> closed_segments_;
  std::ofstream out_;
};

} // namespace partpipe::stream
