#pragma once

/** \file segmented_source.hpp
 *  \brief Reads an ordered list of segment files as one contiguous stream.
 *
 * Segments are opened one at a time; reads cross segment boundaries
 * transparently. Zero-length segments are skipped.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "partpipe/error.hpp"

namespace partpipe::stream {

/** \brief Resolve a naming pattern into segment paths in stream order.
 *
 * - The filename part may use `*`, `?` and `[...]`; the directory part may not.
 * - Without wildcards, a name containing "part_" is widened to "<prefix>part_*".
 * - Without wildcards, an existing regular file resolves to itself.
 * - Without wildcards, "<name>" whose "<name>.part_000" exists resolves to "<name>.part_*".
 * Results are ordered by their trailing digit run (numerically), then by name.
 * An empty result is not_found.
 */
auto resolve_segments(const std::string& pattern)
    -> std::expected<std::vector<std::filesystem::path>, core::error>;

/** Read buffer size for a source of `total_bytes`: larger buffers for small inputs. */
auto adaptive_buffer_bytes(std::uint64_t total_bytes) noexcept -> std::size_t;

struct SegmentedSourceOptions {
  std::size_t buffer_bytes{0}; /**< stream buffer per open segment; 0 = adaptive */
};

struct SegmentedSourceStats {
  std::uint64_t segments_opened{};
  std::uint64_t bytes{};
};

class SegmentedSource {
public:
  SegmentedSource() = default;
  SegmentedSource(SegmentedSource&&) noexcept = default;
  SegmentedSource& operator=(SegmentedSource&&) noexcept = default;
  SegmentedSource(const SegmentedSource&) = delete;
  SegmentedSource& operator=(const SegmentedSource&) = delete;

  static auto open(const std::string& pattern, const SegmentedSourceOptions& opts = {})
      -> std::expected<SegmentedSource, core::error>;
  static auto open(std::vector<std::filesystem::path> segments, const SegmentedSourceOptions& opts = {})
      -> std::expected<SegmentedSource, core::error>;

  /** Up to `n` bytes; an empty result means end of stream. */
  auto read(std::size_t n) -> std::expected<std::vector<std::uint8_t>, core::error>;
  /** Everything not yet read. */
  auto read_all() -> std::expected<std::vector<std::uint8_t>, core::error>;
  /** Fill `dst` as far as the stream allows; returns the byte count (0 = end of stream). */
  auto read_into(std::span<std::uint8_t> dst) -> std::expected<std::size_t, core::error>;

  /** Release the open segment. Idempotent; later reads fail with precondition_failed. */
  auto close() noexcept -> void;

  const std::vector<std::filesystem::path>& segments() const noexcept { return segments_; }
  [[nodiscard]] std::size_t current_index() const noexcept { return idx_; }
  [[nodiscard]] std::uint64_t total_bytes() const noexcept { return total_bytes_; }
  [[nodiscard]] std::size_t buffer_bytes() const noexcept { return buf_.size(); }
  const SegmentedSourceStats& stats() const noexcept { return stats_; }

private:
  auto open_current() -> std::expected<void, core::error>;

  std::vector<std::filesystem::path> segments_;
  std::size_t idx_{0};
  std::uint64_t total_bytes_{0};
  std::vector<char> buf_;
  std::unique_ptr<std::ifstream> in_;
  bool closed_{false};
  SegmentedSourceStats stats_{};
};

} // namespace partpipe::stream
