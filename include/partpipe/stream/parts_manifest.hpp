#pragma once

/** \file parts_manifest.hpp
 *  \brief Parts manifest format and load/save/verify helpers.
 *
 * Format (v1):
 *   header: "partpipe-parts-manifest v1"\n
 *   lines:  file=<name> seq=<N> bytes=<u64>\n
 *
 * File names are relative to the manifest's directory.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include "partpipe/error.hpp"

namespace partpipe::stream {

struct PartsManifestEntry {
  std::string file;     // filename (relative to the manifest's directory)
  std::uint64_t seq{};  // segment index
  std::uint64_t bytes{};
};

struct PartsManifest {
  std::vector<PartsManifestEntry> entries;

  auto total_bytes() const noexcept -> std::uint64_t {
    std::uint64_t t = 0;
    for (const auto& e : entries) t += e.bytes;
    return t;
  }
};

/** Write atomically (tmp file + rename). */
auto save_parts_manifest(const std::filesystem::path& file, const PartsManifest& m)
    -> std::expected<void, core::error>;

auto load_parts_manifest(const std::filesystem::path& file)
    -> std::expected<PartsManifest, core::error>;

/** Load and check that every listed part exists with the recorded size and
 *  that seq numbers are contiguous from zero. */
auto verify_parts_manifest(const std::filesystem::path& file)
    -> std::expected<PartsManifest, core::error>;

} // namespace partpipe::stream
