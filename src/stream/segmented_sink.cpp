#include "partpipe/stream/segmented_sink.hpp"
#include "partpipe/stream/parts_manifest.hpp"
#include "partpipe/core/platform_utils.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

// OS-level sync of a closed file. Errors are propagated via std::expected.
static auto fsync_file_path(const std::filesystem::path& p) -> std::expected<void, partpipe::core::error> {
  using partpipe::core::error; using partpipe::core::error_code;
#if defined(__linux__) || defined(__APPLE__)
  int fd = ::open(p.c_str(), O_RDONLY);
  if (fd < 0) {
    return std::unexpected(error{error_code::io_failed, "fsync open failed", "stream.sink"});
  }
  int rc = ::fsync(fd);
  (void)::close(fd);
  if (rc != 0) {
    return std::unexpected(error{error_code::io_failed, "fsync failed", "stream.sink"});
  }
#else
  (void)p;
#endif
  return {};
}

namespace partpipe::stream {

SegmentedSink::~SegmentedSink() { if (out_.is_open()) out_.close(); }

auto SegmentedSink::open(const SegmentedSinkOptions& opts) -> std::expected<SegmentedSink, core::error> {
  using core::error; using core::error_code;
  if (opts.segment_bytes == 0) {
    return std::unexpected(error{error_code::config_invalid, "segment_bytes must be > 0", "stream.sink"});
  }
  if (opts.base_name.empty()) {
    return std::unexpected(error{error_code::config_invalid, "base_name is empty", "stream.sink"});
  }
  if (opts.suffix_width == 0 || opts.suffix_width > 20) {
    return std::unexpected(error{error_code::config_invalid, "suffix_width must be in [1, 20]", "stream.sink"});
  }
  SegmentedSink s;
  s.opts_ = opts;
  if (s.opts_.dir.empty()) s.opts_.dir = ".";
  if (!std::filesystem::exists(s.opts_.dir)) {
    std::error_code ec; std::filesystem::create_directories(s.opts_.dir, ec);
    if (ec) return std::unexpected(error{error_code::io_failed, "mkdir failed: " + ec.message(), "stream.sink"});
  }
  return s;
}

auto SegmentedSink::segment_path(std::uint64_t index) const -> std::filesystem::path {
  std::ostringstream oss;
  oss << opts_.base_name << opts_.part_tag << std::setw(static_cast<int>(opts_.suffix_width)) << std::setfill('0') << index;
  return opts_.dir / oss.str();
}

auto SegmentedSink::open_next() -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  cur_index_ = stats_.segments_opened;
  cur_path_ = segment_path(cur_index_);
  out_.open(cur_path_, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!out_.good()) {
    return std::unexpected(error{error_code::io_failed, "open segment failed: " + cur_path_.string(), "stream.sink"});
  }
  cur_bytes_ = 0;
  stats_.segments_opened++;
  return {};
}

auto SegmentedSink::finish_current(bool last) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  out_.flush();
  const bool ok = out_.good();
  out_.close();
  if (!ok || out_.fail()) {
    return std::unexpected(error{error_code::io_failed, "close segment failed: " + cur_path_.string(), "stream.sink"});
  }
  if (opts_.fsync_on_close) {
    if (auto r = fsync_file_path(cur_path_); !r) { return std::unexpected(r.error()); }
    stats_.syncs++;
  }
  SegmentInfo info{cur_path_, cur_index_, cur_bytes_};
  if (last && opts_.collapse_single_segment && stats_.segments_opened == 1) {
    auto target = opts_.dir / opts_.base_name;
    std::error_code ec; std::filesystem::rename(cur_path_, target, ec);
    if (ec) {
      return std::unexpected(error{error_code::io_failed, "rename single segment failed: " + ec.message(), "stream.sink"});
    }
    info.path = target;
  }
  stats_.segments_closed++;
  if (core::debug_enabled()) {
    std::cerr << "[PARTPIPE][sink] closed " << info.path.filename().string() << " bytes=" << info.bytes << std::endl;
  }
  closed_segments_.push_back(info);
  if (opts_.on_segment_closed) opts_.on_segment_closed(info);
  return {};
}

auto SegmentedSink::write(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (closed_) {
    return std::unexpected(error{error_code::precondition_failed, "write after close", "stream.sink"});
  }
  while (!bytes.empty()) {
    if (!out_.is_open()) {
      if (auto r = open_next(); !r) return std::unexpected(r.error());
    } else if (cur_bytes_ == opts_.segment_bytes) {
      // current segment is full and more bytes follow: roll over
      if (auto r = finish_current(false); !r) return std::unexpected(r.error());
      if (auto r = open_next(); !r) return std::unexpected(r.error());
    }
    const std::uint64_t room = opts_.segment_bytes - cur_bytes_;
    const std::size_t take = static_cast<std::size_t>(std::min<std::uint64_t>(room, bytes.size()));
    out_.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(take));
    if (!out_.good()) {
      return std::unexpected(error{error_code::io_failed, "write failed: " + cur_path_.string(), "stream.sink"});
    }
    cur_bytes_ += take;
    stats_.bytes += take;
    bytes = bytes.subspan(take);
  }
  return {};
}

auto SegmentedSink::close() -> std::expected<void, core::error> {
  if (closed_) return {};
  closed_ = true;
  if (out_.is_open()) {
    if (auto r = finish_current(true); !r) return std::unexpected(r.error());
  }
  if (opts_.write_manifest) {
    PartsManifest m{};
    m.entries.reserve(closed_segments_.size());
    for (const auto& s : closed_segments_) {
      m.entries.push_back({s.path.filename().string(), s.index, s.bytes});
    }
    if (auto r = save_parts_manifest(opts_.dir / (opts_.base_name + ".manifest"), m); !r) {
      return std::unexpected(r.error());
    }
  }
  return {};
}

} // namespace partpipe::stream
