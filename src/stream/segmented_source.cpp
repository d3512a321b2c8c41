#include "partpipe/stream/segmented_source.hpp"
#include "partpipe/core/platform_utils.hpp"

#include <algorithm>
#include <iostream>

#include <fnmatch.h>

namespace partpipe::stream {

namespace {

constexpr std::size_t kMiB = 1024u * 1024u;

auto has_wildcard(const std::string& s) -> bool {
  return s.find_first_of("*?[") != std::string::npos;
}

// Trailing digit run with leading zeros stripped ("" when there is none).
auto trailing_number(const std::string& name) -> std::string {
  std::size_t end = name.size();
  std::size_t beg = end;
  while (beg > 0 && name[beg - 1] >= '0' && name[beg - 1] <= '9') --beg;
  if (beg == end) return {};
  while (beg + 1 < end && name[beg] == '0') ++beg;
  return name.substr(beg, end - beg);
}

auto numeric_order(const std::filesystem::path& a, const std::filesystem::path& b) -> bool {
  const auto an = a.filename().string(), bn = b.filename().string();
  const auto ad = trailing_number(an), bd = trailing_number(bn);
  if (ad.empty() != bd.empty()) return !ad.empty();
  if (ad.size() != bd.size()) return ad.size() < bd.size();
  if (ad != bd) return ad < bd;
  return an < bn;
}

auto glob_dir(const std::filesystem::path& dir, const std::string& file_pattern)
    -> std::expected<std::vector<std::filesystem::path>, core::error> {
  std::vector<std::filesystem::path> out;
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec), end;
  if (ec) {
    return std::unexpected(core::error{core::error_code::not_found,
        "no segments found: cannot list " + dir.string(), "stream.source"});
  }
  for (; it != end; it.increment(ec)) {
    if (ec) {
      return std::unexpected(core::error{core::error_code::io_failed,
          "directory scan failed: " + ec.message(), "stream.source"});
    }
    std::error_code fec;
    if (!it->is_regular_file(fec)) continue;
    const auto name = it->path().filename().string();
    if (::fnmatch(file_pattern.c_str(), name.c_str(), FNM_PERIOD) == 0) {
      out.push_back(it->path());
    }
  }
  return out;
}

} // namespace

auto resolve_segments(const std::string& pattern)
    -> std::expected<std::vector<std::filesystem::path>, core::error> {
  using core::error; using core::error_code;
  if (pattern.empty()) {
    return std::unexpected(error{error_code::invalid_argument, "empty segment pattern", "stream.source"});
  }
  const std::filesystem::path p(pattern);
  const auto dir = p.parent_path().empty() ? std::filesystem::path(".") : p.parent_path();
  std::string name = p.filename().string();
  if (name.empty()) {
    return std::unexpected(error{error_code::invalid_argument, "pattern names a directory: " + pattern, "stream.source"});
  }
  if (has_wildcard(p.parent_path().string())) {
    return std::unexpected(error{error_code::invalid_argument,
        "wildcards are only supported in the file name: " + pattern, "stream.source"});
  }

  if (!has_wildcard(name)) {
    std::error_code ec;
    if (auto pos = name.find("part_"); pos != std::string::npos) {
      name = name.substr(0, pos) + "part_*";
    } else if (std::filesystem::is_regular_file(p, ec)) {
      return std::vector<std::filesystem::path>{p};
    } else if (std::filesystem::is_regular_file(dir / (name + ".part_000"), ec)) {
      name += ".part_*";
    }
  }

  auto found = glob_dir(dir, name);
  if (!found) return found;
  if (found->empty()) {
    return std::unexpected(error{error_code::not_found, "no segments found: " + pattern, "stream.source"});
  }
  std::sort(found->begin(), found->end(), numeric_order);
  return found;
}

auto adaptive_buffer_bytes(std::uint64_t total_bytes) noexcept -> std::size_t {
  if (total_bytes <= 64ull * kMiB) return 4 * kMiB;
  if (total_bytes <= 4096ull * kMiB) return 1 * kMiB;
  return 256u * 1024u;
}

auto SegmentedSource::open(const std::string& pattern, const SegmentedSourceOptions& opts)
    -> std::expected<SegmentedSource, core::error> {
  auto segs = resolve_segments(pattern);
  if (!segs) return std::unexpected(segs.error());
  return open(std::move(*segs), opts);
}

auto SegmentedSource::open(std::vector<std::filesystem::path> segments, const SegmentedSourceOptions& opts)
    -> std::expected<SegmentedSource, core::error> {
  using core::error; using core::error_code;
  if (segments.empty()) {
    return std::unexpected(error{error_code::not_found, "no segments found", "stream.source"});
  }
  SegmentedSource s;
  for (const auto& seg : segments) {
    std::error_code ec;
    const auto sz = std::filesystem::file_size(seg, ec);
    if (ec) {
      return std::unexpected(error{error_code::not_found, "segment missing: " + seg.string(), "stream.source"});
    }
    s.total_bytes_ += sz;
  }
  s.segments_ = std::move(segments);
  s.buf_.resize(opts.buffer_bytes != 0 ? opts.buffer_bytes : adaptive_buffer_bytes(s.total_bytes_));
  if (core::debug_enabled()) {
    std::cerr << "[PARTPIPE][source] segments=" << s.segments_.size() << " bytes=" << s.total_bytes_
              << " buffer=" << s.buf_.size() << std::endl;
  }
  return s;
}

auto SegmentedSource::open_current() -> std::expected<void, core::error> {
  const auto& path = segments_[idx_];
  auto in = std::make_unique<std::ifstream>();
  in->rdbuf()->pubsetbuf(buf_.data(), static_cast<std::streamsize>(buf_.size()));
  in->open(path, std::ios::binary | std::ios::in);
  if (!in->is_open()) {
    return std::unexpected(core::error{core::error_code::io_failed, "open segment failed: " + path.string(), "stream.source"});
  }
  in_ = std::move(in);
  stats_.segments_opened++;
  return {};
}

auto SegmentedSource::read_into(std::span<std::uint8_t> dst) -> std::expected<std::size_t, core::error> {
  if (closed_) {
    return std::unexpected(core::error{core::error_code::precondition_failed, "read after close", "stream.source"});
  }
  std::size_t filled = 0;
  while (filled < dst.size() && idx_ < segments_.size()) {
    if (!in_) {
      if (auto r = open_current(); !r) return std::unexpected(r.error());
    }
    const auto want = dst.size() - filled;
    in_->read(reinterpret_cast<char*>(dst.data() + filled), static_cast<std::streamsize>(want));
    const auto got = static_cast<std::size_t>(in_->gcount());
    filled += got;
    if (got < want) {
      if (in_->bad()) {
        return std::unexpected(core::error{core::error_code::io_failed,
            "read failed: " + segments_[idx_].string(), "stream.source"});
      }
      in_.reset();
      ++idx_;
    }
  }
  stats_.bytes += filled;
  return filled;
}

auto SegmentedSource::read(std::size_t n) -> std::expected<std::vector<std::uint8_t>, core::error> {
  std::vector<std::uint8_t> out(n);
  auto r = read_into(out);
  if (!r) return std::unexpected(r.error());
  out.resize(*r);
  return out;
}

auto SegmentedSource::read_all() -> std::expected<std::vector<std::uint8_t>, core::error> {
  std::vector<std::uint8_t> out;
  const std::size_t step = std::max<std::size_t>(buf_.size(), 64u * 1024u);
  while (true) {
    const auto old = out.size();
    out.resize(old + step);
    auto r = read_into(std::span<std::uint8_t>(out.data() + old, step));
    if (!r) return std::unexpected(r.error());
    out.resize(old + *r);
    if (*r < step) break;
  }
  return out;
}

auto SegmentedSource::close() noexcept -> void {
  in_.reset();
  closed_ = true;
}

} // namespace partpipe::stream
