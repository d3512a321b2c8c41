#include "partpipe/stream/parts_manifest.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

namespace partpipe::stream {

namespace {

constexpr const char* kHeader = "partpipe-parts-manifest v1";

auto parse_u64(const std::string& s, std::uint64_t& out) -> bool {
  const char* beg = s.data(); const char* end = beg + s.size();
  unsigned long long tmp = 0;
  auto [ptr, ec] = std::from_chars(beg, end, tmp, 10);
  if (ec != std::errc() || ptr != end || beg == end) return false;
  out = static_cast<std::uint64_t>(tmp);
  return true;
}

auto is_valid_file(const std::string& v) -> bool {
  if (v.empty()) return false;
  for (unsigned char c : v) { if (c < 0x20 || c == 0x7F) return false; }
  // plain names only: no separators or traversal
  if (v.find('/') != std::string::npos || v.find('\\') != std::string::npos) return false;
  if (v == "." || v == "..") return false;
  return true;
}

auto parse_error(std::size_t line_no, const std::string& what) -> std::unexpected<core::error> {
  return std::unexpected(core::error{core::error_code::data_integrity,
      "manifest parse error at line " + std::to_string(line_no) + ": " + what, "stream.manifest"});
}

} // namespace

auto save_parts_manifest(const std::filesystem::path& file, const PartsManifest& m)
    -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  auto tmp = file; tmp += ".tmp";

  std::string content;
  content.reserve(64 + m.entries.size() * 64);
  content.append(kHeader).append("\n");
  for (const auto& e : m.entries) {
    content.append("file=").append(e.file)
           .append(" seq=").append(std::to_string(e.seq))
           .append(" bytes=").append(std::to_string(e.bytes))
           .append("\n");
  }

  { std::error_code ec; std::filesystem::remove(tmp, ec); }

#if defined(__linux__) || defined(__APPLE__)
  int fd = ::open(tmp.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
  if (fd < 0) {
    return std::unexpected(error{error_code::io_failed, "manifest tmp open failed", "stream.manifest"});
  }
  ssize_t written = 0; const char* data = content.data(); ssize_t to_write = static_cast<ssize_t>(content.size());
  while (to_write > 0) {
    ssize_t n = ::write(fd, data + written, static_cast<size_t>(to_write));
    if (n < 0) { ::close(fd); return std::unexpected(error{error_code::io_failed, "manifest tmp write failed", "stream.manifest"}); }
    written += n; to_write -= n;
  }
  (void)::fsync(fd);
  (void)::close(fd);
#else
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.good()) return std::unexpected(error{error_code::io_failed, "manifest tmp write failed", "stream.manifest"});
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out.good()) return std::unexpected(error{error_code::io_failed, "manifest tmp write failed", "stream.manifest"});
  }
#endif

  std::error_code ec;
  std::filesystem::rename(tmp, file, ec);
  if (ec) {
    std::error_code ec2; std::filesystem::remove(tmp, ec2);
    return std::unexpected(error{error_code::io_failed, "manifest rename failed", "stream.manifest"});
  }
  return {};
}

auto load_parts_manifest(const std::filesystem::path& file)
    -> std::expected<PartsManifest, core::error> {
  using core::error; using core::error_code;
  std::ifstream in(file);
  if (!in.good()) {
    return std::unexpected(error{error_code::not_found, "manifest open failed", "stream.manifest"});
  }
  std::string header; std::getline(in, header);
  if (header != kHeader) {
    return std::unexpected(error{error_code::data_integrity, "bad manifest header", "stream.manifest"});
  }

  PartsManifest m{};
  std::string line; std::size_t line_no = 1; // header already consumed
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) continue;
    PartsManifestEntry e{};
    bool have_file = false, have_seq = false, have_bytes = false;
    std::istringstream iss(line);
    std::string kv;
    while (iss >> kv) {
      auto eq = kv.find('='); if (eq == std::string::npos) continue;
      auto k = kv.substr(0, eq);
      auto v = kv.substr(eq + 1);
      if (k == "file") {
        if (!is_valid_file(v)) return parse_error(line_no, "invalid filename");
        e.file = v; have_file = true;
      } else if (k == "seq") {
        have_seq = parse_u64(v, e.seq);
        if (!have_seq) return parse_error(line_no, "invalid seq=\"" + v + "\"");
      } else if (k == "bytes") {
        have_bytes = parse_u64(v, e.bytes);
        if (!have_bytes) return parse_error(line_no, "invalid bytes=\"" + v + "\"");
      }
    }
    if (!have_file || !have_seq || !have_bytes) return parse_error(line_no, "missing required field(s)");
    m.entries.push_back(std::move(e));
  }
  std::sort(m.entries.begin(), m.entries.end(), [](const PartsManifestEntry& a, const PartsManifestEntry& b){ return a.seq < b.seq; });
  return m;
}

auto verify_parts_manifest(const std::filesystem::path& file)
    -> std::expected<PartsManifest, core::error> {
  using core::error; using core::error_code;
  auto m = load_parts_manifest(file);
  if (!m) return std::unexpected(m.error());
  const auto dir = file.parent_path().empty() ? std::filesystem::path(".") : file.parent_path();
  for (std::size_t i = 0; i < m->entries.size(); ++i) {
    const auto& e = m->entries[i];
    if (e.seq != i) {
      return std::unexpected(error{error_code::data_integrity, "missing part seq=" + std::to_string(i), "stream.manifest"});
    }
    std::error_code ec;
    const auto size = std::filesystem::file_size(dir / e.file, ec);
    if (ec) {
      return std::unexpected(error{error_code::not_found, "part missing: " + e.file, "stream.manifest"});
    }
    if (size != e.bytes) {
      return std::unexpected(error{error_code::data_integrity,
          "part size mismatch: " + e.file + " expected=" + std::to_string(e.bytes) + " actual=" + std::to_string(size),
          "stream.manifest"});
    }
  }
  return m;
}

} // namespace partpipe::stream
