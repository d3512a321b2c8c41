#include "partpipe/core/config.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <string>

#if defined(__linux__)
#include <sys/vfs.h>
#endif

namespace partpipe::core {

namespace {

constexpr std::string_view kComponent = "core.config";

auto invalid(std::string message) -> std::unexpected<error> {
  return std::unexpected(error{error_code::config_invalid, std::move(message), std::string(kComponent)});
}

auto trim(std::string_view s) -> std::string_view {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

auto parse_u64(std::string_view s, std::uint64_t& out) -> bool {
  const char* beg = s.data(); const char* end = beg + s.size();
  unsigned long long tmp = 0;
  auto [ptr, ec] = std::from_chars(beg, end, tmp, 10);
  if (ec != std::errc() || ptr != end || beg == end) return false;
  out = static_cast<std::uint64_t>(tmp);
  return true;
}

auto parse_int(std::string_view s, int& out) -> bool {
  const char* beg = s.data(); const char* end = beg + s.size();
  auto [ptr, ec] = std::from_chars(beg, end, out, 10);
  return ec == std::errc() && ptr == end && beg != end;
}

auto parse_double(std::string_view s, double& out) -> bool {
  const char* beg = s.data(); const char* end = beg + s.size();
  auto [ptr, ec] = std::from_chars(beg, end, out);
  return ec == std::errc() && ptr == end && beg != end && std::isfinite(out);
}

auto bad_value(std::string_view key, std::string_view value) -> std::unexpected<error> {
  return invalid("invalid " + std::string(key) + "=\"" + std::string(value) + "\"");
}

} // namespace

auto validate(const PipelineConfig& cfg) -> std::expected<void, error> {
  if (cfg.chunk_bytes == 0) return invalid("chunk_bytes must be > 0");
  if (cfg.workers == 0) return invalid("workers must be > 0");
  if (!codec::is_available(cfg.codec)) {
    return std::unexpected(error{error_code::unsupported,
        std::string("codec not available in this build: ") + codec::codec_name(cfg.codec), std::string(kComponent)});
  }
  const auto [lo, hi] = codec::level_range(cfg.codec);
  if (cfg.level < lo || cfg.level > hi) {
    return invalid("compression level " + std::to_string(cfg.level) + " outside [" +
                   std::to_string(lo) + ", " + std::to_string(hi) + "]");
  }
  return {};
}

auto apply_setting(std::string_view key, std::string_view value, PipelineConfig& cfg)
    -> std::expected<void, error> {
  key = trim(key); value = trim(value);
  std::uint64_t u = 0;
  if (key == "split_size_gb") {
    double gb = 0.0;
    if (!parse_double(value, gb) || gb < 0.0) return bad_value(key, value);
    const double bytes = gb * 1024.0 * 1024.0 * 1024.0;
    // 2^64 is exact as a double; anything at or above it does not fit in segment_bytes
    if (bytes >= 18446744073709551616.0) return bad_value(key, value);
    const auto rounded = static_cast<std::uint64_t>(bytes);
    if (rounded == 0 && gb > 0.0) return bad_value(key, value);
    cfg.segment_bytes = rounded;
  } else if (key == "segment_bytes") {
    if (!parse_u64(value, u)) return bad_value(key, value);
    cfg.segment_bytes = u;
  } else if (key == "chunk_bytes") {
    if (!parse_u64(value, u) || u == 0) return bad_value(key, value);
    cfg.chunk_bytes = static_cast<std::size_t>(u);
  } else if (key == "workers") {
    if (!parse_u64(value, u) || u == 0) return bad_value(key, value);
    cfg.workers = static_cast<std::size_t>(u);
  } else if (key == "compression_level" || key == "level") {
    int lvl = 0;
    if (!parse_int(value, lvl)) return bad_value(key, value);
    cfg.level = lvl;
  } else if (key == "pending_threshold") {
    if (!parse_u64(value, u)) return bad_value(key, value);
    cfg.pending_threshold = static_cast<std::size_t>(u);
  } else if (key == "codec") {
    auto kind = codec::parse_codec(value);
    if (!kind) return bad_value(key, value);
    cfg.codec = *kind;
  } else {
    return invalid("unknown setting \"" + std::string(key) + "\"");
  }
  return {};
}

auto apply_env(PipelineConfig& cfg) -> std::expected<void, error> {
  struct Binding { const char* var; std::string_view key; };
  static constexpr Binding kBindings[] = {
    {"PARTPIPE_SEGMENT_BYTES", "segment_bytes"},
    {"PARTPIPE_CHUNK_BYTES", "chunk_bytes"},
    {"PARTPIPE_WORKERS", "workers"},
    {"PARTPIPE_LEVEL", "compression_level"},
    {"PARTPIPE_PENDING", "pending_threshold"},
    {"PARTPIPE_CODEC", "codec"},
  };
  for (const auto& b : kBindings) {
    auto v = safe_getenv(b.var);
    if (!v || v->empty()) continue;
    if (auto r = apply_setting(b.key, *v, cfg); !r) {
      return std::unexpected(error{r.error().code, std::string(b.var) + ": " + r.error().message, r.error().component});
    }
  }
  return {};
}

auto load_config_file(const std::filesystem::path& path, PipelineConfig& cfg)
    -> std::expected<void, error> {
  std::ifstream in(path);
  if (!in.good()) {
    return std::unexpected(error{error_code::not_found, "config open failed: " + path.string(), std::string(kComponent)});
  }
  std::string line; std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string_view sv(line);
    if (auto hash = sv.find('#'); hash != std::string_view::npos) sv = sv.substr(0, hash);
    sv = trim(sv);
    if (sv.empty()) continue;
    auto eq = sv.find('=');
    if (eq == std::string_view::npos) {
      return invalid("config parse error at line " + std::to_string(line_no) + ": expected key = value");
    }
    std::string_view value = trim(sv.substr(eq + 1));
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
      value = value.substr(1, value.size() - 2);
    }
    if (auto r = apply_setting(sv.substr(0, eq), value, cfg); !r) {
      return invalid("config parse error at line " + std::to_string(line_no) + ": " + r.error().message);
    }
  }
  if (in.bad()) {
    return std::unexpected(error{error_code::io_failed, "config read failed: " + path.string(), std::string(kComponent)});
  }
  return {};
}

auto is_fat_filesystem(const std::filesystem::path& dir) noexcept -> bool {
#if defined(__linux__)
  constexpr long kMsdosMagic = 0x4d44;
  constexpr long kExfatMagic = 0x2011BAB0;
  struct statfs st{};
  if (::statfs(dir.c_str(), &st) != 0) return false;
  const auto type = static_cast<long>(st.f_type);
  return type == kMsdosMagic || type == kExfatMagic;
#else
  (void)dir;
  return false;
#endif
}

auto clamp_segment_bytes_for(const std::filesystem::path& dir, PipelineConfig& cfg) noexcept -> bool {
  if (cfg.segment_bytes == 0 || cfg.segment_bytes <= kFatSegmentLimit || !is_fat_filesystem(dir)) return false;
  cfg.segment_bytes = kFatSegmentLimit;
  return true;
}

} // namespace partpipe::core
