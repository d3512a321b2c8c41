#include "partpipe/pipeline.hpp"
#include "partpipe/core/platform_utils.hpp"
#include "partpipe/stream/parallel_compressor.hpp"
#include "partpipe/stream/segmented_source.hpp"

#include <iostream>
#include <limits>
#include <span>

namespace partpipe::pipeline {

using core::error;
using core::error_code;

auto archive_file_name(const std::string& name, codec::codec_kind kind) -> std::string {
  return name + ".tar" + codec::file_extension(kind);
}

auto backup_stream(std::istream& in, const BackupOptions& opts)
    -> std::expected<BackupReport, error> {
  if (opts.name.empty()) {
    return std::unexpected(error{error_code::invalid_argument, "archive name is empty", "pipeline"});
  }
  auto cfg = opts.config;
  if (auto v = core::validate(cfg); !v) return std::unexpected(v.error());

  const bool single_file = cfg.segment_bytes == 0;
  const auto dir = opts.dir.empty() ? std::filesystem::path(".") : opts.dir;
  {
    std::error_code ec; std::filesystem::create_directories(dir, ec);
    if (ec) return std::unexpected(error{error_code::io_failed, "mkdir failed: " + ec.message(), "pipeline"});
  }
  if (!single_file && core::clamp_segment_bytes_for(dir, cfg)) {
    if (core::debug_enabled()) {
      std::cerr << "[PARTPIPE][pipeline] FAT filesystem detected, segment size reduced to "
                << cfg.segment_bytes << std::endl;
    }
  }

  stream::SegmentedSinkOptions so{};
  so.dir = dir;
  so.base_name = archive_file_name(opts.name, cfg.codec);
  so.segment_bytes = single_file ? std::numeric_limits<std::uint64_t>::max() : cfg.segment_bytes;
  so.collapse_single_segment = single_file || opts.collapse_single_segment;
  so.fsync_on_close = opts.fsync_segments;
  so.write_manifest = opts.write_manifest;
  so.on_segment_closed = opts.on_segment_closed;
  auto sink = stream::SegmentedSink::open(so);
  if (!sink) return std::unexpected(sink.error());

  stream::CompressorOptions co{};
  co.codec = cfg.codec;
  co.level = cfg.level;
  co.chunk_bytes = cfg.chunk_bytes;
  co.workers = cfg.workers;
  co.pending_threshold = cfg.resolved_pending_threshold();
  auto comp = stream::OrderedParallelCompressor::create(*sink, co);
  if (!comp) return std::unexpected(comp.error());

  std::vector<char> block(cfg.chunk_bytes);
  while (in) {
    in.read(block.data(), static_cast<std::streamsize>(block.size()));
    const auto got = static_cast<std::size_t>(in.gcount());
    if (got == 0) break;
    auto r = (*comp)->write(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(block.data()), got));
    if (!r) return std::unexpected(r.error());
  }
  if (in.bad()) {
    return std::unexpected(error{error_code::io_failed, "input stream read failed", "pipeline"});
  }
  if (auto r = (*comp)->close(); !r) return std::unexpected(r.error());

  BackupReport rep{};
  rep.parts = sink->closed_segments().size();
  rep.bytes_in = (*comp)->stats().bytes_in;
  rep.bytes_out = sink->bytes_written();
  rep.single_file = sink->single_segment();
  rep.segments = sink->closed_segments();
  if (core::debug_enabled()) {
    std::cerr << "[PARTPIPE][pipeline] backup parts=" << rep.parts << " in=" << rep.bytes_in
              << " out=" << rep.bytes_out << std::endl;
  }
  return rep;
}

auto restore_stream(const std::string& pattern, std::ostream& out, const RestoreOptions& opts)
    -> std::expected<RestoreReport, error> {
  if (opts.read_bytes == 0) {
    return std::unexpected(error{error_code::invalid_argument, "read_bytes must be > 0", "pipeline"});
  }
  stream::SegmentedSourceOptions so{};
  so.buffer_bytes = opts.buffer_bytes;
  auto src = stream::SegmentedSource::open(pattern, so);
  if (!src) return std::unexpected(src.error());

  RestoreReport rep{};
  rep.parts = src->segments().size();

  std::vector<std::uint8_t> in(opts.read_bytes);
  auto n = src->read_into(in);
  if (!n) return std::unexpected(n.error());
  if (*n == 0) return rep;

  codec::codec_kind kind{};
  if (opts.codec) {
    kind = *opts.codec;
  } else if (auto d = codec::detect_codec(std::span<const std::uint8_t>(in.data(), *n))) {
    kind = *d;
  } else {
    return std::unexpected(error{error_code::data_integrity, "unrecognized compressed stream", "pipeline"});
  }
  auto dec = codec::FrameDecoder::create(kind);
  if (!dec) return std::unexpected(dec.error());

  std::vector<std::uint8_t> decoded;
  while (*n > 0) {
    rep.bytes_in += *n;
    decoded.clear();
    if (auto r = dec->feed(std::span<const std::uint8_t>(in.data(), *n), decoded); !r) {
      return std::unexpected(r.error());
    }
    if (!decoded.empty()) {
      out.write(reinterpret_cast<const char*>(decoded.data()), static_cast<std::streamsize>(decoded.size()));
      if (!out.good()) {
        return std::unexpected(error{error_code::io_failed, "output stream write failed", "pipeline"});
      }
      rep.bytes_out += decoded.size();
    }
    n = src->read_into(in);
    if (!n) return std::unexpected(n.error());
  }
  if (auto r = dec->finish(); !r) return std::unexpected(r.error());
  out.flush();
  src->close();
  if (core::debug_enabled()) {
    std::cerr << "[PARTPIPE][pipeline] restore parts=" << rep.parts << " frames=" << dec->frames()
              << " out=" << rep.bytes_out << std::endl;
  }
  return rep;
}

} // namespace partpipe::pipeline
