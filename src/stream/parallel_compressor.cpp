#include "partpipe/stream/parallel_compressor.hpp"
#include "partpipe/core/platform_utils.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <new>
#include <string>

namespace partpipe::stream {

auto OrderedParallelCompressor::create(ByteSink& sink, CompressorOptions opts)
    -> std::expected<std::unique_ptr<OrderedParallelCompressor>, core::error> {
  using core::error; using core::error_code;
  if (opts.chunk_bytes == 0) {
    return std::unexpected(error{error_code::config_invalid, "chunk_bytes must be > 0", "stream.compressor"});
  }
  if (!opts.encoder) {
    if (!codec::is_available(opts.codec)) {
      return std::unexpected(error{error_code::unsupported,
          std::string("codec not available: ") + codec::codec_name(opts.codec), "stream.compressor"});
    }
    const auto [lo, hi] = codec::level_range(opts.codec);
    if (opts.level < lo || opts.level > hi) {
      return std::unexpected(error{error_code::config_invalid,
          "level out of range [" + std::to_string(lo) + ", " + std::to_string(hi) + "]", "stream.compressor"});
    }
    const auto kind = opts.codec; const int level = opts.level;
    opts.encoder = [kind, level](std::uint64_t, std::span<const std::uint8_t> raw) -> ChunkResult {
      return codec::compress_frame(kind, level, raw);
    };
  }
  const std::size_t workers = opts.workers != 0 ? opts.workers : core::hardware_workers();
  const std::size_t threshold = opts.pending_threshold != 0 ? opts.pending_threshold : 2 * workers;
  return std::unique_ptr<OrderedParallelCompressor>(
      new OrderedParallelCompressor(sink, std::move(opts), workers, threshold));
}

OrderedParallelCompressor::OrderedParallelCompressor(ByteSink& sink, CompressorOptions opts,
                                                     std::size_t workers, std::size_t threshold)
    : sink_(sink), opts_(std::move(opts)), threshold_(threshold), pending_(threshold),
      pool_(std::make_unique<WorkerPool>(workers)) {
  buffer_.reserve(opts_.chunk_bytes);
  if (core::debug_enabled()) {
    std::cerr << "[PARTPIPE][compressor] workers=" << workers << " threshold=" << threshold_
              << " chunk_bytes=" << opts_.chunk_bytes << std::endl;
  }
}

OrderedParallelCompressor::~OrderedParallelCompressor() {
  pool_->cancel_queued();
  pool_->shutdown();
}

auto OrderedParallelCompressor::fail(core::error e) -> std::unexpected<core::error> {
  if (!failure_) {
    failure_ = e;
    pool_->cancel_queued();
    pending_.clear();
    pool_->shutdown();
    if (core::debug_enabled()) {
      std::cerr << "[PARTPIPE][compressor] aborted after " << stats_.chunks_drained
                << " chunks: " << failure_->component << ": " << failure_->message << std::endl;
    }
  }
  return std::unexpected(*failure_);
}

auto OrderedParallelCompressor::drain_one() -> std::expected<void, core::error> {
  auto r = pending_.pop_front();
  if (!r) return fail(r.error());
  if (auto w = sink_.write(std::span<const std::uint8_t>(r->data(), r->size())); !w) {
    return fail(w.error());
  }
  stats_.bytes_out += r->size();
  stats_.chunks_drained++;
  return {};
}

auto OrderedParallelCompressor::submit(std::vector<std::uint8_t> chunk) -> std::expected<void, core::error> {
  while (pending_.full()) {
    if (auto r = drain_one(); !r) return r;
  }
  const auto seq = pending_.push_back();
  stats_.chunks_submitted++;
  stats_.bytes_in += chunk.size();
  stats_.max_pending = std::max(stats_.max_pending, pending_.size());

  auto task = [this, seq, data = std::move(chunk)]() {
    ChunkResult result;
    try {
      result = opts_.encoder(seq, std::span<const std::uint8_t>(data.data(), data.size()));
    } catch (const std::bad_alloc&) {
      result = std::unexpected(core::error{core::error_code::out_of_memory,
          "out of memory encoding chunk " + std::to_string(seq), "stream.compressor"});
    } catch (const std::exception& ex) {
      result = std::unexpected(core::error{core::error_code::internal,
          "chunk " + std::to_string(seq) + ": " + ex.what(), "stream.compressor"});
    } catch (...) {
      result = std::unexpected(core::error{core::error_code::internal,
          "chunk " + std::to_string(seq) + ": unknown exception", "stream.compressor"});
    }
    pending_.complete(seq, std::move(result));
  };
  try {
    pool_->post(std::move(task));
  } catch (const std::exception& ex) {
    return fail(core::error{core::error_code::internal, ex.what(), "stream.compressor"});
  }
  return {};
}

auto OrderedParallelCompressor::write(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error> {
  if (failure_) return std::unexpected(*failure_);
  if (closed_) {
    return std::unexpected(core::error{core::error_code::precondition_failed, "write after close", "stream.compressor"});
  }
  while (!bytes.empty()) {
    const std::size_t take = std::min(opts_.chunk_bytes - buffer_.size(), bytes.size());
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(take));
    bytes = bytes.subspan(take);
    if (buffer_.size() == opts_.chunk_bytes) {
      std::vector<std::uint8_t> chunk;
      chunk.reserve(opts_.chunk_bytes);
      chunk.swap(buffer_);
      if (auto r = submit(std::move(chunk)); !r) return r;
    }
  }
  return {};
}

auto OrderedParallelCompressor::close() -> std::expected<void, core::error> {
  if (failure_) return std::unexpected(*failure_);
  if (closed_) return {};
  if (!buffer_.empty()) {
    if (auto r = submit(std::move(buffer_)); !r) return r;
    buffer_.clear();
  }
  while (!pending_.empty()) {
    if (auto r = drain_one(); !r) return r;
  }
  pool_->shutdown();
  closed_ = true;
  if (auto r = sink_.close(); !r) return fail(r.error());
  if (core::debug_enabled()) {
    std::cerr << "[PARTPIPE][compressor] closed chunks=" << stats_.chunks_drained
              << " in=" << stats_.bytes_in << " out=" << stats_.bytes_out << std::endl;
  }
  return {};
}

} // namespace partpipe::stream
