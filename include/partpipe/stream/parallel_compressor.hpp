#pragma once

/** \file parallel_compressor.hpp
 *  \brief Chunked parallel compression with in-order, bounded-memory output.
 *
 * The input stream is cut into chunks of exactly chunk_bytes (the last one may
 * be shorter). Each chunk is encoded into an independent frame on the worker
 * pool; frames are written to the downstream sink in chunk order. At most
 * `threshold()` chunks are in flight: before submitting past that bound the
 * caller's thread drains the oldest result into the sink.
 *
 * Thread-safety: write()/close() must be called from a single thread.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include "partpipe/codec/codec.hpp"
#include "partpipe/error.hpp"
#include "partpipe/stream/byte_sink.hpp"
#include "partpipe/stream/pending_results.hpp"
#include "partpipe/stream/worker_pool.hpp"

namespace partpipe::stream {

/** Encodes chunk `seq` into one frame. Called concurrently from pool threads. */
using ChunkEncoder = std::function<ChunkResult(std::uint64_t seq, std::span<const std::uint8_t> raw)>;

struct CompressorOptions {
  codec::codec_kind codec{codec::codec_kind::gzip};
  int level{1};
  std::size_t chunk_bytes{2u * 1024u * 1024u};
  std::size_t workers{0};            /**< 0 = available parallelism */
  std::size_t pending_threshold{0};  /**< 0 = 2 x workers */
  ChunkEncoder encoder;              /**< replaces the codec when set */
};

struct CompressorStats {
  std::uint64_t chunks_submitted{};
  std::uint64_t chunks_drained{};
  std::uint64_t bytes_in{};
  std::uint64_t bytes_out{};
  std::size_t max_pending{};
};

class OrderedParallelCompressor final : public ByteSink {
public:
  /** `sink` must outlive the compressor. */
  static auto create(ByteSink& sink, CompressorOptions opts)
      -> std::expected<std::unique_ptr<OrderedParallelCompressor>, core::error>;

  ~OrderedParallelCompressor() override;
  OrderedParallelCompressor(const OrderedParallelCompressor&) = delete;
  OrderedParallelCompressor& operator=(const OrderedParallelCompressor&) = delete;

  auto write(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error> override;

  /** Flush the partial chunk, drain everything, stop the pool, close the sink. */
  auto close() -> std::expected<void, core::error> override;

  const CompressorStats& stats() const noexcept { return stats_; }
  [[nodiscard]] bool failed() const noexcept { return failure_.has_value(); }
  [[nodiscard]] std::size_t threshold() const noexcept { return threshold_; }
  [[nodiscard]] std::size_t workers() const noexcept { return pool_->num_threads(); }

private:
  OrderedParallelCompressor(ByteSink& sink, CompressorOptions opts, std::size_t workers, std::size_t threshold);

  auto submit(std::vector<std::uint8_t> chunk) -> std::expected<void, core::error>;
  auto drain_one() -> std::expected<void, core::error>;
  auto fail(core::error e) -> std::unexpected<core::error>;

  ByteSink& sink_;
  CompressorOptions opts_;
  std::size_t threshold_;
  std::vector<std::uint8_t> buffer_;
  PendingResults pending_;
  std::unique_ptr<WorkerPool> pool_;  // declared after pending_: workers stop before it goes away
  CompressorStats stats_{};
  std::optional<core::error> failure_;
  bool closed_{false};
};

} // namespace partpipe::stream
