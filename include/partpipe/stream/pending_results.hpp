#pragma once

/** \file pending_results.hpp
 *  \brief FIFO of in-flight chunk results, completed out of order, consumed in order.
 *
 * The controller reserves a slot with push_back() before handing the chunk to
 * a worker; the worker fills it with complete(). pop_front() blocks until the
 * oldest slot is filled. Only the head can be removed, so results leave in
 * submission order regardless of completion order.
 */

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <mutex>
#include <optional>
#include <vector>

#include "partpipe/error.hpp"

namespace partpipe::stream {

using ChunkResult = std::expected<std::vector<std::uint8_t>, core::error>;

class PendingResults {
public:
  explicit PendingResults(std::size_t capacity) : capacity_(capacity) {}

  PendingResults(const PendingResults&) = delete;
  PendingResults& operator=(const PendingResults&) = delete;

  /** Reserve the next slot and return its sequence number. */
  auto push_back() -> std::uint64_t;

  /** Fill slot `seq`. Unknown sequence numbers are ignored (slot already discarded). */
  auto complete(std::uint64_t seq, ChunkResult result) -> void;

  /** Wait for the head slot to be filled, then remove and return it. */
  auto pop_front() -> ChunkResult;

  /** Remove every slot without waiting; late complete() calls become no-ops. */
  auto clear() -> void;

  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto empty() const -> bool { return size() == 0; }
  [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }
  /** True when one more push_back() would exceed capacity. */
  [[nodiscard]] auto full() const -> bool { return size() >= capacity_; }

private:
  struct Slot {
    std::uint64_t seq{};
    std::optional<ChunkResult> result;
  };

  std::size_t capacity_;
  std::uint64_t next_seq_{0};
  std::deque<Slot> slots_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
};

} // namespace partpipe::stream
