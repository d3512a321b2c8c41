#include "partpipe/stream/pending_results.hpp"

namespace partpipe::stream {

auto PendingResults::push_back() -> std::uint64_t {
  std::lock_guard<std::mutex> lk(mu_);
  const auto seq = next_seq_++;
  slots_.push_back(Slot{seq, std::nullopt});
  return seq;
}

auto PendingResults::complete(std::uint64_t seq, ChunkResult result) -> void {
  bool head = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (slots_.empty() || seq < slots_.front().seq) return;
    const auto offset = static_cast<std::size_t>(seq - slots_.front().seq);
    if (offset >= slots_.size()) return;
    slots_[offset].result = std::move(result);
    head = (offset == 0);
  }
  if (head) cv_.notify_all();
}

auto PendingResults::pop_front() -> ChunkResult {
  std::unique_lock<std::mutex> lk(mu_);
  if (slots_.empty()) {
    return std::unexpected(core::error{core::error_code::precondition_failed,
        "pop_front on empty pending results", "stream.compressor"});
  }
  cv_.wait(lk, [this] { return slots_.front().result.has_value(); });
  auto out = std::move(*slots_.front().result);
  slots_.pop_front();
  return out;
}

auto PendingResults::clear() -> void {
  std::lock_guard<std::mutex> lk(mu_);
  slots_.clear();
}

auto PendingResults::size() const -> std::size_t {
  std::lock_guard<std::mutex> lk(mu_);
  return slots_.size();
}

} // namespace partpipe::stream
