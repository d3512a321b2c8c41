#include "stream_test_helpers.hpp"

#include <fstream>
#include <random>
#include <stdexcept>

namespace fs = std::filesystem;

namespace stream_test_helpers {

fs::path make_test_dir(const std::string& name) {
  auto base = fs::temp_directory_path() / "partpipe_tests";
  fs::create_directories(base);
  auto dir = base / name;
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir);
  return dir;
}

void cleanup_dir(const fs::path& dir) {
  std::error_code ec;
  fs::remove_all(dir, ec);
}

std::vector<std::uint8_t> make_bytes(std::size_t n, std::uint32_t seed, bool compressible) {
  std::vector<std::uint8_t> out(n);
  std::mt19937 rng(seed);
  if (compressible) {
    // short alphabet with runs
    std::uniform_int_distribution<int> sym(0, 7);
    std::uniform_int_distribution<int> run(1, 16);
    std::size_t i = 0;
    while (i < n) {
      const auto c = static_cast<std::uint8_t>('a' + sym(rng));
      for (int r = run(rng); r > 0 && i < n; --r) out[i++] = c;
    }
  } else {
    std::uniform_int_distribution<int> byte(0, 255);
    for (auto& b : out) b = static_cast<std::uint8_t>(byte(rng));
  }
  return out;
}

std::vector<std::uint8_t> read_file(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  if (!in) throw std::runtime_error("cannot open " + p.string());
  return std::vector<std::uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

void write_file(const fs::path& p, std::span<const std::uint8_t> bytes) {
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  if (!out) throw std::runtime_error("cannot create " + p.string());
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!out) throw std::runtime_error("write failed " + p.string());
}

std::vector<std::uint8_t> decode_all(partpipe::codec::codec_kind kind, std::span<const std::uint8_t> frames) {
  auto dec = partpipe::codec::FrameDecoder::create(kind);
  if (!dec) throw std::runtime_error(dec.error().message);
  std::vector<std::uint8_t> out;
  if (auto r = dec->feed(frames, out); !r) throw std::runtime_error(r.error().message);
  if (auto r = dec->finish(); !r) throw std::runtime_error(r.error().message);
  return out;
}

auto RecordingSink::write(std::span<const std::uint8_t> bytes) -> std::expected<void, partpipe::core::error> {
  using partpipe::core::error; using partpipe::core::error_code;
  if (closed) return std::unexpected(error{error_code::precondition_failed, "write after close", "test.sink"});
  if (fail_on_write && *fail_on_write == writes.size()) {
    return std::unexpected(error{error_code::io_failed, "injected write failure", "test.sink"});
  }
  writes.emplace_back(bytes.begin(), bytes.end());
  data.insert(data.end(), bytes.begin(), bytes.end());
  return {};
}

auto RecordingSink::close() -> std::expected<void, partpipe::core::error> {
  ++close_calls;
  if (fail_on_close) {
    return std::unexpected(partpipe::core::error{partpipe::core::error_code::io_failed, "injected close failure", "test.sink"});
  }
  closed = true;
  return {};
}

} // namespace stream_test_helpers
