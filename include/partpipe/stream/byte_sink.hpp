#pragma once

/** \file byte_sink.hpp
 *  \brief Downstream byte consumer shared by the compressor and the segment writer.
 *
 * A sink is written by a single thread. close() ends the stream; writes after
 * close fail with precondition_failed.
 */

#include <cstdint>
#include <expected>
#include <span>

#include "partpipe/error.hpp"

namespace partpipe::stream {

class ByteSink {
public:
  virtual ~ByteSink() = default;

  virtual auto write(std::span<const std::uint8_t> bytes) -> std::expected<void, core::error> = 0;
  virtual auto close() -> std::expected<void, core::error> = 0;
};

} // namespace partpipe::stream
