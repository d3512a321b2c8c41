#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling.
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <string>
#include <partpipe/expected_polyfill.hpp>

namespace partpipe::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  config_invalid = 2001,
  data_integrity = 3001,
  precondition_failed = 4001,
  out_of_memory = 5002,
  not_found = 6001,
  internal = 9001,
  invalid_argument = 9002,
  unsupported = 9005,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "stream.sink" */
};

/** \brief Short stable name for an error code ("io_failed", ...). */
auto to_string(error_code code) -> const char*;

} // namespace partpipe::core
