#include "partpipe/error.hpp"

namespace partpipe::core {

auto to_string(error_code code) -> const char* {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::out_of_memory: return "out_of_memory";
    case error_code::not_found: return "not_found";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::unsupported: return "unsupported";
  }
  return "unknown";
}

} // namespace partpipe::core
