#include "result.hpp"

namespace p33k::engine {

const char* error_code_name(error_code code) noexcept {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::invalid_argument:
    return "invalid argument";
  case error_code::invalid_state:
    return "invalid state";
  case error_code::process_not_found:
    return "process not found";
  case error_code::read_fault:
    return "read fault";
  case error_code::window_not_found:
    return "window not found";
  case error_code::corrupt_structure:
    return "corrupt structure";
  case error_code::decode_error:
    return "decode error";
  case error_code::cache_miss:
    return "cache miss";
  case error_code::not_found:
    return "not found";
  case error_code::io_error:
    return "io error";
  case error_code::parse_error:
    return "parse error";
  case error_code::unsupported:
    return "unsupported";
  default:
    return "unknown error code";
  }
}

} // namespace p33k::engine
