#pragma once

#include <string>
#include <utility>

namespace p33k::engine {

// engine error codes for structured results
enum class error_code {
  ok,
  invalid_argument,
  invalid_state,
  process_not_found,
  read_fault,
  window_not_found,
  corrupt_structure,
  decode_error,
  cache_miss,
  not_found,
  io_error,
  parse_error,
  unsupported
};

const char* error_code_name(error_code code) noexcept;

// status holds an error code and a human-readable message
struct status {
  error_code code = error_code::ok;
  std::string message;

  bool ok() const noexcept { return code == error_code::ok; }
};

inline status ok_status() { return {}; }

inline status make_status(error_code code, std::string message) { return status{code, std::move(message)}; }

// result carries a value and a status; value is default-initialized on errors
template <typename T> struct result {
  T value{};
  status status_info{};

  bool ok() const noexcept { return status_info.ok(); }
  error_code code() const noexcept { return status_info.code; }
};

template <typename T> inline result<T> ok_result(T value) { return result<T>{std::move(value), ok_status()}; }

template <typename T> inline result<T> error_result(error_code code, std::string message) {
  return result<T>{T{}, make_status(code, std::move(message))};
}

template <typename T> inline result<T> error_result(const status& from) { return result<T>{T{}, from}; }

} // namespace p33k::engine
