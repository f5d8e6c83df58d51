#pragma once

#include <string>
#include <utility>

namespace gr4ft::engine {

// engine error codes for structured results
enum class error_code {
  ok,
  invalid_argument,
  io_error,
  detection_error,
  resolution_error,
  mutation_error,
  configuration_error,
  context_mismatch,
  unsupported
};

inline const char* error_code_name(error_code code) noexcept {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::invalid_argument:
    return "invalid_argument";
  case error_code::io_error:
    return "io_error";
  case error_code::detection_error:
    return "detection_error";
  case error_code::resolution_error:
    return "resolution_error";
  case error_code::mutation_error:
    return "mutation_error";
  case error_code::configuration_error:
    return "configuration_error";
  case error_code::context_mismatch:
    return "context_mismatch";
  case error_code::unsupported:
    return "unsupported";
  }
  return "unknown";
}

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
  engine::status status{};

  bool ok() const noexcept { return status.ok(); }
};

template <typename T> inline result<T> ok_result(T value) { return result<T>{std::move(value), ok_status()}; }

template <typename T> inline result<T> error_result(error_code code, std::string message) {
  return result<T>{T{}, make_status(code, std::move(message))};
}

template <typename T> inline result<T> error_result(status failure) { return result<T>{T{}, std::move(failure)}; }

} // namespace gr4ft::engine
