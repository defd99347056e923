#pragma once

#include <string>
#include <utility>

namespace bugfind::engine {

// engine error codes for structured results
enum class error_code {
  ok,
  invalid_pattern,
  invalid_landscape,
  pattern_not_set
};

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
};

template <typename T> inline result<T> ok_result(T value) { return result<T>{std::move(value), ok_status()}; }

template <typename T> inline result<T> error_result(error_code code, std::string message) {
  return result<T>{T{}, make_status(code, std::move(message))};
}

inline const char* error_code_name(error_code code) {
  switch (code) {
  case error_code::ok:
    return "ok";
  case error_code::invalid_pattern:
    return "invalid_pattern";
  case error_code::invalid_landscape:
    return "invalid_landscape";
  case error_code::pattern_not_set:
    return "pattern_not_set";
  }
  return "unknown";
}

} // namespace bugfind::engine
