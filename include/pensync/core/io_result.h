#ifndef PENSYNC_CORE_IO_RESULT_H
#define PENSYNC_CORE_IO_RESULT_H

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <string>

#include "pensync/core/compat.h"

namespace pensync {

// System error type for I/O operations
struct SystemError {
  int error_code;
  std::string message;

  SystemError(int code, const std::string& msg)
      : error_code(code), message(msg) {}
};

// Unified I/O result type using optional for consistency
template <typename T>
struct IoResult {
  optional<T> value;                 // Value on success
  optional<SystemError> error_info;  // Error on failure

  bool ok() const { return value.has_value(); }
  explicit operator bool() const { return ok(); }

  T& operator*() { return *value; }
  const T& operator*() const { return *value; }
  T* operator->() { return &(*value); }
  const T* operator->() const { return &(*value); }

  static IoResult success(T val) {
    IoResult result;
    result.value = std::move(val);
    return result;
  }

  static IoResult error(int code, const std::string& msg = "") {
    IoResult result;
    result.error_info = SystemError(code, msg);
    return result;
  }

  static IoResult from_errno(int err) { return error(err, std::strerror(err)); }

  int error_code() const { return error_info ? error_info->error_code : 0; }

  std::string error_message() const {
    return error_info ? error_info->message : std::string();
  }
};

// Specialization for void-like results (using nullptr_t to avoid void in
// templates)
template <>
struct IoResult<std::nullptr_t> {
  optional<SystemError> error_info;

  bool ok() const { return !error_info.has_value(); }
  explicit operator bool() const { return ok(); }

  static IoResult success() { return IoResult(); }

  static IoResult error(int code, const std::string& msg = "") {
    IoResult result;
    result.error_info = SystemError(code, msg);
    return result;
  }

  static IoResult from_errno(int err) { return error(err, std::strerror(err)); }

  int error_code() const { return error_info ? error_info->error_code : 0; }

  std::string error_message() const {
    return error_info ? error_info->message : std::string();
  }
};

using IoVoidResult = IoResult<std::nullptr_t>;

// Carries the error of one result into another result type.
template <typename T, typename U>
IoResult<T> propagateError(const IoResult<U>& from) {
  IoResult<T> result;
  result.error_info = from.error_info;
  if (!result.error_info) {
    result.error_info = SystemError(EIO, "unknown error");
  }
  return result;
}

}  // namespace pensync

#endif  // PENSYNC_CORE_IO_RESULT_H
