#include "cachekit/error.hpp"

namespace cachekit {

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::KeyEmpty:
    return "key_empty";
  case ErrorCode::CacheMiss:
    return "cache_miss";
  case ErrorCode::InvalidConfig:
    return "invalid_config";
  case ErrorCode::Serialize:
    return "serialize";
  case ErrorCode::Deserialize:
    return "deserialize";
  case ErrorCode::Connection:
    return "connection";
  case ErrorCode::Protocol:
    return "protocol";
  case ErrorCode::LockAcquire:
    return "lock_acquire";
  case ErrorCode::LockNotHeld:
    return "lock_not_held";
  case ErrorCode::Canceled:
    return "canceled";
  case ErrorCode::DeadlineExceeded:
    return "deadline_exceeded";
  case ErrorCode::Unsupported:
    return "unsupported";
  case ErrorCode::ComputeFailed:
    return "compute_failed";
  }
  return "unknown";
}

const char *error_code_reason(ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "ok";
  case ErrorCode::KeyEmpty:
    return "key is empty";
  case ErrorCode::CacheMiss:
    return "cache miss";
  case ErrorCode::InvalidConfig:
    return "invalid config";
  case ErrorCode::Serialize:
    return "serialization failed";
  case ErrorCode::Deserialize:
    return "deserialization failed";
  case ErrorCode::Connection:
    return "connection failed";
  case ErrorCode::Protocol:
    return "protocol error";
  case ErrorCode::LockAcquire:
    return "lock acquisition failed";
  case ErrorCode::LockNotHeld:
    return "lock not held";
  case ErrorCode::Canceled:
    return "context canceled";
  case ErrorCode::DeadlineExceeded:
    return "context deadline exceeded";
  case ErrorCode::Unsupported:
    return "operation not supported";
  case ErrorCode::ComputeFailed:
    return "compute failed";
  }
  return "unknown error";
}

std::string Error::message() const {
  std::string out = op.empty() ? std::string("cache") : op;
  if (!key.empty())
    out += " [" + key + "]";
  out += ": ";
  out += error_code_reason(code);
  if (!detail.empty())
    out += ": " + detail;
  return out;
}

Error make_error(ErrorCode code, std::string_view op, const std::string &key,
                 std::string detail) {
  Error e;
  e.code = code;
  e.op = std::string(op);
  e.key = key;
  e.detail = std::move(detail);
  return e;
}

bool is_cache_miss(const Error &e) { return e.code == ErrorCode::CacheMiss; }

bool is_context_error(const Error &e) {
  return e.code == ErrorCode::Canceled ||
         e.code == ErrorCode::DeadlineExceeded;
}

bool is_connection_error(const Error &e) {
  return e.code == ErrorCode::Connection;
}

bool is_lock_error(const Error &e) {
  return e.code == ErrorCode::LockAcquire ||
         e.code == ErrorCode::LockNotHeld;
}

bool is_serialization_error(const Error &e) {
  return e.code == ErrorCode::Serialize || e.code == ErrorCode::Deserialize;
}

bool is_retryable(const Error &e) {
  if (is_context_error(e) || is_cache_miss(e) || is_serialization_error(e))
    return false;
  return is_connection_error(e) || is_lock_error(e);
}

} // namespace cachekit
