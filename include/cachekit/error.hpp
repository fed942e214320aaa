#pragma once

#include <string>
#include <string_view>

namespace cachekit {

enum class ErrorCode {
  None,
  KeyEmpty,
  CacheMiss,
  InvalidConfig,
  Serialize,
  Deserialize,
  Connection,
  Protocol,
  LockAcquire,
  LockNotHeld,
  Canceled,
  DeadlineExceeded,
  Unsupported,
  ComputeFailed,
};

namespace op {
inline constexpr std::string_view kGet = "get";
inline constexpr std::string_view kSet = "set";
inline constexpr std::string_view kDelete = "delete";
inline constexpr std::string_view kExists = "exists";
inline constexpr std::string_view kClear = "clear";
inline constexpr std::string_view kLen = "len";
inline constexpr std::string_view kGetOrSet = "get_or_set";
inline constexpr std::string_view kGetOrSetLocked = "get_or_set_locked";
inline constexpr std::string_view kGetManyPipeline = "get_many_pipeline";
inline constexpr std::string_view kSetManyPipeline = "set_many_pipeline";
inline constexpr std::string_view kDeleteByPrefix = "delete_by_prefix";
inline constexpr std::string_view kPing = "ping";
inline constexpr std::string_view kLock = "lock";
inline constexpr std::string_view kUnlock = "unlock";
inline constexpr std::string_view kTryLock = "try_lock";
inline constexpr std::string_view kInit = "init";
} // namespace op

// An error annotated with the operation that produced it and, when
// available, the key involved.
struct Error {
  ErrorCode code{ErrorCode::None};
  std::string op;
  std::string key;
  std::string detail;

  bool ok() const { return code == ErrorCode::None; }
  std::string message() const;
};

const char *error_code_name(ErrorCode code);
const char *error_code_reason(ErrorCode code);

Error make_error(ErrorCode code, std::string_view op,
                 const std::string &key = {}, std::string detail = {});

bool is_cache_miss(const Error &e);
bool is_context_error(const Error &e);
bool is_connection_error(const Error &e);
bool is_lock_error(const Error &e);
bool is_serialization_error(const Error &e);
bool is_retryable(const Error &e);

} // namespace cachekit
