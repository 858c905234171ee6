#pragma once

#include <string>

namespace yeelight {

/**
 * Error categories reported by the connection engine.
 */
enum class ErrorCode {
  kOk,
  kInvalidConfig,
  kConnectTimeout,
  kConnectRefused,
  kConnectFailed,
  kSocketError,
  kMalformedFrame,
  kTimeout,
  kConnectionClosed,
  kWriteError,
  kDeviceError,
  kMusicModeTimeout,
  kInvalidState,
};

/// Stable name for an error code (e.g. "ConnectTimeout").
const char* ErrorCodeName(ErrorCode code);

/**
 * Error value filled by fallible operations.
 */
struct Error {
  ErrorCode code = ErrorCode::kOk;
  /// Numeric code returned by the device (kDeviceError only).
  int device_code = 0;
  /// Human readable detail; the device message verbatim for kDeviceError.
  std::string message;

  bool ok() const { return code == ErrorCode::kOk; }
  std::string ToString() const;
};

/// Store an error into an optional out-parameter.
void SetError(Error* out, ErrorCode code, const std::string& message);

}  // namespace yeelight
