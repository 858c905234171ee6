#include "yeelight/error.h"

#include <sstream>

namespace yeelight {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "Ok";
    case ErrorCode::kInvalidConfig:
      return "InvalidConfig";
    case ErrorCode::kConnectTimeout:
      return "ConnectTimeout";
    case ErrorCode::kConnectRefused:
      return "ConnectRefused";
    case ErrorCode::kConnectFailed:
      return "ConnectFailed";
    case ErrorCode::kSocketError:
      return "SocketError";
    case ErrorCode::kMalformedFrame:
      return "MalformedFrame";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kConnectionClosed:
      return "ConnectionClosed";
    case ErrorCode::kWriteError:
      return "WriteError";
    case ErrorCode::kDeviceError:
      return "DeviceError";
    case ErrorCode::kMusicModeTimeout:
      return "MusicModeTimeout";
    case ErrorCode::kInvalidState:
      return "InvalidState";
  }
  return "Unknown";
}

std::string Error::ToString() const {
  std::ostringstream oss;
  if (code == ErrorCode::kDeviceError) {
    oss << "device error " << device_code << ": " << message;
    return oss.str();
  }
  oss << ErrorCodeName(code);
  if (!message.empty()) {
    oss << ": " << message;
  }
  return oss.str();
}

void SetError(Error* out, ErrorCode code, const std::string& message) {
  if (!out) {
    return;
  }
  out->code = code;
  out->device_code = 0;
  out->message = message;
}

}  // namespace yeelight
