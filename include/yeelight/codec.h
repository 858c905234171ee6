#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "yeelight/error.h"

namespace yeelight {

/**
 * A method call sent to the device. Parameters are any JSON value the wire
 * format accepts (strings, integers, or pre-serialized compound strings such
 * as a flow expression).
 */
struct Command {
  std::string method;
  std::vector<nlohmann::json> params;
};

/**
 * Unsolicited property change pushed by the device.
 */
struct Notification {
  /// Notification method (normally "props").
  std::string method;
  /// Property name to new value. Non-string values are kept in JSON text form.
  std::map<std::string, std::string> properties;
};

/**
 * Outcome of a command, delivered to the caller that issued it.
 */
struct CommandResult {
  /// Correlation id of the command (0 if no id was allocated).
  uint64_t id = 0;
  /// Result values in device order (empty on failure or without responses).
  std::vector<nlohmann::json> values;
  Error error;

  bool ok() const { return error.ok(); }
};

enum class FrameType {
  kResponse,
  kNotification,
};

/**
 * One decoded wire frame. Presence of "id" makes it a response.
 */
struct Frame {
  FrameType type = FrameType::kNotification;
  /// Response id (responses only).
  uint64_t id = 0;
  /// True when the response carries an "error" object.
  bool is_error = false;
  /// Success values (responses only).
  std::vector<nlohmann::json> result;
  /// Device error code and message (error responses only).
  int error_code = 0;
  std::string error_message;
  /// Decoded notification (notifications only).
  Notification notification;
};

/// Line delimiter appended to every outgoing frame.
constexpr const char* kFrameDelimiter = "\r\n";

/**
 * Serialize a command as {"id","method","params"} followed by the delimiter.
 */
std::string EncodeCommand(uint64_t id, const Command& command);

/**
 * Decode one frame (without its line delimiter).
 *
 * @param line Frame text.
 * @param out Decoded frame. On failure, out->id holds the frame id when one
 *            could be read, or 0.
 * @param error Optional description of the decode failure.
 * @return false if the text is not a response or notification shaped object.
 */
bool DecodeFrame(const std::string& line, Frame* out, std::string* error = nullptr);

/// Convert a decoded response frame into the result delivered to a caller.
CommandResult ToCommandResult(const Frame& frame);

}  // namespace yeelight
