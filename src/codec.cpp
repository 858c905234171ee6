#include "yeelight/codec.h"

#include <utility>

namespace yeelight {
namespace {

using json = nlohmann::json;

bool Fail(const std::string& message, std::string* error) {
  if (error) {
    *error = message;
  }
  return false;
}

// Notification values are documented as strings; keep other scalars readable.
std::string PropertyValueToString(const json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return value.dump();
}

bool DecodeResponse(const json& doc, Frame* out, std::string* error) {
  const json& id = doc.at("id");
  if (!id.is_number_unsigned()) {
    return Fail("response id must be a non-negative integer", error);
  }
  out->type = FrameType::kResponse;
  out->id = id.get<uint64_t>();

  auto result = doc.find("result");
  if (result != doc.end()) {
    if (!result->is_array()) {
      return Fail("response result must be an array", error);
    }
    out->is_error = false;
    out->result.assign(result->begin(), result->end());
    return true;
  }

  auto details = doc.find("error");
  if (details != doc.end()) {
    if (!details->is_object()) {
      return Fail("response error must be an object", error);
    }
    auto code = details->find("code");
    auto message = details->find("message");
    if (code == details->end() || !code->is_number_integer() ||
        message == details->end() || !message->is_string()) {
      return Fail("response error requires integer code and string message", error);
    }
    out->is_error = true;
    out->error_code = code->get<int>();
    out->error_message = message->get<std::string>();
    return true;
  }
  return Fail("response carries neither result nor error", error);
}

bool DecodeNotification(const json& doc, Frame* out, std::string* error) {
  auto method = doc.find("method");
  auto params = doc.find("params");
  if (method == doc.end() || !method->is_string() ||
      params == doc.end() || !params->is_object()) {
    return Fail("frame is neither a response nor a notification", error);
  }
  out->type = FrameType::kNotification;
  out->notification.method = method->get<std::string>();
  for (auto it = params->begin(); it != params->end(); ++it) {
    out->notification.properties[it.key()] = PropertyValueToString(it.value());
  }
  return true;
}

}  // namespace

std::string EncodeCommand(uint64_t id, const Command& command) {
  json frame = json::object();
  frame["id"] = id;
  frame["method"] = command.method;
  frame["params"] = json::array();
  for (const auto& param : command.params) {
    frame["params"].push_back(param);
  }
  return frame.dump() + kFrameDelimiter;
}

bool DecodeFrame(const std::string& line, Frame* out, std::string* error) {
  if (!out) {
    return Fail("no output frame", error);
  }
  *out = Frame{};
  const json doc = json::parse(line, nullptr, false);
  if (doc.is_discarded()) {
    return Fail("invalid JSON", error);
  }
  if (!doc.is_object()) {
    return Fail("frame is not a JSON object", error);
  }
  if (doc.contains("id")) {
    if (!DecodeResponse(doc, out, error)) {
      out->type = FrameType::kResponse;
      return false;
    }
    return true;
  }
  return DecodeNotification(doc, out, error);
}

CommandResult ToCommandResult(const Frame& frame) {
  CommandResult result;
  result.id = frame.id;
  if (frame.is_error) {
    result.error.code = ErrorCode::kDeviceError;
    result.error.device_code = frame.error_code;
    result.error.message = frame.error_message;
    return result;
  }
  result.values = frame.result;
  return result;
}

}  // namespace yeelight
