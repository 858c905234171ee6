#include "yeelight/flow.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace yeelight {
namespace {

constexpr size_t kFieldsPerTuple = 4;

bool Fail(const std::string& message, std::string* error) {
  if (error) {
    *error = message;
  }
  return false;
}

std::string Trim(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(begin, end - begin);
}

bool ParseInteger(const std::string& text, long long min, long long max,
                  long long* out) {
  if (text.empty()) {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  const long long value = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0') {
    return false;
  }
  if (value < min || value > max) {
    return false;
  }
  *out = value;
  return true;
}

bool ParseFlowMode(const std::string& text, FlowMode* out) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "1" || lower == "color") {
    *out = FlowMode::kColor;
    return true;
  }
  if (lower == "2" || lower == "ct") {
    *out = FlowMode::kColorTemperature;
    return true;
  }
  if (lower == "7" || lower == "sleep") {
    *out = FlowMode::kSleep;
    return true;
  }
  return false;
}

}  // namespace

FlowTuple FlowTuple::Rgb(std::chrono::milliseconds duration, uint32_t rgb,
                         int8_t brightness) {
  FlowTuple tuple;
  tuple.duration = duration;
  tuple.mode = FlowMode::kColor;
  tuple.value = rgb;
  tuple.brightness = brightness;
  return tuple;
}

FlowTuple FlowTuple::Ct(std::chrono::milliseconds duration, uint32_t kelvin,
                        int8_t brightness) {
  FlowTuple tuple;
  tuple.duration = duration;
  tuple.mode = FlowMode::kColorTemperature;
  tuple.value = kelvin;
  tuple.brightness = brightness;
  return tuple;
}

FlowTuple FlowTuple::Sleep(std::chrono::milliseconds duration) {
  FlowTuple tuple;
  tuple.duration = duration;
  tuple.mode = FlowMode::kSleep;
  tuple.value = 0;
  tuple.brightness = -1;
  return tuple;
}

std::string FlowTuple::ToString() const {
  std::ostringstream oss;
  oss << duration.count() << ',' << static_cast<int>(mode) << ',' << value
      << ',' << static_cast<int>(brightness);
  return oss.str();
}

std::string FlowExpression::ToString() const {
  std::string out;
  for (const auto& tuple : tuples) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out += tuple.ToString();
  }
  return out;
}

bool ParseFlowExpression(const std::string& text, FlowExpression* out,
                         std::string* error) {
  if (!out) {
    return Fail("no output expression", error);
  }
  std::vector<std::string> fields;
  std::stringstream ss(text);
  std::string field;
  while (std::getline(ss, field, ',')) {
    fields.push_back(Trim(field));
  }
  // getline drops the empty field after a trailing comma.
  if (!text.empty() && text.back() == ',') {
    return Fail("flow expression ends with an empty field", error);
  }
  if (fields.empty() || fields.size() % kFieldsPerTuple != 0) {
    return Fail("flow expression needs groups of duration,mode,value,brightness",
                error);
  }

  FlowExpression parsed;
  for (size_t i = 0; i < fields.size(); i += kFieldsPerTuple) {
    const size_t index = i / kFieldsPerTuple;
    long long duration = 0;
    long long value = 0;
    long long brightness = 0;
    FlowMode mode = FlowMode::kColor;
    if (!ParseInteger(fields[i], 0, 0xffffffffLL, &duration)) {
      return Fail("invalid duration in tuple " + std::to_string(index), error);
    }
    if (!ParseFlowMode(fields[i + 1], &mode)) {
      return Fail("invalid mode in tuple " + std::to_string(index) +
                      " (valid: 1/color, 2/ct, 7/sleep)",
                  error);
    }
    if (!ParseInteger(fields[i + 2], 0, 0xffffffffLL, &value)) {
      return Fail("invalid value in tuple " + std::to_string(index), error);
    }
    if (!ParseInteger(fields[i + 3], -1, 100, &brightness)) {
      return Fail("invalid brightness in tuple " + std::to_string(index), error);
    }
    FlowTuple tuple;
    tuple.duration = std::chrono::milliseconds(duration);
    tuple.mode = mode;
    tuple.value = static_cast<uint32_t>(value);
    tuple.brightness = static_cast<int8_t>(brightness);
    parsed.tuples.push_back(tuple);
  }
  *out = std::move(parsed);
  return true;
}

}  // namespace yeelight
