#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace yeelight {

/**
 * Kind of state change inside a colour flow.
 */
enum class FlowMode : uint8_t {
  kColor = 1,
  kColorTemperature = 2,
  kSleep = 7,
};

/**
 * One timed state change of a flow expression.
 */
struct FlowTuple {
  /// Time the change takes (sleep length for kSleep).
  std::chrono::milliseconds duration{0};
  FlowMode mode = FlowMode::kColor;
  /// RGB value for kColor, kelvin for kColorTemperature, ignored by kSleep.
  uint32_t value = 0;
  /// Brightness percentage 1-100, or -1 to keep the previous value.
  int8_t brightness = -1;

  static FlowTuple Rgb(std::chrono::milliseconds duration, uint32_t rgb,
                       int8_t brightness);
  static FlowTuple Ct(std::chrono::milliseconds duration, uint32_t kelvin,
                      int8_t brightness);
  static FlowTuple Sleep(std::chrono::milliseconds duration);

  /// "duration,mode,value,brightness".
  std::string ToString() const;
};

/**
 * Ordered animation sent as a single comma-joined parameter.
 */
struct FlowExpression {
  std::vector<FlowTuple> tuples;

  std::string ToString() const;
};

/**
 * Parse "duration,mode,value,brightness,..." text into a flow expression.
 * Modes may be numeric (1, 2, 7) or named (color, ct, sleep).
 *
 * @return false if the text is empty, the field count is not a multiple of
 *         four, or a field fails to parse.
 */
bool ParseFlowExpression(const std::string& text, FlowExpression* out,
                         std::string* error = nullptr);

}  // namespace yeelight
