#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "yeelight/codec.h"
#include "yeelight/flow.h"

namespace yeelight {

/// Target light on devices with a background (ambient) light.
enum class Light {
  kMain,
  kBackground,
};

enum class Power {
  kOn,
  kOff,
};

/// How a change is applied: immediately, or gradually over the duration.
enum class Effect {
  kSudden,
  kSmooth,
};

/// Mode the light switches to when powered on (kNormal keeps the current one).
enum class Mode : uint8_t {
  kNormal = 0,
  kColorTemperature = 1,
  kRgb = 2,
  kHsv = 3,
  kColorFlow = 4,
  kNightLight = 5,
};

/// Behaviour once a colour flow finishes.
enum class CfAction : uint8_t {
  kRecover = 0,
  kStay = 1,
  kOff = 2,
};

enum class AdjustAction {
  kIncrease,
  kDecrease,
  kCircle,
};

enum class AdjustProp {
  kBright,
  kColorTemperature,
  kColor,
};

enum class SceneClass {
  kColor,
  kHsv,
  kColorTemperature,
  kColorFlow,
  kAutoDelayOff,
};

enum class MusicAction : uint8_t {
  kOff = 0,
  kOn = 1,
};

enum class CronType : uint8_t {
  kPowerOff = 0,
};

/**
 * Readable device properties (get_prop).
 */
enum class Property {
  kPower,
  kBright,
  kColorTemperature,
  kRgb,
  kHue,
  kSat,
  kColorMode,
  kFlowing,
  kDelayOff,
  kFlowParams,
  kMusicOn,
  kName,
  kBgPower,
  kBgFlowing,
  kBgFlowParams,
  kBgColorTemperature,
  kBgColorMode,
  kBgBright,
  kBgRgb,
  kBgHue,
  kBgSat,
  kNightLightBright,
  kActiveMode,
};

/// Wire names ("on", "smooth", "increase", "ct", "color", "bright", ...).
const char* ToString(Power power);
const char* ToString(Effect effect);
const char* ToString(AdjustAction action);
const char* ToString(AdjustProp prop);
const char* ToString(SceneClass scene_class);
const char* ToString(Property property);

/// Case-insensitive parse of a wire name.
bool ParseProperty(const std::string& text, Property* out);
bool ParsePower(const std::string& text, Power* out);
bool ParseEffect(const std::string& text, Effect* out);
bool ParseSceneClass(const std::string& text, SceneClass* out);
bool ParseAdjustAction(const std::string& text, AdjustAction* out);
bool ParseAdjustProp(const std::string& text, AdjustProp* out);

/// All properties in declaration order.
const std::vector<Property>& AllProperties();

/**
 * Builders for protocol commands. Background variants prefix the method
 * with "bg_". Durations are sent in milliseconds.
 */
namespace command {

Command GetProp(const std::vector<Property>& properties);
Command SetPower(Light light, Power power, Effect effect,
                 std::chrono::milliseconds duration, Mode mode);
Command On(Light light);
Command Off(Light light);
Command Toggle(Light light);
Command DevToggle();
Command SetCtAbx(Light light, uint16_t kelvin, Effect effect,
                 std::chrono::milliseconds duration);
Command SetRgb(Light light, uint32_t rgb, Effect effect,
               std::chrono::milliseconds duration);
Command SetHsv(Light light, uint16_t hue, uint8_t sat, Effect effect,
               std::chrono::milliseconds duration);
Command SetBright(Light light, uint8_t brightness, Effect effect,
                  std::chrono::milliseconds duration);
Command SetScene(Light light, SceneClass scene_class, uint64_t val1,
                 uint64_t val2, uint64_t val3);
Command StartCf(Light light, uint8_t count, CfAction action,
                const FlowExpression& flow);
Command StopCf(Light light);
Command SetAdjust(Light light, AdjustAction action, AdjustProp prop);
Command AdjustBright(Light light, int8_t percentage,
                     std::chrono::milliseconds duration);
Command AdjustCt(Light light, int8_t percentage,
                 std::chrono::milliseconds duration);
Command AdjustColor(Light light, int8_t percentage,
                    std::chrono::milliseconds duration);
Command SetDefault(Light light);
Command SetName(const std::string& name);
Command SetMusic(MusicAction action, const std::string& host, uint16_t port);
Command CronAdd(CronType type, uint64_t minutes);
Command CronDel(CronType type);
/// cron_get replies with a dictionary; the delayoff property carries the same value.
Command CronGet(CronType type);

}  // namespace command

}  // namespace yeelight
