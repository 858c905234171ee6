#include "yeelight/commands.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace yeelight {
namespace {

using json = nlohmann::json;

struct PropertyName {
  Property property;
  const char* name;
};

constexpr PropertyName kPropertyNames[] = {
    {Property::kPower, "power"},
    {Property::kBright, "bright"},
    {Property::kColorTemperature, "ct"},
    {Property::kRgb, "rgb"},
    {Property::kHue, "hue"},
    {Property::kSat, "sat"},
    {Property::kColorMode, "color_mode"},
    {Property::kFlowing, "flowing"},
    {Property::kDelayOff, "delayoff"},
    {Property::kFlowParams, "flow_params"},
    {Property::kMusicOn, "music_on"},
    {Property::kName, "name"},
    {Property::kBgPower, "bg_power"},
    {Property::kBgFlowing, "bg_flowing"},
    {Property::kBgFlowParams, "bg_flow_params"},
    {Property::kBgColorTemperature, "bg_ct"},
    {Property::kBgColorMode, "bg_lmode"},
    {Property::kBgBright, "bg_bright"},
    {Property::kBgRgb, "bg_rgb"},
    {Property::kBgHue, "bg_hue"},
    {Property::kBgSat, "bg_sat"},
    {Property::kNightLightBright, "nl_br"},
    {Property::kActiveMode, "active_mode"},
};

std::string Lower(const std::string& text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower;
}

std::string MethodFor(Light light, const char* method) {
  if (light == Light::kBackground) {
    return std::string("bg_") + method;
  }
  return method;
}

Command Make(std::string method, std::vector<json> params = {}) {
  Command cmd;
  cmd.method = std::move(method);
  cmd.params = std::move(params);
  return cmd;
}

int64_t Millis(std::chrono::milliseconds duration) {
  return static_cast<int64_t>(duration.count());
}

}  // namespace

const char* ToString(Power power) {
  return power == Power::kOn ? "on" : "off";
}

const char* ToString(Effect effect) {
  return effect == Effect::kSmooth ? "smooth" : "sudden";
}

const char* ToString(AdjustAction action) {
  switch (action) {
    case AdjustAction::kIncrease:
      return "increase";
    case AdjustAction::kDecrease:
      return "decrease";
    case AdjustAction::kCircle:
      return "circle";
  }
  return "circle";
}

const char* ToString(AdjustProp prop) {
  switch (prop) {
    case AdjustProp::kBright:
      return "bright";
    case AdjustProp::kColorTemperature:
      return "ct";
    case AdjustProp::kColor:
      return "color";
  }
  return "bright";
}

const char* ToString(SceneClass scene_class) {
  switch (scene_class) {
    case SceneClass::kColor:
      return "color";
    case SceneClass::kHsv:
      return "hsv";
    case SceneClass::kColorTemperature:
      return "ct";
    case SceneClass::kColorFlow:
      return "cf";
    case SceneClass::kAutoDelayOff:
      return "auto_delay_off";
  }
  return "color";
}

const char* ToString(Property property) {
  for (const auto& entry : kPropertyNames) {
    if (entry.property == property) {
      return entry.name;
    }
  }
  return "";
}

bool ParseProperty(const std::string& text, Property* out) {
  const std::string lower = Lower(text);
  for (const auto& entry : kPropertyNames) {
    if (lower == entry.name) {
      if (out) {
        *out = entry.property;
      }
      return true;
    }
  }
  return false;
}

bool ParsePower(const std::string& text, Power* out) {
  const std::string lower = Lower(text);
  if (lower != "on" && lower != "off") {
    return false;
  }
  if (out) {
    *out = lower == "on" ? Power::kOn : Power::kOff;
  }
  return true;
}

bool ParseSceneClass(const std::string& text, SceneClass* out) {
  const std::string lower = Lower(text);
  for (SceneClass scene_class :
       {SceneClass::kColor, SceneClass::kHsv, SceneClass::kColorTemperature,
        SceneClass::kColorFlow, SceneClass::kAutoDelayOff}) {
    if (lower == ToString(scene_class)) {
      if (out) {
        *out = scene_class;
      }
      return true;
    }
  }
  return false;
}

bool ParseEffect(const std::string& text, Effect* out) {
  const std::string lower = Lower(text);
  if (lower != "smooth" && lower != "sudden") {
    return false;
  }
  if (out) {
    *out = lower == "smooth" ? Effect::kSmooth : Effect::kSudden;
  }
  return true;
}

bool ParseAdjustAction(const std::string& text, AdjustAction* out) {
  const std::string lower = Lower(text);
  AdjustAction action = AdjustAction::kIncrease;
  if (lower == "increase") {
    action = AdjustAction::kIncrease;
  } else if (lower == "decrease") {
    action = AdjustAction::kDecrease;
  } else if (lower == "circle") {
    action = AdjustAction::kCircle;
  } else {
    return false;
  }
  if (out) {
    *out = action;
  }
  return true;
}

bool ParseAdjustProp(const std::string& text, AdjustProp* out) {
  const std::string lower = Lower(text);
  AdjustProp prop = AdjustProp::kBright;
  if (lower == "bright") {
    prop = AdjustProp::kBright;
  } else if (lower == "ct") {
    prop = AdjustProp::kColorTemperature;
  } else if (lower == "color") {
    prop = AdjustProp::kColor;
  } else {
    return false;
  }
  if (out) {
    *out = prop;
  }
  return true;
}

const std::vector<Property>& AllProperties() {
  static const std::vector<Property> properties = [] {
    std::vector<Property> all;
    for (const auto& entry : kPropertyNames) {
      all.push_back(entry.property);
    }
    return all;
  }();
  return properties;
}

namespace command {

Command GetProp(const std::vector<Property>& properties) {
  std::vector<json> params;
  params.reserve(properties.size());
  for (Property property : properties) {
    params.emplace_back(ToString(property));
  }
  return Make("get_prop", std::move(params));
}

Command SetPower(Light light, Power power, Effect effect,
                 std::chrono::milliseconds duration, Mode mode) {
  return Make(MethodFor(light, "set_power"),
              {ToString(power), ToString(effect), Millis(duration),
               static_cast<int>(mode)});
}

Command On(Light light) {
  return SetPower(light, Power::kOn, Effect::kSudden,
                  std::chrono::milliseconds(0), Mode::kNormal);
}

Command Off(Light light) {
  return SetPower(light, Power::kOff, Effect::kSudden,
                  std::chrono::milliseconds(0), Mode::kNormal);
}

Command Toggle(Light light) { return Make(MethodFor(light, "toggle")); }

Command DevToggle() { return Make("dev_toggle"); }

Command SetCtAbx(Light light, uint16_t kelvin, Effect effect,
                 std::chrono::milliseconds duration) {
  return Make(MethodFor(light, "set_ct_abx"),
              {kelvin, ToString(effect), Millis(duration)});
}

Command SetRgb(Light light, uint32_t rgb, Effect effect,
               std::chrono::milliseconds duration) {
  return Make(MethodFor(light, "set_rgb"),
              {rgb, ToString(effect), Millis(duration)});
}

Command SetHsv(Light light, uint16_t hue, uint8_t sat, Effect effect,
               std::chrono::milliseconds duration) {
  return Make(MethodFor(light, "set_hsv"),
              {hue, sat, ToString(effect), Millis(duration)});
}

Command SetBright(Light light, uint8_t brightness, Effect effect,
                  std::chrono::milliseconds duration) {
  return Make(MethodFor(light, "set_bright"),
              {brightness, ToString(effect), Millis(duration)});
}

Command SetScene(Light light, SceneClass scene_class, uint64_t val1,
                 uint64_t val2, uint64_t val3) {
  return Make(MethodFor(light, "set_scene"),
              {ToString(scene_class), val1, val2, val3});
}

Command StartCf(Light light, uint8_t count, CfAction action,
                const FlowExpression& flow) {
  return Make(MethodFor(light, "start_cf"),
              {count, static_cast<int>(action), flow.ToString()});
}

Command StopCf(Light light) { return Make(MethodFor(light, "stop_cf")); }

Command SetAdjust(Light light, AdjustAction action, AdjustProp prop) {
  return Make(MethodFor(light, "set_adjust"), {ToString(action), ToString(prop)});
}

Command AdjustBright(Light light, int8_t percentage,
                     std::chrono::milliseconds duration) {
  return Make(MethodFor(light, "adjust_bright"),
              {static_cast<int>(percentage), Millis(duration)});
}

Command AdjustCt(Light light, int8_t percentage,
                 std::chrono::milliseconds duration) {
  return Make(MethodFor(light, "adjust_ct"),
              {static_cast<int>(percentage), Millis(duration)});
}

Command AdjustColor(Light light, int8_t percentage,
                    std::chrono::milliseconds duration) {
  return Make(MethodFor(light, "adjust_color"),
              {static_cast<int>(percentage), Millis(duration)});
}

Command SetDefault(Light light) { return Make(MethodFor(light, "set_default")); }

Command SetName(const std::string& name) { return Make("set_name", {name}); }

Command SetMusic(MusicAction action, const std::string& host, uint16_t port) {
  if (action == MusicAction::kOff) {
    return Make("set_music", {static_cast<int>(action)});
  }
  return Make("set_music", {static_cast<int>(action), host, port});
}

Command CronAdd(CronType type, uint64_t minutes) {
  return Make("cron_add", {static_cast<int>(type), minutes});
}

Command CronDel(CronType type) {
  return Make("cron_del", {static_cast<int>(type)});
}

Command CronGet(CronType type) {
  (void)type;
  return GetProp({Property::kDelayOff});
}

}  // namespace command

}  // namespace yeelight
