// Example: toggle a light and print its power state.
#include "yeelight/yeelight.h"

#include <cstdlib>
#include <iostream>

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <address> [port]" << std::endl;
    return 2;
  }
  const uint16_t port = argc > 2 ? static_cast<uint16_t>(std::atoi(argv[2])) : 0;

  yeelight::Config config;
  yeelight::Error error;
  auto session = yeelight::Session::Connect(argv[1], port, config, &error);
  if (!session) {
    std::cerr << "Failed to connect: " << error.ToString() << std::endl;
    return 1;
  }

  const auto toggled = session->Toggle();
  if (!toggled.ok()) {
    std::cerr << "toggle failed: " << toggled.error.ToString() << std::endl;
    return 1;
  }

  const auto props = session->GetProp({yeelight::Property::kPower,
                                       yeelight::Property::kBright,
                                       yeelight::Property::kColorTemperature});
  if (!props.ok()) {
    std::cerr << "get_prop failed: " << props.error.ToString() << std::endl;
    return 1;
  }
  std::cout << "power=" << props.values[0] << " bright=" << props.values[1]
            << " ct=" << props.values[2] << std::endl;
  return 0;
}
