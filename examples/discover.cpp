// Example: discover devices on the local network and list them.
#include "yeelight/yeelight.h"

#include <iomanip>
#include <iostream>

int main() {
  yeelight::DiscoveryConfig config;
  config.window = std::chrono::milliseconds(3000);
  config.event_callback = [](const yeelight::DeviceEvent& event) {
    const char* type =
        event.type == yeelight::DeviceEventType::kSeen ? "seen" : "updated";
    std::cout << "device " << type << ": 0x" << std::hex << event.device.id << std::dec
              << " at " << event.device.address << ":" << event.device.port << "\n";
  };

  std::cout << "Probing for 3s..." << std::endl;
  yeelight::Error error;
  const auto devices = yeelight::Discover(config, &error);
  if (!error.ok()) {
    std::cerr << "Discovery failed: " << error.ToString() << std::endl;
    return 1;
  }

  std::cout << "Discovered devices: " << devices.size() << std::endl;
  for (const auto& device : devices) {
    std::cout << " - 0x" << std::hex << std::setw(16) << std::setfill('0') << device.id
              << std::dec << std::setfill(' ') << " " << device.model() << " \""
              << device.name() << "\" " << device.address << ":" << device.port
              << " power=" << device.Header("power").value_or("?") << "\n";
    std::cout << "   supports:";
    for (const auto& method : device.SupportedMethods()) {
      std::cout << " " << method;
    }
    std::cout << std::endl;
  }
  return 0;
}
