// Example: print property changes pushed by a light.
#include "yeelight/yeelight.h"

#include <iostream>

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <address>" << std::endl;
    return 2;
  }

  yeelight::Config config;
  yeelight::Error error;
  auto session = yeelight::Session::Connect(argv[1], 0, config, &error);
  if (!session) {
    std::cerr << "Failed to connect: " << error.ToString() << std::endl;
    return 1;
  }

  auto stream = session->Subscribe();
  std::cout << "Listening to " << session->RemoteAddress()
            << ". Change the light from another app." << std::endl;
  yeelight::Notification notification;
  while (stream.Next(&notification)) {
    std::cout << notification.method << ":";
    for (const auto& entry : notification.properties) {
      std::cout << " " << entry.first << "=" << entry.second;
    }
    std::cout << std::endl;
  }
  std::cout << "Connection closed (dropped " << stream.dropped() << ")" << std::endl;
  return 0;
}
