// Example: switch a light to music mode and stream rapid colour changes.
#include "yeelight/yeelight.h"

#include <chrono>
#include <iostream>
#include <thread>

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "usage: " << argv[0] << " <address> <this host's address>" << std::endl;
    return 2;
  }

  yeelight::Config config;
  config.music_host = argv[2];
  yeelight::Error error;
  auto session = yeelight::Session::Connect(argv[1], 0, config, &error);
  if (!session) {
    std::cerr << "Failed to connect: " << error.ToString() << std::endl;
    return 1;
  }

  if (!session->StartMusic(&error)) {
    std::cerr << "Music mode failed (" << yeelight::ToString(session->GetMusicState())
              << "): " << error.ToString() << std::endl;
    return 1;
  }
  std::cout << "Music mode active via " << session->RemoteAddress() << std::endl;

  const uint32_t colors[] = {0xff0000, 0x00ff00, 0x0000ff};
  for (int i = 0; i < 60; ++i) {
    const auto result = session->SetRgb(colors[i % 3], yeelight::Effect::kSudden,
                                        std::chrono::milliseconds(0));
    if (!result.ok()) {
      std::cerr << "set_rgb failed: " << result.error.ToString() << std::endl;
      return 1;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  const auto metrics = session->GetMetrics();
  std::cout << "Sent " << metrics.frames_sent << " frames" << std::endl;
  return 0;
}
