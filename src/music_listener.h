#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "yeelight/error.h"
#include "yeelight/transport.h"

namespace yeelight {
namespace internal {

// One-shot TCP listener for the device's music-mode connection.
class MusicListener {
 public:
  MusicListener() = default;
  ~MusicListener();

  MusicListener(const MusicListener&) = delete;
  MusicListener& operator=(const MusicListener&) = delete;

  bool Open(const std::string& bind_address, uint16_t port, Error* error);
  // Bound port (resolved when an ephemeral port was requested).
  uint16_t port() const { return port_; }
  // Wait for one inbound connection; kMusicModeTimeout when none arrives.
  std::unique_ptr<TcpTransport> Accept(std::chrono::milliseconds timeout,
                                       Error* error);
  void Close();

 private:
  int fd_ = -1;
  uint16_t port_ = 0;
};

}  // namespace internal
}  // namespace yeelight
