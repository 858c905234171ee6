#include "music_listener.h"

#include <cerrno>
#include <cstring>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace yeelight {
namespace internal {
namespace {

std::string ErrnoMessage(const char* what) {
  return std::string(what) + " failed: " + std::strerror(errno);
}

}  // namespace

MusicListener::~MusicListener() { Close(); }

bool MusicListener::Open(const std::string& bind_address, uint16_t port,
                         Error* error) {
  Close();
  fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd_ < 0) {
    SetError(error, ErrorCode::kSocketError, ErrnoMessage("socket()"));
    return false;
  }
  int reuse = 1;
  if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    SetError(error, ErrorCode::kSocketError, ErrnoMessage("setsockopt(SO_REUSEADDR)"));
    Close();
    return false;
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (bind_address.empty() || bind_address == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (inet_pton(AF_INET, bind_address.c_str(), &addr.sin_addr) != 1) {
    SetError(error, ErrorCode::kInvalidConfig,
             "music_bind_address must be a valid IPv4 address");
    Close();
    return false;
  }
  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::ostringstream oss;
    oss << "bind(" << bind_address << ":" << port << ") failed: "
        << std::strerror(errno);
    SetError(error, ErrorCode::kSocketError, oss.str());
    Close();
    return false;
  }
  if (::listen(fd_, 1) < 0) {
    SetError(error, ErrorCode::kSocketError, ErrnoMessage("listen()"));
    Close();
    return false;
  }

  sockaddr_in bound{};
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) < 0) {
    SetError(error, ErrorCode::kSocketError, ErrnoMessage("getsockname()"));
    Close();
    return false;
  }
  port_ = ntohs(bound.sin_port);
  return true;
}

std::unique_ptr<TcpTransport> MusicListener::Accept(std::chrono::milliseconds timeout,
                                                    Error* error) {
  if (fd_ < 0) {
    SetError(error, ErrorCode::kInvalidState, "music listener is not open");
    return nullptr;
  }
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      SetError(error, ErrorCode::kMusicModeTimeout,
               "device did not connect to the music listener");
      return nullptr;
    }
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      SetError(error, ErrorCode::kSocketError, ErrnoMessage("poll()"));
      return nullptr;
    }
    if (ready == 0) {
      continue;
    }
    const int client = ::accept(fd_, nullptr, nullptr);
    if (client < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) {
        continue;
      }
      SetError(error, ErrorCode::kSocketError, ErrnoMessage("accept()"));
      return nullptr;
    }
    return TcpTransport::Attach(client);
  }
}

void MusicListener::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

}  // namespace internal
}  // namespace yeelight
