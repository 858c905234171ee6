#include "yeelight/transport.h"

#include <cerrno>
#include <cstring>
#include <sstream>
#include <utility>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace yeelight {
namespace {

// Frames are short JSON objects; anything longer without a delimiter is junk.
constexpr size_t kMaxFrameLength = 64 * 1024;
constexpr size_t kReadChunkSize = 4096;

std::string ErrnoMessage(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

bool SetNonBlocking(int fd, bool enabled) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  const int updated = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  return ::fcntl(fd, F_SETFL, updated) == 0;
}

// Resolve an IPv4 address or host name.
bool ResolveIpv4(const std::string& address, uint16_t port, sockaddr_in* out,
                 std::string* error) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) == 1) {
    *out = addr;
    return true;
  }
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* result = nullptr;
  const int rc = ::getaddrinfo(address.c_str(), nullptr, &hints, &result);
  if (rc != 0 || result == nullptr) {
    *error = "cannot resolve " + address + ": " + ::gai_strerror(rc);
    return false;
  }
  addr.sin_addr = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
  ::freeaddrinfo(result);
  *out = addr;
  return true;
}

std::string PeerAddress(int fd) {
  sockaddr_storage storage{};
  socklen_t len = sizeof(storage);
  if (::getpeername(fd, reinterpret_cast<sockaddr*>(&storage), &len) != 0 ||
      storage.ss_family != AF_INET) {
    return {};
  }
  const auto* addr = reinterpret_cast<const sockaddr_in*>(&storage);
  char buffer[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &addr->sin_addr, buffer, sizeof(buffer)) == nullptr) {
    return {};
  }
  std::ostringstream oss;
  oss << buffer << ":" << ntohs(addr->sin_port);
  return oss.str();
}

}  // namespace

std::unique_ptr<TcpTransport> TcpTransport::Connect(const std::string& address,
                                                    uint16_t port,
                                                    std::chrono::milliseconds timeout,
                                                    Error* error) {
  sockaddr_in addr{};
  std::string resolve_error;
  if (!ResolveIpv4(address, port, &addr, &resolve_error)) {
    SetError(error, ErrorCode::kConnectFailed, resolve_error);
    return nullptr;
  }

  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    SetError(error, ErrorCode::kSocketError, ErrnoMessage("socket() failed"));
    return nullptr;
  }
  if (!SetNonBlocking(fd, true)) {
    SetError(error, ErrorCode::kSocketError, ErrnoMessage("fcntl() failed"));
    ::close(fd);
    return nullptr;
  }

  std::ostringstream target;
  target << address << ":" << port;

  int rc = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  if (rc < 0 && errno != EINPROGRESS) {
    const int connect_errno = errno;
    const ErrorCode code = connect_errno == ECONNREFUSED ? ErrorCode::kConnectRefused
                                                         : ErrorCode::kConnectFailed;
    SetError(error, code,
             "connect(" + target.str() + ") failed: " + std::strerror(connect_errno));
    ::close(fd);
    return nullptr;
  }
  if (rc < 0) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLOUT;
    do {
      rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (rc < 0 && errno == EINTR);
    if (rc == 0) {
      SetError(error, ErrorCode::kConnectTimeout,
               "connect(" + target.str() + ") timed out after " +
                   std::to_string(timeout.count()) + " ms");
      ::close(fd);
      return nullptr;
    }
    if (rc < 0) {
      SetError(error, ErrorCode::kSocketError, ErrnoMessage("poll() failed"));
      ::close(fd);
      return nullptr;
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
      SetError(error, ErrorCode::kSocketError, ErrnoMessage("getsockopt() failed"));
      ::close(fd);
      return nullptr;
    }
    if (so_error != 0) {
      const ErrorCode code = so_error == ECONNREFUSED ? ErrorCode::kConnectRefused
                                                      : ErrorCode::kConnectFailed;
      SetError(error, code,
               "connect(" + target.str() + ") failed: " + std::strerror(so_error));
      ::close(fd);
      return nullptr;
    }
  }
  if (!SetNonBlocking(fd, false)) {
    SetError(error, ErrorCode::kSocketError, ErrnoMessage("fcntl() failed"));
    ::close(fd);
    return nullptr;
  }
  return Attach(fd);
}

std::unique_ptr<TcpTransport> TcpTransport::Attach(int fd) {
  if (fd < 0) {
    return nullptr;
  }
  return std::unique_ptr<TcpTransport>(new TcpTransport(fd));
}

TcpTransport::TcpTransport(int fd) : fd_(fd), remote_address_(PeerAddress(fd)) {}

TcpTransport::~TcpTransport() {
  Close();
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

bool TcpTransport::WriteFrame(const std::string& frame, Error* error) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (closed_) {
    SetError(error, ErrorCode::kWriteError, "transport closed");
    return false;
  }
  size_t written = 0;
  while (written < frame.size()) {
    const ssize_t rc = ::send(fd_, frame.data() + written, frame.size() - written,
                              MSG_NOSIGNAL);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      SetError(error, ErrorCode::kWriteError, ErrnoMessage("send() failed"));
      return false;
    }
    written += static_cast<size_t>(rc);
  }
  return true;
}

bool TcpTransport::ReadFrame(std::string* frame) {
  char chunk[kReadChunkSize];
  while (true) {
    const size_t newline = read_buffer_.find('\n');
    if (newline != std::string::npos) {
      std::string line = read_buffer_.substr(0, newline);
      read_buffer_.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (line.empty()) {
        continue;
      }
      if (frame) {
        *frame = std::move(line);
      }
      return true;
    }
    if (read_buffer_.size() > kMaxFrameLength) {
      return false;
    }
    if (closed_) {
      return false;
    }
    const ssize_t rc = ::recv(fd_, chunk, sizeof(chunk), 0);
    if (rc == 0) {
      return false;
    }
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    read_buffer_.append(chunk, static_cast<size_t>(rc));
  }
}

void TcpTransport::Close() {
  if (closed_.exchange(true)) {
    return;
  }
  if (fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
  }
}

std::string TcpTransport::RemoteAddress() const { return remote_address_; }

}  // namespace yeelight
