#include "yeelight/discovery.h"
#include "yeelight/test_hooks.h"
#include "yeelight/transport.h"

#include "discovery_collector.h"
#include "log.h"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace yeelight {
namespace {

constexpr const char* kReplyStatusLine = "HTTP/1.1 200 OK";
constexpr size_t kMaxReplySize = 2048;

std::string TrimRight(const std::string& text) {
  size_t end = text.size();
  while (end > 0 && (text[end - 1] == '\r' || text[end - 1] == ' ' ||
                     text[end - 1] == '\t')) {
    --end;
  }
  return text.substr(0, end);
}

bool ParseHexId(const std::string& text, uint64_t* out) {
  std::string digits = text;
  if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
    digits = digits.substr(2);
  }
  if (digits.empty()) {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  const unsigned long long value = std::strtoull(digits.c_str(), &end, 16);
  if (errno != 0 || end == digits.c_str() || *end != '\0') {
    return false;
  }
  *out = static_cast<uint64_t>(value);
  return true;
}

// "yeelight://192.168.1.239:55443" -> host and port.
bool ParseLocation(const std::string& location, std::string* host, uint16_t* port) {
  std::string rest = location;
  const size_t scheme = rest.find("://");
  if (scheme != std::string::npos) {
    rest = rest.substr(scheme + 3);
  }
  const size_t colon = rest.rfind(':');
  if (colon == std::string::npos || colon == 0) {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  const std::string port_text = rest.substr(colon + 1);
  const unsigned long value = std::strtoul(port_text.c_str(), &end, 10);
  if (port_text.empty() || errno != 0 || *end != '\0' || value == 0 || value > 0xffff) {
    return false;
  }
  *host = rest.substr(0, colon);
  *port = static_cast<uint16_t>(value);
  return true;
}

sockaddr_in MakeSockaddr(const std::string& address, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (address.empty() || address == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  }
  return addr;
}

std::string AddrToString(const sockaddr_in& addr) {
  char buffer[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer)) != nullptr) {
    return buffer;
  }
  return {};
}

// Owns the reply socket for one scan.
class ProbeSocket {
 public:
  ProbeSocket() = default;
  ~ProbeSocket() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  ProbeSocket(const ProbeSocket&) = delete;
  ProbeSocket& operator=(const ProbeSocket&) = delete;

  bool Open(const DiscoveryConfig& config, std::string* error) {
    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) {
      *error = "socket() failed: " + std::string(std::strerror(errno));
      return false;
    }
    int reuse = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
      *error = "setsockopt(SO_REUSEADDR) failed: " + std::string(std::strerror(errno));
      return false;
    }
    const unsigned char ttl = static_cast<unsigned char>(config.multicast_ttl);
    if (::setsockopt(fd_, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
      *error = "setsockopt(IP_MULTICAST_TTL) failed: " + std::string(std::strerror(errno));
      return false;
    }
    sockaddr_in addr = MakeSockaddr(config.bind_address, config.local_port);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      std::ostringstream oss;
      oss << "bind(" << config.bind_address << ":" << config.local_port
          << ") failed: " << std::strerror(errno);
      *error = oss.str();
      return false;
    }
    return true;
  }

  bool SendProbe(const std::string& payload, const sockaddr_in& target,
                 std::string* error) {
    const ssize_t rc = ::sendto(fd_, payload.data(), payload.size(), 0,
                                reinterpret_cast<const sockaddr*>(&target),
                                sizeof(target));
    if (rc < 0) {
      *error = "sendto() failed: " + std::string(std::strerror(errno));
      return false;
    }
    if (static_cast<size_t>(rc) != payload.size()) {
      *error = "partial send of discovery probe";
      return false;
    }
    return true;
  }

  // Wait up to `timeout` for one datagram. Returns false on timeout.
  bool Receive(std::chrono::milliseconds timeout, std::string* data,
               std::string* sender, std::string* error) {
    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0) {
      if (errno != EINTR) {
        *error = "poll() failed: " + std::string(std::strerror(errno));
      }
      return false;
    }
    if (ready == 0) {
      return false;
    }
    std::array<char, kMaxReplySize> buffer{};
    sockaddr_in addr{};
    socklen_t addr_len = sizeof(addr);
    const ssize_t bytes = ::recvfrom(fd_, buffer.data(), buffer.size(), 0,
                                     reinterpret_cast<sockaddr*>(&addr), &addr_len);
    if (bytes < 0) {
      if (errno != EINTR && errno != EAGAIN) {
        *error = "recvfrom() failed: " + std::string(std::strerror(errno));
      }
      return false;
    }
    data->assign(buffer.data(), static_cast<size_t>(bytes));
    *sender = AddrToString(addr);
    return true;
  }

 private:
  int fd_ = -1;
};

}  // namespace

std::optional<std::string> DiscoveredDevice::Header(const std::string& key) const {
  auto it = headers.find(key);
  if (it == headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> DiscoveredDevice::SupportedMethods() const {
  std::vector<std::string> methods;
  auto support = Header("support");
  if (!support.has_value()) {
    return methods;
  }
  std::istringstream iss(support.value());
  std::string method;
  while (iss >> method) {
    methods.push_back(method);
  }
  return methods;
}

std::string DiscoveredDevice::model() const { return Header("model").value_or(""); }

std::string DiscoveredDevice::name() const { return Header("name").value_or(""); }

bool DiscoveryConfig::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  auto is_valid_ipv4 = [](const std::string& addr) {
    if (addr.empty()) {
      return false;
    }
    in_addr parsed{};
    return inet_pton(AF_INET, addr.c_str(), &parsed) == 1;
  };
  if (!is_valid_ipv4(multicast_address)) {
    return fail("multicast_address must be a valid IPv4 address");
  }
  if (port == 0) {
    return fail("port must be non-zero");
  }
  if (!bind_address.empty() && bind_address != "0.0.0.0" &&
      !is_valid_ipv4(bind_address)) {
    return fail("bind_address must be a valid IPv4 address");
  }
  if (window.count() <= 0) {
    return fail("window must be positive");
  }
  if (multicast_ttl < 1 || multicast_ttl > 255) {
    return fail("multicast_ttl must be within 1-255");
  }
  return true;
}

bool ParseDiscoveryReply(const std::string& reply,
                         const std::string& sender_address,
                         DiscoveredDevice* out) {
  if (!out) {
    return false;
  }
  std::istringstream iss(reply);
  std::string line;
  if (!std::getline(iss, line) || TrimRight(line) != kReplyStatusLine) {
    return false;
  }

  DiscoveredDevice device;
  while (std::getline(iss, line)) {
    line = TrimRight(line);
    const size_t separator = line.find(": ");
    if (separator == std::string::npos) {
      continue;
    }
    device.headers[line.substr(0, separator)] = line.substr(separator + 2);
  }

  auto id = device.headers.find("id");
  if (id == device.headers.end() || !ParseHexId(id->second, &device.id)) {
    return false;
  }

  auto location = device.headers.find("Location");
  if (location == device.headers.end() ||
      !ParseLocation(location->second, &device.address, &device.port)) {
    device.address = sender_address;
    device.port = kDefaultPort;
  }
  device.last_seen = std::chrono::steady_clock::now();
  *out = std::move(device);
  return true;
}

std::string BuildDiscoveryProbe(const DiscoveryConfig& config) {
  std::ostringstream oss;
  oss << "M-SEARCH * HTTP/1.1\r\n"
      << "HOST: " << config.multicast_address << ":" << config.port << "\r\n"
      << "MAN: \"ssdp:discover\"\r\n"
      << "ST: wifi_bulb\r\n";
  return oss.str();
}

namespace internal {

DeviceEventType DiscoveryCollector::Add(const DiscoveredDevice& device) {
  auto it = index_.find(device.id);
  if (it == index_.end()) {
    index_[device.id] = devices_.size();
    devices_.push_back(device);
    return DeviceEventType::kSeen;
  }
  devices_[it->second] = device;
  return DeviceEventType::kUpdated;
}

}  // namespace internal

std::vector<DiscoveredDevice> Discover(const DiscoveryConfig& config, Error* error) {
  std::string message;
  if (!config.Validate(&message)) {
    SetError(error, ErrorCode::kInvalidConfig, message);
    internal::LogMessage(message, config.log_callback);
    return {};
  }

  ProbeSocket socket;
  if (!socket.Open(config, &message)) {
    SetError(error, ErrorCode::kSocketError, message);
    internal::LogMessage(message, config.log_callback);
    return {};
  }
  const auto target = MakeSockaddr(config.multicast_address, config.port);
  if (!socket.SendProbe(BuildDiscoveryProbe(config), target, &message)) {
    SetError(error, ErrorCode::kSocketError, message);
    internal::LogMessage(message, config.log_callback);
    return {};
  }

  internal::DiscoveryCollector collector;
  const auto deadline = std::chrono::steady_clock::now() + config.window;
  while (true) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      break;
    }
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) +
        std::chrono::milliseconds(1);
    std::string data;
    std::string sender;
    std::string receive_error;
    if (!socket.Receive(remaining, &data, &sender, &receive_error)) {
      if (!receive_error.empty()) {
        SetError(error, ErrorCode::kSocketError, receive_error);
        internal::LogMessage(receive_error, config.log_callback);
        break;
      }
      continue;
    }
    DiscoveredDevice device;
    if (!ParseDiscoveryReply(data, sender, &device)) {
      internal::LogMessage("skipping malformed discovery reply from " + sender,
                           config.log_callback);
      continue;
    }
    const DeviceEventType type = collector.Add(device);
    if (config.event_callback) {
      try {
        config.event_callback({type, device});
      } catch (const std::exception& ex) {
        internal::LogMessage(std::string("discovery callback threw exception: ") +
                                 ex.what(),
                             config.log_callback);
      } catch (...) {
        internal::LogMessage("discovery callback threw unknown exception",
                             config.log_callback);
      }
    }
  }
  return collector.devices();
}

#ifdef YEELIGHT_TESTING
namespace test {

std::vector<DiscoveredDevice> CollectDiscoveryReplies(
    const std::vector<std::pair<std::string, std::string>>& replies,
    std::vector<DeviceEvent>* events) {
  internal::DiscoveryCollector collector;
  for (const auto& reply : replies) {
    DiscoveredDevice device;
    if (!ParseDiscoveryReply(reply.first, reply.second, &device)) {
      continue;
    }
    const DeviceEventType type = collector.Add(device);
    if (events) {
      events->push_back({type, device});
    }
  }
  return collector.devices();
}

}  // namespace test
#endif

}  // namespace yeelight
