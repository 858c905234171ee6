#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "yeelight/error.h"

namespace yeelight {

/**
 * Well-known discovery multicast group and port.
 */
constexpr const char* kDiscoveryGroup = "239.255.255.250";
constexpr uint16_t kDiscoveryPort = 1982;

/**
 * Snapshot of a device that answered a discovery probe. Not a connection:
 * use Session::Connect(device, ...) to talk to it.
 */
struct DiscoveredDevice {
  /// Device identifier (the hexadecimal "id" header).
  uint64_t id = 0;
  /// Control address taken from the Location header, else the reply sender.
  std::string address;
  /// Control port taken from the Location header, else the default port.
  uint16_t port = 0;
  /// Every advertised "key: value" header, keys as sent.
  std::map<std::string, std::string> headers;
  /// Arrival time of the reply the metadata came from.
  std::chrono::steady_clock::time_point last_seen;

  /// Header value, if advertised.
  std::optional<std::string> Header(const std::string& key) const;
  /// Methods listed in the space-separated "support" header.
  std::vector<std::string> SupportedMethods() const;
  std::string model() const;
  std::string name() const;
};

enum class DeviceEventType {
  kSeen,
  kUpdated,
};

struct DeviceEvent {
  DeviceEventType type = DeviceEventType::kSeen;
  DiscoveredDevice device;
};

/**
 * Discovery probe configuration.
 */
struct DiscoveryConfig {
  using LogCallback = std::function<void(const std::string&)>;
  using DeviceEventCallback = std::function<void(const DeviceEvent&)>;

  /// Destination of the probe datagram.
  std::string multicast_address = kDiscoveryGroup;
  uint16_t port = kDiscoveryPort;
  /// Local bind address for the reply socket.
  std::string bind_address = "0.0.0.0";
  /// Local reply port (0 picks an ephemeral port).
  uint16_t local_port = 0;
  /// How long replies are collected.
  std::chrono::milliseconds window{2000};
  /// Multicast TTL for the probe.
  int multicast_ttl = 4;
  /// Optional callback invoked as devices are seen or updated.
  DeviceEventCallback event_callback;
  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

/**
 * Parse one discovery reply.
 *
 * @param reply Datagram text ("HTTP/1.1 200 OK" followed by header lines).
 * @param sender_address Sender IPv4 address, used when Location is missing.
 * @param out Parsed device.
 * @return false if the reply is malformed or lacks a valid id.
 */
bool ParseDiscoveryReply(const std::string& reply,
                         const std::string& sender_address,
                         DiscoveredDevice* out);

/// Probe payload sent to the discovery group.
std::string BuildDiscoveryProbe(const DiscoveryConfig& config);

/**
 * Send one probe and collect replies for the configured window.
 *
 * Devices are returned in first-arrival order; repeated replies from the
 * same id refresh that entry's metadata. No replies yields an empty result
 * with no error.
 *
 * @param error Set on socket or configuration failure.
 */
std::vector<DiscoveredDevice> Discover(const DiscoveryConfig& config,
                                       Error* error = nullptr);

}  // namespace yeelight
