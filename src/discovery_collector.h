#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>

#include "yeelight/discovery.h"

namespace yeelight {
namespace internal {

// Deduplicates replies by device id, keeping first-arrival order.
class DiscoveryCollector {
 public:
  DeviceEventType Add(const DiscoveredDevice& device);
  const std::vector<DiscoveredDevice>& devices() const { return devices_; }

 private:
  std::vector<DiscoveredDevice> devices_;
  std::unordered_map<uint64_t, size_t> index_;
};

}  // namespace internal
}  // namespace yeelight
