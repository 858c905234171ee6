#include "log.h"

#include <iostream>

namespace yeelight {
namespace internal {

void LogMessage(const std::string& message, const LogSink& sink) {
  if (sink) {
    sink(message);
    return;
  }
  std::cerr << "[yeelight] " << message << std::endl;
}

}  // namespace internal
}  // namespace yeelight
