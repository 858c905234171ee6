#pragma once

#include <functional>
#include <string>

namespace yeelight {
namespace internal {

using LogSink = std::function<void(const std::string&)>;

// Route a message to the configured sink, or stderr when none is set.
void LogMessage(const std::string& message, const LogSink& sink);

}  // namespace internal
}  // namespace yeelight
