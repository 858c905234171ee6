#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "yeelight/codec.h"
#include "yeelight/commands.h"
#include "yeelight/correlator.h"
#include "yeelight/discovery.h"
#include "yeelight/error.h"
#include "yeelight/flow.h"
#include "yeelight/notifications.h"
#include "yeelight/transport.h"

namespace yeelight {

class Session;

#ifdef YEELIGHT_TESTING
namespace test {
size_t ExpireRequests(Session& session, std::chrono::steady_clock::time_point now);
uint64_t GetTransportGeneration(Session& session);
}  // namespace test
#endif

/**
 * Counters for frame flow and error reporting.
 */
struct SessionMetrics {
  uint64_t frames_received = 0;
  uint64_t frames_sent = 0;
  uint64_t parse_errors = 0;
  uint64_t send_errors = 0;
  /// Responses whose id had no pending request (late, duplicate or unknown).
  uint64_t stale_responses = 0;
  uint64_t timeouts = 0;
  uint64_t notifications_dropped = 0;
  uint64_t callback_exceptions = 0;
};

/**
 * Progress of the music-mode handoff.
 */
enum class MusicState {
  kNotStarted,
  kListenerOpen,
  kAwaitingInbound,
  kPromoted,
  kFailed,
};

const char* ToString(MusicState state);

/**
 * Session configuration for connection, timing and music-mode behavior.
 */
struct Config {
  using LogCallback = std::function<void(const std::string&)>;

  /// Control port used when Connect() is given port 0.
  uint16_t default_port = kDefaultPort;
  /// Limit for establishing the control connection.
  std::chrono::milliseconds connect_timeout{5000};
  /// Per-command response deadline, measured from submission.
  std::chrono::milliseconds response_timeout{5000};
  /// If false, commands complete right after the write without a response.
  bool expect_responses = true;
  /// Buffered notifications per subscriber before the oldest is dropped.
  size_t notification_queue_capacity = 16;

  /// Address the device is told to connect back to in music mode.
  std::string music_host;
  /// Local bind address for the music-mode listener.
  std::string music_bind_address = "0.0.0.0";
  /// Music-mode listener port (0 picks an ephemeral port).
  uint16_t music_port = 0;
  /// How long to wait for the device's inbound music connection.
  std::chrono::milliseconds music_accept_timeout{5000};

  /// Log every frame sent and received.
  bool trace_frames = false;
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
 * One control connection to a device.
 *
 * Commands may be issued from any thread and pipelined; responses are
 * matched to their callers by id regardless of arrival order, while
 * notifications are routed to subscribers. A background reader thread owns
 * the read side of the transport and a timer thread enforces response
 * deadlines.
 */
class Session {
 public:
  using NotificationCallback = std::function<void(const Notification&)>;

  /**
   * Connect to a device and start the session.
   *
   * @param port Control port; 0 uses config.default_port.
   * @param error Connection or configuration failure.
   * @return nullptr on failure.
   */
  static std::unique_ptr<Session> Connect(const std::string& address, uint16_t port,
                                          Config config, Error* error = nullptr);
  /// Connect to a device found by discovery.
  static std::unique_ptr<Session> Connect(const DiscoveredDevice& device,
                                          Config config, Error* error = nullptr);

  /**
   * Start a session over an already established transport.
   *
   * An invalid config is logged and the session does not start: the
   * transport is closed and commands fail with kInvalidConfig.
   */
  Session(std::unique_ptr<Transport> transport, Config config);
  /// Close the transport and stop background threads.
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  /// Issue a command without waiting for it.
  PendingCall SendAsync(const Command& command);
  /// Issue a command and wait for its result.
  CommandResult Send(const Command& command);

  /// New notification subscription, independent of other subscribers.
  NotificationStream Subscribe();
  /**
   * Set callback invoked for each notification on a dedicated callback
   * thread. Notifications are buffered for it like for a subscription
   * (bounded, oldest dropped first), so a slow callback never delays
   * responses. The callback may call Send() and Close().
   */
  void SetNotificationCallback(NotificationCallback cb);

  /// Switch between awaiting responses and fire-and-forget commands.
  void SetExpectResponses(bool expect);
  bool expect_responses() const;

  /**
   * Move the session onto a device-initiated connection (music mode).
   *
   * Opens a listener, asks the device to connect to it, and promotes the
   * accepted connection to the active transport. On failure the original
   * connection stays in use.
   */
  bool StartMusic(Error* error = nullptr);
  MusicState GetMusicState() const;

  bool IsConnected() const;
  std::string RemoteAddress() const;
  size_t PendingRequestCount() const;
  /// Return metrics for frames, errors, and callbacks.
  SessionMetrics GetMetrics() const;

  /// Close the transport; pending requests fail with kConnectionClosed.
  void Close();

  // Typed commands. Each blocks until the command completes.
  CommandResult GetProp(const std::vector<Property>& properties);
  CommandResult SetPower(Power power, Effect effect = Effect::kSmooth,
                         std::chrono::milliseconds duration = std::chrono::milliseconds(500),
                         Mode mode = Mode::kNormal, Light light = Light::kMain);
  CommandResult On(Light light = Light::kMain);
  CommandResult Off(Light light = Light::kMain);
  CommandResult Toggle(Light light = Light::kMain);
  CommandResult DevToggle();
  CommandResult SetCtAbx(uint16_t kelvin, Effect effect, std::chrono::milliseconds duration,
                         Light light = Light::kMain);
  CommandResult SetRgb(uint32_t rgb, Effect effect, std::chrono::milliseconds duration,
                       Light light = Light::kMain);
  CommandResult SetHsv(uint16_t hue, uint8_t sat, Effect effect,
                       std::chrono::milliseconds duration, Light light = Light::kMain);
  CommandResult SetBright(uint8_t brightness, Effect effect,
                          std::chrono::milliseconds duration, Light light = Light::kMain);
  CommandResult SetScene(SceneClass scene_class, uint64_t val1, uint64_t val2 = 0,
                         uint64_t val3 = 0, Light light = Light::kMain);
  CommandResult StartCf(uint8_t count, CfAction action, const FlowExpression& flow,
                        Light light = Light::kMain);
  CommandResult StopCf(Light light = Light::kMain);
  CommandResult SetAdjust(AdjustAction action, AdjustProp prop, Light light = Light::kMain);
  CommandResult AdjustBright(int8_t percentage, std::chrono::milliseconds duration,
                             Light light = Light::kMain);
  CommandResult AdjustCt(int8_t percentage, std::chrono::milliseconds duration,
                         Light light = Light::kMain);
  CommandResult AdjustColor(int8_t percentage, std::chrono::milliseconds duration,
                            Light light = Light::kMain);
  CommandResult SetDefault(Light light = Light::kMain);
  CommandResult SetName(const std::string& name);
  CommandResult CronAdd(CronType type, uint64_t minutes);
  CommandResult CronDel(CronType type);
  CommandResult CronGet(CronType type);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef YEELIGHT_TESTING
  friend size_t test::ExpireRequests(Session& session,
                                     std::chrono::steady_clock::time_point now);
  friend uint64_t test::GetTransportGeneration(Session& session);
#endif
};

}  // namespace yeelight
