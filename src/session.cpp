#include "yeelight/session.h"
#include "yeelight/test_hooks.h"

#include "log.h"
#include "music_listener.h"

#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace yeelight {
namespace {

using Clock = RequestCorrelator::Clock;

Error ConnectionClosedError(const std::string& message) {
  Error error;
  error.code = ErrorCode::kConnectionClosed;
  error.message = message;
  return error;
}

// Frame text without its trailing delimiter, for trace output.
std::string StripDelimiter(const std::string& frame) {
  const std::string delimiter = kFrameDelimiter;
  if (frame.size() >= delimiter.size() &&
      frame.compare(frame.size() - delimiter.size(), delimiter.size(), delimiter) == 0) {
    return frame.substr(0, frame.size() - delimiter.size());
  }
  return frame;
}

}  // namespace

const char* ToString(MusicState state) {
  switch (state) {
    case MusicState::kNotStarted:
      return "not_started";
    case MusicState::kListenerOpen:
      return "listener_open";
    case MusicState::kAwaitingInbound:
      return "awaiting_inbound";
    case MusicState::kPromoted:
      return "promoted";
    case MusicState::kFailed:
      return "failed";
  }
  return "unknown";
}

bool Config::Validate(std::string* error) const {
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
  if (default_port == 0) {
    return fail("default_port must be non-zero");
  }
  if (connect_timeout.count() <= 0) {
    return fail("connect_timeout must be positive");
  }
  if (response_timeout.count() <= 0) {
    return fail("response_timeout must be positive");
  }
  if (music_accept_timeout.count() <= 0) {
    return fail("music_accept_timeout must be positive");
  }
  if (notification_queue_capacity == 0) {
    return fail("notification_queue_capacity must be positive");
  }
  if (!music_bind_address.empty() && music_bind_address != "0.0.0.0") {
    if (!is_valid_ipv4(music_bind_address)) {
      return fail("music_bind_address must be a valid IPv4 address");
    }
  }
  if (!music_host.empty() && !is_valid_ipv4(music_host)) {
    return fail("music_host must be a valid IPv4 address");
  }
  return true;
}

struct SessionMetricsAtomic {
  std::atomic<uint64_t> frames_received{0};
  std::atomic<uint64_t> frames_sent{0};
  std::atomic<uint64_t> parse_errors{0};
  std::atomic<uint64_t> send_errors{0};
  std::atomic<uint64_t> stale_responses{0};
  std::atomic<uint64_t> timeouts{0};
  std::atomic<uint64_t> notifications_dropped{0};
  std::atomic<uint64_t> callback_exceptions{0};

  SessionMetrics Snapshot() const {
    SessionMetrics snapshot;
    snapshot.frames_received = frames_received.load();
    snapshot.frames_sent = frames_sent.load();
    snapshot.parse_errors = parse_errors.load();
    snapshot.send_errors = send_errors.load();
    snapshot.stale_responses = stale_responses.load();
    snapshot.timeouts = timeouts.load();
    snapshot.notifications_dropped = notifications_dropped.load();
    snapshot.callback_exceptions = callback_exceptions.load();
    return snapshot;
  }
};

struct Session::Impl {
  Impl(std::unique_ptr<Transport> transport, Config config)
      : config_(std::move(config)),
        dispatcher_(config_.notification_queue_capacity),
        expect_responses_(config_.expect_responses) {
    std::string error;
    if (!config_.Validate(&error)) {
      config_error_ = error;
      Log("invalid config: " + error);
    }
    std::lock_guard<std::mutex> lock(transport_mutex_);
    if (!config_error_.empty()) {
      // Refuse to start; the transport is released unused.
      if (transport) {
        transport->Close();
      }
      running_ = false;
      dispatcher_.End();
    } else if (transport) {
      transport_ = std::shared_ptr<Transport>(std::move(transport));
      connected_ = true;
      reader_thread_ =
          std::thread(&Impl::ReaderLoop, this, transport_, generation_);
    } else {
      running_ = false;
      dispatcher_.End();
    }
    timer_thread_ = std::thread([this]() { TimerLoop(); });
  }

  ~Impl() {
    Close();
    if (closed_reader_thread_.joinable()) {
      closed_reader_thread_.join();
    }
    if (closed_callback_thread_.joinable()) {
      closed_callback_thread_.join();
    }
    // Started by a SetNotificationCallback after Close; its stream is
    // already finished.
    std::thread callback_thread;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      callback_thread = std::move(callback_thread_);
    }
    if (callback_thread.joinable()) {
      callback_thread.join();
    }
  }

  PendingCall SendAsync(const Command& command) {
    std::shared_ptr<Transport> transport;
    PendingCall call;
    bool registered = false;
    {
      std::lock_guard<std::mutex> lock(transport_mutex_);
      if (!connected_ || !transport_) {
        CommandResult result;
        if (!config_error_.empty()) {
          result.error.code = ErrorCode::kInvalidConfig;
          result.error.message = "invalid config: " + config_error_;
        } else {
          result.error = ConnectionClosedError("session is not connected");
        }
        return PendingCall::Ready(std::move(result));
      }
      transport = transport_;
      if (expect_responses_) {
        // Registered before the write so a fast reply always finds its slot.
        call = correlator_.Register(generation_, Clock::now() + config_.response_timeout);
        registered = true;
      }
    }

    uint64_t id = 0;
    if (registered) {
      id = call.id();
      WakeTimer();
    } else {
      id = correlator_.NextId();
    }

    const std::string frame = EncodeCommand(id, command);
    if (config_.trace_frames) {
      Log("send -> " + StripDelimiter(frame));
    }
    Error write_error;
    if (!transport->WriteFrame(frame, &write_error)) {
      metrics_.send_errors.fetch_add(1);
      Log("write of " + command.method + " failed: " + write_error.message);
      CommandResult result;
      result.id = id;
      result.error = write_error;
      if (!registered) {
        transport->Close();
        return PendingCall::Ready(std::move(result));
      }
      correlator_.Complete(std::move(result));
      transport->Close();
      return call;
    }
    metrics_.frames_sent.fetch_add(1);

    if (!registered) {
      CommandResult result;
      result.id = id;
      return PendingCall::Ready(std::move(result));
    }
    return call;
  }

  NotificationStream Subscribe() { return dispatcher_.Subscribe(); }

  void SetNotificationCallback(NotificationCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    notification_cb_ = std::move(cb);
    if (notification_cb_ && !callback_thread_.joinable()) {
      callback_thread_ = std::thread(&Impl::CallbackLoop, this, dispatcher_.Subscribe());
    }
  }

  void SetExpectResponses(bool expect) {
    std::lock_guard<std::mutex> lock(transport_mutex_);
    expect_responses_ = expect;
  }

  bool expect_responses() const {
    std::lock_guard<std::mutex> lock(transport_mutex_);
    return expect_responses_;
  }

  bool StartMusic(Error* error) {
    std::lock_guard<std::mutex> music_lock(music_mutex_);
    if (music_state_ == MusicState::kPromoted) {
      SetError(error, ErrorCode::kInvalidState, "music mode is already active");
      return false;
    }
    if (!IsConnected()) {
      SetError(error, ErrorCode::kConnectionClosed, "session is not connected");
      return false;
    }
    if (config_.music_host.empty()) {
      SetError(error, ErrorCode::kInvalidConfig,
               "music_host must be set to start music mode");
      return false;
    }

    internal::MusicListener listener;
    Error listen_error;
    if (!listener.Open(config_.music_bind_address, config_.music_port, &listen_error)) {
      return FailMusic(listen_error, error);
    }
    music_state_ = MusicState::kListenerOpen;

    const CommandResult result =
        SendAsync(command::SetMusic(MusicAction::kOn, config_.music_host, listener.port()))
            .Get();
    if (!result.ok()) {
      return FailMusic(result.error, error);
    }
    music_state_ = MusicState::kAwaitingInbound;

    Error accept_error;
    std::unique_ptr<TcpTransport> inbound =
        listener.Accept(config_.music_accept_timeout, &accept_error);
    listener.Close();
    if (!inbound) {
      return FailMusic(accept_error, error);
    }

    Error promote_error;
    if (!Promote(std::move(inbound), &promote_error)) {
      return FailMusic(promote_error, error);
    }
    music_state_ = MusicState::kPromoted;
    return true;
  }

  MusicState GetMusicState() const { return music_state_.load(); }

  bool IsConnected() const {
    std::lock_guard<std::mutex> lock(transport_mutex_);
    return connected_;
  }

  std::string RemoteAddress() const {
    std::lock_guard<std::mutex> lock(transport_mutex_);
    return transport_ ? transport_->RemoteAddress() : std::string();
  }

  size_t PendingRequestCount() const { return correlator_.pending_count(); }

  SessionMetrics GetMetrics() const { return metrics_.Snapshot(); }

  void Close() {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true)) {
      return;
    }
    std::shared_ptr<Transport> transport;
    std::thread reader;
    {
      std::lock_guard<std::mutex> lock(transport_mutex_);
      running_ = false;
      connected_ = false;
      transport = transport_;
      reader = std::move(reader_thread_);
    }
    if (transport) {
      transport->Close();
    }
    if (reader.joinable()) {
      if (reader.get_id() == std::this_thread::get_id()) {
        // Closed from a log callback on the reader; joined on destruction.
        closed_reader_thread_ = std::move(reader);
      } else {
        reader.join();
      }
    }
    correlator_.FailAll(ConnectionClosedError("session closed"));
    dispatcher_.End();

    std::thread callback_thread;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      callback_thread = std::move(callback_thread_);
    }
    if (callback_thread.joinable()) {
      if (callback_thread.get_id() == std::this_thread::get_id()) {
        // Closed from the notification callback; joined on destruction.
        closed_callback_thread_ = std::move(callback_thread);
      } else {
        callback_thread.join();
      }
    }
    StopTimer();
  }

  size_t ExpireRequests(Clock::time_point now) {
    const size_t expired = correlator_.ExpireBefore(now);
    if (expired > 0) {
      metrics_.timeouts.fetch_add(expired);
      std::ostringstream oss;
      oss << expired << " request(s) timed out after "
          << config_.response_timeout.count() << " ms";
      Log(oss.str());
    }
    return expired;
  }

  uint64_t TransportGeneration() const {
    std::lock_guard<std::mutex> lock(transport_mutex_);
    return generation_;
  }

 private:
  void Log(const std::string& message) const {
    internal::LogMessage(message, config_.log_callback);
  }

  void RecordCallbackException(const char* name, const std::string& what) {
    metrics_.callback_exceptions.fetch_add(1);
    Log(std::string("callback threw exception: ") + name + ": " + what);
  }

  bool FailMusic(const Error& cause, Error* error) {
    music_state_ = MusicState::kFailed;
    Log("music mode failed: " + cause.ToString());
    if (error) {
      *error = cause;
    }
    return false;
  }

  // Swap the inbound connection in as the active transport. The previous
  // transport is closed exactly once and its reader joined.
  bool Promote(std::unique_ptr<TcpTransport> inbound, Error* error) {
    std::shared_ptr<Transport> old_transport;
    std::thread old_reader;
    uint64_t old_generation = 0;
    std::string remote;
    {
      std::lock_guard<std::mutex> lock(transport_mutex_);
      if (!running_) {
        inbound->Close();
        SetError(error, ErrorCode::kConnectionClosed, "session closed during handoff");
        return false;
      }
      old_transport = transport_;
      old_generation = generation_;
      remote = inbound->RemoteAddress();
      transport_ = std::shared_ptr<Transport>(std::move(inbound));
      ++generation_;
      connected_ = true;
      // Devices do not answer commands on the music connection.
      expect_responses_ = false;
      old_reader = std::move(reader_thread_);
      reader_thread_ = std::thread(&Impl::ReaderLoop, this, transport_, generation_);
    }
    if (old_transport) {
      old_transport->Close();
    }
    if (old_reader.joinable()) {
      old_reader.join();
    }
    correlator_.FailGeneration(old_generation,
                               ConnectionClosedError("superseded by music connection"));
    Log("music mode active, device connected from " + remote);
    return true;
  }

  void ReaderLoop(std::shared_ptr<Transport> transport, uint64_t generation) {
    std::string line;
    while (transport->ReadFrame(&line)) {
      HandleFrame(line);
    }

    bool current = false;
    bool running = false;
    {
      std::lock_guard<std::mutex> lock(transport_mutex_);
      current = generation == generation_;
      running = running_;
      if (current) {
        connected_ = false;
      }
    }
    if (!current) {
      return;
    }
    if (running) {
      Log("connection to " + transport->RemoteAddress() + " closed");
    }
    correlator_.FailAll(ConnectionClosedError("connection closed"));
    dispatcher_.End();
  }

  void HandleFrame(const std::string& line) {
    metrics_.frames_received.fetch_add(1);
    if (config_.trace_frames) {
      Log("recv <- " + line);
    }

    Frame frame;
    std::string error;
    if (!DecodeFrame(line, &frame, &error)) {
      metrics_.parse_errors.fetch_add(1);
      Log("malformed frame (" + error + "): " + line);
      if (frame.id != 0) {
        CommandResult result;
        result.id = frame.id;
        result.error.code = ErrorCode::kMalformedFrame;
        result.error.message = error;
        correlator_.Complete(std::move(result));
      }
      return;
    }

    if (frame.type == FrameType::kResponse) {
      if (!correlator_.Complete(ToCommandResult(frame))) {
        metrics_.stale_responses.fetch_add(1);
        Log("discarding response for unknown id " + std::to_string(frame.id));
      }
      return;
    }
    HandleNotification(frame.notification);
  }

  // Never blocks: the callback is fed from its own bounded subscription.
  void HandleNotification(const Notification& notification) {
    const size_t drops = dispatcher_.Publish(notification);
    if (drops > 0) {
      metrics_.notifications_dropped.fetch_add(drops);
    }
  }

  void CallbackLoop(NotificationStream stream) {
    Notification notification;
    while (stream.Next(&notification)) {
      NotificationCallback cb_copy;
      {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb_copy = notification_cb_;
      }
      if (!cb_copy) {
        continue;
      }
      try {
        cb_copy(notification);
      } catch (const std::exception& ex) {
        RecordCallbackException("NotificationCallback", ex.what());
      } catch (...) {
        RecordCallbackException("NotificationCallback", "unknown exception");
      }
    }
  }

  void WakeTimer() {
    {
      std::lock_guard<std::mutex> lock(timer_mutex_);
      ++timer_epoch_;
    }
    timer_cv_.notify_all();
  }

  void StopTimer() {
    {
      std::lock_guard<std::mutex> lock(timer_mutex_);
      timer_stop_ = true;
    }
    timer_cv_.notify_all();
    if (timer_thread_.joinable()) {
      timer_thread_.join();
    }
  }

  void TimerLoop() {
    std::unique_lock<std::mutex> lock(timer_mutex_);
    while (!timer_stop_) {
      const uint64_t epoch = timer_epoch_;
      auto woken = [this, epoch]() { return timer_stop_ || timer_epoch_ != epoch; };
      const auto deadline = correlator_.NextDeadline();
      if (!deadline.has_value()) {
        timer_cv_.wait(lock, woken);
        continue;
      }
      if (timer_cv_.wait_until(lock, deadline.value(), woken)) {
        continue;
      }
      lock.unlock();
      ExpireRequests(Clock::now());
      lock.lock();
    }
  }

  Config config_;
  std::string config_error_;
  RequestCorrelator correlator_;
  NotificationDispatcher dispatcher_;
  SessionMetricsAtomic metrics_;

  mutable std::mutex transport_mutex_;
  std::shared_ptr<Transport> transport_;
  uint64_t generation_ = 0;
  bool connected_ = false;
  bool running_ = true;
  bool expect_responses_ = true;
  std::thread reader_thread_;
  std::thread closed_reader_thread_;
  std::atomic<bool> closed_{false};

  std::mutex music_mutex_;
  std::atomic<MusicState> music_state_{MusicState::kNotStarted};

  std::mutex callback_mutex_;
  NotificationCallback notification_cb_;
  std::thread callback_thread_;
  std::thread closed_callback_thread_;

  std::mutex timer_mutex_;
  std::condition_variable timer_cv_;
  uint64_t timer_epoch_ = 0;
  bool timer_stop_ = false;
  std::thread timer_thread_;
};

std::unique_ptr<Session> Session::Connect(const std::string& address, uint16_t port,
                                          Config config, Error* error) {
  std::string message;
  if (!config.Validate(&message)) {
    SetError(error, ErrorCode::kInvalidConfig, message);
    internal::LogMessage("invalid config: " + message, config.log_callback);
    return nullptr;
  }
  if (port == 0) {
    port = config.default_port;
  }
  Error connect_error;
  std::unique_ptr<TcpTransport> transport =
      TcpTransport::Connect(address, port, config.connect_timeout, &connect_error);
  if (!transport) {
    internal::LogMessage(connect_error.ToString(), config.log_callback);
    if (error) {
      *error = connect_error;
    }
    return nullptr;
  }
  return std::make_unique<Session>(std::move(transport), std::move(config));
}

std::unique_ptr<Session> Session::Connect(const DiscoveredDevice& device, Config config,
                                          Error* error) {
  return Connect(device.address, device.port, std::move(config), error);
}

Session::Session(std::unique_ptr<Transport> transport, Config config)
    : impl_(std::make_unique<Impl>(std::move(transport), std::move(config))) {}

Session::~Session() = default;

PendingCall Session::SendAsync(const Command& command) {
  return impl_->SendAsync(command);
}

CommandResult Session::Send(const Command& command) {
  PendingCall call = impl_->SendAsync(command);
  return call.Get();
}

NotificationStream Session::Subscribe() { return impl_->Subscribe(); }

void Session::SetNotificationCallback(NotificationCallback cb) {
  impl_->SetNotificationCallback(std::move(cb));
}

void Session::SetExpectResponses(bool expect) { impl_->SetExpectResponses(expect); }

bool Session::expect_responses() const { return impl_->expect_responses(); }

bool Session::StartMusic(Error* error) { return impl_->StartMusic(error); }

MusicState Session::GetMusicState() const { return impl_->GetMusicState(); }

bool Session::IsConnected() const { return impl_->IsConnected(); }

std::string Session::RemoteAddress() const { return impl_->RemoteAddress(); }

size_t Session::PendingRequestCount() const { return impl_->PendingRequestCount(); }

SessionMetrics Session::GetMetrics() const { return impl_->GetMetrics(); }

void Session::Close() { impl_->Close(); }

CommandResult Session::GetProp(const std::vector<Property>& properties) {
  return Send(command::GetProp(properties));
}

CommandResult Session::SetPower(Power power, Effect effect,
                                std::chrono::milliseconds duration, Mode mode,
                                Light light) {
  return Send(command::SetPower(light, power, effect, duration, mode));
}

CommandResult Session::On(Light light) { return Send(command::On(light)); }

CommandResult Session::Off(Light light) { return Send(command::Off(light)); }

CommandResult Session::Toggle(Light light) { return Send(command::Toggle(light)); }

CommandResult Session::DevToggle() { return Send(command::DevToggle()); }

CommandResult Session::SetCtAbx(uint16_t kelvin, Effect effect,
                                std::chrono::milliseconds duration, Light light) {
  return Send(command::SetCtAbx(light, kelvin, effect, duration));
}

CommandResult Session::SetRgb(uint32_t rgb, Effect effect,
                              std::chrono::milliseconds duration, Light light) {
  return Send(command::SetRgb(light, rgb, effect, duration));
}

CommandResult Session::SetHsv(uint16_t hue, uint8_t sat, Effect effect,
                              std::chrono::milliseconds duration, Light light) {
  return Send(command::SetHsv(light, hue, sat, effect, duration));
}

CommandResult Session::SetBright(uint8_t brightness, Effect effect,
                                 std::chrono::milliseconds duration, Light light) {
  return Send(command::SetBright(light, brightness, effect, duration));
}

CommandResult Session::SetScene(SceneClass scene_class, uint64_t val1, uint64_t val2,
                                uint64_t val3, Light light) {
  return Send(command::SetScene(light, scene_class, val1, val2, val3));
}

CommandResult Session::StartCf(uint8_t count, CfAction action, const FlowExpression& flow,
                               Light light) {
  return Send(command::StartCf(light, count, action, flow));
}

CommandResult Session::StopCf(Light light) { return Send(command::StopCf(light)); }

CommandResult Session::SetAdjust(AdjustAction action, AdjustProp prop, Light light) {
  return Send(command::SetAdjust(light, action, prop));
}

CommandResult Session::AdjustBright(int8_t percentage, std::chrono::milliseconds duration,
                                    Light light) {
  return Send(command::AdjustBright(light, percentage, duration));
}

CommandResult Session::AdjustCt(int8_t percentage, std::chrono::milliseconds duration,
                                Light light) {
  return Send(command::AdjustCt(light, percentage, duration));
}

CommandResult Session::AdjustColor(int8_t percentage, std::chrono::milliseconds duration,
                                   Light light) {
  return Send(command::AdjustColor(light, percentage, duration));
}

CommandResult Session::SetDefault(Light light) { return Send(command::SetDefault(light)); }

CommandResult Session::SetName(const std::string& name) {
  return Send(command::SetName(name));
}

CommandResult Session::CronAdd(CronType type, uint64_t minutes) {
  return Send(command::CronAdd(type, minutes));
}

CommandResult Session::CronDel(CronType type) { return Send(command::CronDel(type)); }

CommandResult Session::CronGet(CronType type) { return Send(command::CronGet(type)); }

#ifdef YEELIGHT_TESTING
namespace test {

size_t ExpireRequests(Session& session, std::chrono::steady_clock::time_point now) {
  return session.impl_->ExpireRequests(now);
}

uint64_t GetTransportGeneration(Session& session) {
  return session.impl_->TransportGeneration();
}

}  // namespace test
#endif

}  // namespace yeelight
