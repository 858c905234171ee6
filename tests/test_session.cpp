// End-to-end session tests against a scripted device on a socketpair.
#include "yeelight/session.h"
#include "yeelight/test_hooks.h"

#include "test_util.h"

#include <gtest/gtest.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using std::chrono::milliseconds;
using yeelight::CommandResult;
using yeelight::ErrorCode;
using yeelight::testutil::FakeDevice;
using yeelight::testutil::LogCapture;
using yeelight::testutil::LoopbackListener;
using yeelight::testutil::WaitUntil;

namespace {

yeelight::Config QuietConfig(LogCapture* logs) {
  yeelight::Config config;
  config.log_callback = logs->Callback();
  return config;
}

// Transport whose writes always fail; reads block until closed.
class BrokenTransport : public yeelight::Transport {
 public:
  bool WriteFrame(const std::string&, yeelight::Error* error) override {
    yeelight::SetError(error, ErrorCode::kWriteError, "send() failed: Broken pipe");
    return false;
  }
  bool ReadFrame(std::string*) override {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return closed_; });
    return false;
  }
  void Close() override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }
  std::string RemoteAddress() const override { return "broken"; }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool closed_ = false;
};

}  // namespace

TEST(SessionTest, SendReceivesMatchingResponse) {
  LogCapture logs;
  FakeDevice device;
  yeelight::Session session(device.TakeTransport(), QuietConfig(&logs));
  ASSERT_TRUE(session.IsConnected());

  std::thread device_thread([&]() {
    const auto cmd = device.ReadCommand();
    ASSERT_FALSE(cmd.is_discarded());
    EXPECT_EQ(cmd["method"], "get_prop");
    EXPECT_EQ(cmd["params"][0], "power");
    device.Reply(cmd["id"].get<uint64_t>(), {"on"});
  });

  const CommandResult result = session.GetProp({yeelight::Property::kPower});
  device_thread.join();
  ASSERT_TRUE(result.ok()) << result.error.ToString();
  EXPECT_EQ(result.id, 1u);
  ASSERT_EQ(result.values.size(), 1u);
  EXPECT_EQ(result.values[0], "on");
  EXPECT_EQ(session.PendingRequestCount(), 0u);

  const auto metrics = session.GetMetrics();
  EXPECT_EQ(metrics.frames_sent, 1u);
  EXPECT_EQ(metrics.frames_received, 1u);
}

TEST(SessionTest, OutOfOrderResponsesReachTheirCallers) {
  LogCapture logs;
  FakeDevice device;
  yeelight::Session session(device.TakeTransport(), QuietConfig(&logs));

  constexpr int kCount = 5;
  std::vector<yeelight::PendingCall> calls;
  for (int i = 0; i < kCount; ++i) {
    calls.push_back(session.SendAsync(yeelight::command::SetName("n" + std::to_string(i))));
  }

  std::vector<uint64_t> ids;
  for (int i = 0; i < kCount; ++i) {
    const auto cmd = device.ReadCommand();
    ASSERT_FALSE(cmd.is_discarded());
    ids.push_back(cmd["id"].get<uint64_t>());
  }
  EXPECT_EQ(session.PendingRequestCount(), static_cast<size_t>(kCount));

  // Reply in reverse order, echoing the id.
  for (auto it = ids.rbegin(); it != ids.rend(); ++it) {
    ASSERT_TRUE(device.Reply(*it, {std::to_string(*it)}));
  }

  for (auto& call : calls) {
    const uint64_t id = call.id();
    const auto result = call.Get();
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.values[0], std::to_string(id));
  }
  EXPECT_EQ(session.PendingRequestCount(), 0u);
}

TEST(SessionTest, NotificationBeforeResponseIsRoutedSeparately) {
  LogCapture logs;
  FakeDevice device;
  yeelight::Session session(device.TakeTransport(), QuietConfig(&logs));
  auto stream = session.Subscribe();

  std::atomic<int> callback_count{0};
  session.SetNotificationCallback(
      [&](const yeelight::Notification&) { callback_count.fetch_add(1); });

  auto call = session.SendAsync(yeelight::command::SetBright(
      yeelight::Light::kMain, 10, yeelight::Effect::kSmooth, milliseconds(500)));
  const auto cmd = device.ReadCommand();
  ASSERT_FALSE(cmd.is_discarded());
  ASSERT_TRUE(device.Notify({{"bright", "10"}}));
  ASSERT_TRUE(device.Reply(cmd["id"].get<uint64_t>(), {"ok"}));

  const auto result = call.Get();
  EXPECT_TRUE(result.ok());
  EXPECT_EQ(result.values[0], "ok");

  yeelight::Notification notification;
  ASSERT_TRUE(stream.NextFor(&notification, milliseconds(1000)));
  EXPECT_EQ(notification.method, "props");
  EXPECT_EQ(notification.properties["bright"], "10");
  EXPECT_TRUE(WaitUntil([&]() { return callback_count.load() == 1; }));
}

TEST(SessionTest, BlockedCallbackDoesNotDelayResponses) {
  LogCapture logs;
  FakeDevice device;
  auto config = QuietConfig(&logs);
  config.response_timeout = milliseconds(300);
  std::mutex gate_mutex;
  std::condition_variable gate_cv;
  bool released = false;
  std::atomic<int> callback_count{0};
  yeelight::Session session(device.TakeTransport(), config);

  session.SetNotificationCallback([&](const yeelight::Notification&) {
    callback_count.fetch_add(1);
    std::unique_lock<std::mutex> lock(gate_mutex);
    gate_cv.wait_for(lock, milliseconds(2000), [&]() { return released; });
  });
  auto release = [&]() {
    {
      std::lock_guard<std::mutex> lock(gate_mutex);
      released = true;
    }
    gate_cv.notify_all();
  };

  auto call = session.SendAsync(yeelight::command::Toggle(yeelight::Light::kMain));
  const auto cmd = device.ReadCommand();
  ASSERT_FALSE(cmd.is_discarded());
  ASSERT_TRUE(device.Notify({{"power", "on"}}));
  ASSERT_TRUE(device.Reply(cmd["id"].get<uint64_t>(), {"ok"}));

  const auto result = call.Get();
  const bool callback_entered = WaitUntil([&]() { return callback_count.load() == 1; });
  release();
  EXPECT_TRUE(result.ok()) << result.error.ToString();
  EXPECT_TRUE(callback_entered);
  EXPECT_EQ(session.GetMetrics().timeouts, 0u);
}

TEST(SessionTest, CallbackCanIssueCommands) {
  LogCapture logs;
  FakeDevice device;
  std::mutex result_mutex;
  std::condition_variable result_cv;
  bool done = false;
  CommandResult from_callback;
  yeelight::Session session(device.TakeTransport(), QuietConfig(&logs));

  session.SetNotificationCallback([&](const yeelight::Notification&) {
    const auto result = session.GetProp({yeelight::Property::kPower});
    std::lock_guard<std::mutex> lock(result_mutex);
    from_callback = result;
    done = true;
    result_cv.notify_all();
  });

  ASSERT_TRUE(device.Notify({{"power", "on"}}));
  const auto cmd = device.ReadCommand();
  ASSERT_FALSE(cmd.is_discarded());
  EXPECT_EQ(cmd["method"], "get_prop");
  ASSERT_TRUE(device.Reply(cmd["id"].get<uint64_t>(), {"on"}));

  std::unique_lock<std::mutex> lock(result_mutex);
  ASSERT_TRUE(result_cv.wait_for(lock, milliseconds(2000), [&]() { return done; }));
  EXPECT_TRUE(from_callback.ok());
  EXPECT_EQ(from_callback.values[0], "on");
}

TEST(SessionTest, DeviceErrorIsReturnedVerbatim) {
  LogCapture logs;
  FakeDevice device;
  yeelight::Session session(device.TakeTransport(), QuietConfig(&logs));

  std::thread device_thread([&]() {
    const auto cmd = device.ReadCommand();
    device.ReplyError(cmd["id"].get<uint64_t>(), -1, "method not supported");
  });
  const auto result = session.DevToggle();
  device_thread.join();

  EXPECT_EQ(result.error.code, ErrorCode::kDeviceError);
  EXPECT_EQ(result.error.device_code, -1);
  EXPECT_EQ(result.error.message, "method not supported");
}

TEST(SessionTest, UnknownResponseIdIsDiscarded) {
  LogCapture logs;
  FakeDevice device;
  yeelight::Session session(device.TakeTransport(), QuietConfig(&logs));

  auto call = session.SendAsync(yeelight::command::Toggle(yeelight::Light::kMain));
  const auto cmd = device.ReadCommand();
  ASSERT_TRUE(device.Reply(999, {"ok"}));
  ASSERT_TRUE(device.Reply(cmd["id"].get<uint64_t>(), {"ok"}));
  // Duplicate of an already completed id.
  ASSERT_TRUE(device.Reply(cmd["id"].get<uint64_t>(), {"again"}));

  const auto result = call.Get();
  EXPECT_TRUE(result.ok());
  EXPECT_EQ(result.values[0], "ok");

  // The duplicate is handled after the completion; wait for it to be read.
  const auto deadline = std::chrono::steady_clock::now() + milliseconds(1000);
  while (session.GetMetrics().stale_responses < 2 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(milliseconds(5));
  }
  EXPECT_EQ(session.GetMetrics().stale_responses, 2u);
  EXPECT_TRUE(logs.Contains("unknown id 999"));
  EXPECT_TRUE(session.IsConnected());
}

TEST(SessionTest, MissingResponseTimesOut) {
  LogCapture logs;
  FakeDevice device;
  auto config = QuietConfig(&logs);
  config.response_timeout = milliseconds(50);
  yeelight::Session session(device.TakeTransport(), config);

  const auto started = std::chrono::steady_clock::now();
  const auto result = session.Toggle();
  const auto elapsed = std::chrono::steady_clock::now() - started;
  EXPECT_EQ(result.error.code, ErrorCode::kTimeout);
  EXPECT_GE(elapsed, milliseconds(50));
  EXPECT_EQ(session.GetMetrics().timeouts, 1u);
  EXPECT_EQ(session.PendingRequestCount(), 0u);

  // A reply after the deadline is stale and does not disturb the session.
  ASSERT_TRUE(device.Reply(result.id, {"ok"}));
  const auto deadline = std::chrono::steady_clock::now() + milliseconds(1000);
  while (session.GetMetrics().stale_responses < 1 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(milliseconds(5));
  }
  EXPECT_EQ(session.GetMetrics().stale_responses, 1u);
  EXPECT_TRUE(session.IsConnected());
}

TEST(SessionTest, ExpiryHookFailsOnlyDueRequests) {
  LogCapture logs;
  FakeDevice device;
  auto config = QuietConfig(&logs);
  config.response_timeout = std::chrono::seconds(30);
  yeelight::Session session(device.TakeTransport(), config);

  auto call = session.SendAsync(yeelight::command::Toggle(yeelight::Light::kMain));
  EXPECT_EQ(yeelight::test::ExpireRequests(session, std::chrono::steady_clock::now()), 0u);
  EXPECT_EQ(yeelight::test::ExpireRequests(
                session, std::chrono::steady_clock::now() + std::chrono::seconds(31)),
            1u);
  EXPECT_EQ(call.Get().error.code, ErrorCode::kTimeout);
}

TEST(SessionTest, MalformedFrameWithIdFailsThatRequest) {
  LogCapture logs;
  FakeDevice device;
  yeelight::Session session(device.TakeTransport(), QuietConfig(&logs));

  auto call = session.SendAsync(yeelight::command::Toggle(yeelight::Light::kMain));
  const auto cmd = device.ReadCommand();
  ASSERT_TRUE(device.SendLine("{\"id\":" + std::to_string(cmd["id"].get<uint64_t>()) +
                              ",\"result\":\"ok\"}"));
  const auto result = call.Get();
  EXPECT_EQ(result.error.code, ErrorCode::kMalformedFrame);
  EXPECT_EQ(session.GetMetrics().parse_errors, 1u);
}

TEST(SessionTest, GarbageLinesAreSkipped) {
  LogCapture logs;
  FakeDevice device;
  yeelight::Session session(device.TakeTransport(), QuietConfig(&logs));

  auto call = session.SendAsync(yeelight::command::Toggle(yeelight::Light::kMain));
  const auto cmd = device.ReadCommand();
  ASSERT_TRUE(device.SendLine("not json at all"));
  ASSERT_TRUE(device.SendLine("{\"unexpected\":true}"));
  ASSERT_TRUE(device.Reply(cmd["id"].get<uint64_t>(), {"ok"}));

  EXPECT_TRUE(call.Get().ok());
  EXPECT_EQ(session.GetMetrics().parse_errors, 2u);
  EXPECT_TRUE(logs.Contains("malformed frame"));
}

TEST(SessionTest, PeerCloseFailsPendingAndEndsStreams) {
  LogCapture logs;
  FakeDevice device;
  yeelight::Session session(device.TakeTransport(), QuietConfig(&logs));
  auto stream = session.Subscribe();

  auto call = session.SendAsync(yeelight::command::Toggle(yeelight::Light::kMain));
  const auto cmd = device.ReadCommand();
  ASSERT_FALSE(cmd.is_discarded());
  device.Close();

  EXPECT_EQ(call.Get().error.code, ErrorCode::kConnectionClosed);
  yeelight::Notification notification;
  EXPECT_FALSE(stream.Next(&notification));
  EXPECT_TRUE(stream.finished());
  EXPECT_FALSE(session.IsConnected());

  const auto after = session.Toggle();
  EXPECT_EQ(after.error.code, ErrorCode::kConnectionClosed);
  EXPECT_TRUE(session.Subscribe().finished());
}

TEST(SessionTest, AbandonedCallDoesNotDisturbOthers) {
  LogCapture logs;
  FakeDevice device;
  yeelight::Session session(device.TakeTransport(), QuietConfig(&logs));

  uint64_t abandoned_id = 0;
  {
    auto abandoned = session.SendAsync(yeelight::command::Toggle(yeelight::Light::kMain));
    abandoned_id = abandoned.id();
  }
  auto kept = session.SendAsync(
      yeelight::command::GetProp({yeelight::Property::kBright}));

  const auto first = device.ReadCommand();
  const auto second = device.ReadCommand();
  ASSERT_FALSE(first.is_discarded());
  ASSERT_FALSE(second.is_discarded());
  EXPECT_EQ(first["id"].get<uint64_t>(), abandoned_id);
  ASSERT_TRUE(device.Reply(abandoned_id, {"ok"}));
  ASSERT_TRUE(device.Reply(second["id"].get<uint64_t>(), {"80"}));

  const auto result = kept.Get();
  ASSERT_TRUE(result.ok()) << result.error.ToString();
  EXPECT_EQ(result.id, second["id"].get<uint64_t>());
  EXPECT_EQ(result.values[0], "80");
  EXPECT_EQ(session.PendingRequestCount(), 0u);
  EXPECT_EQ(session.GetMetrics().stale_responses, 0u);
  EXPECT_TRUE(session.IsConnected());
}

TEST(SessionTest, CloseFailsPendingRequests) {
  LogCapture logs;
  FakeDevice device;
  yeelight::Session session(device.TakeTransport(), QuietConfig(&logs));

  auto call = session.SendAsync(yeelight::command::Toggle(yeelight::Light::kMain));
  session.Close();
  EXPECT_EQ(call.Get().error.code, ErrorCode::kConnectionClosed);
  EXPECT_FALSE(session.IsConnected());
  EXPECT_TRUE(device.WaitForEof());
  session.Close();
}

TEST(SessionTest, WriteFailureIsReportedToCaller) {
  LogCapture logs;
  yeelight::Session session(std::make_unique<BrokenTransport>(), QuietConfig(&logs));

  const auto result = session.Toggle();
  EXPECT_EQ(result.error.code, ErrorCode::kWriteError);
  EXPECT_EQ(session.GetMetrics().send_errors, 1u);
  EXPECT_TRUE(logs.Contains("write of toggle failed"));

  // The broken transport is closed, which ends the session.
  const auto deadline = std::chrono::steady_clock::now() + milliseconds(1000);
  while (session.IsConnected() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(milliseconds(5));
  }
  EXPECT_FALSE(session.IsConnected());
}

TEST(SessionTest, NoResponseModeCompletesAfterWrite) {
  LogCapture logs;
  FakeDevice device;
  auto config = QuietConfig(&logs);
  config.expect_responses = false;
  yeelight::Session session(device.TakeTransport(), config);

  const auto first = session.SetRgb(0xff0000, yeelight::Effect::kSudden, milliseconds(0));
  const auto second = session.Toggle();
  EXPECT_TRUE(first.ok());
  EXPECT_TRUE(first.values.empty());
  EXPECT_EQ(first.id, 1u);
  EXPECT_EQ(second.id, 2u);
  EXPECT_EQ(session.PendingRequestCount(), 0u);

  const auto cmd = device.ReadCommand();
  EXPECT_EQ(cmd["method"], "set_rgb");
  EXPECT_EQ(cmd["params"][0], 0xff0000);

  session.SetExpectResponses(true);
  EXPECT_TRUE(session.expect_responses());
}

TEST(SessionTest, CallbackExceptionsAreCountedAndContained) {
  LogCapture logs;
  FakeDevice device;
  yeelight::Session session(device.TakeTransport(), QuietConfig(&logs));
  session.SetNotificationCallback(
      [](const yeelight::Notification&) { throw std::runtime_error("boom"); });

  auto call = session.SendAsync(yeelight::command::Toggle(yeelight::Light::kMain));
  const auto cmd = device.ReadCommand();
  ASSERT_TRUE(device.Notify({{"power", "off"}}));
  ASSERT_TRUE(device.Reply(cmd["id"].get<uint64_t>(), {"ok"}));

  EXPECT_TRUE(call.Get().ok());
  EXPECT_TRUE(WaitUntil([&]() { return session.GetMetrics().callback_exceptions == 1; }));
  EXPECT_TRUE(logs.Contains("boom"));
}

TEST(SessionTest, SlowSubscriberDropsOldest) {
  LogCapture logs;
  FakeDevice device;
  auto config = QuietConfig(&logs);
  config.notification_queue_capacity = 2;
  yeelight::Session session(device.TakeTransport(), config);
  auto stream = session.Subscribe();

  for (int i = 1; i <= 4; ++i) {
    ASSERT_TRUE(device.Notify({{"bright", std::to_string(i)}}));
  }
  // A response after the notifications proves they were all read.
  auto call = session.SendAsync(yeelight::command::Toggle(yeelight::Light::kMain));
  const auto cmd = device.ReadCommand();
  ASSERT_TRUE(device.Reply(cmd["id"].get<uint64_t>(), {"ok"}));
  ASSERT_TRUE(call.Get().ok());

  EXPECT_EQ(session.GetMetrics().notifications_dropped, 2u);
  yeelight::Notification notification;
  ASSERT_TRUE(stream.NextFor(&notification, milliseconds(100)));
  EXPECT_EQ(notification.properties["bright"], "3");
  ASSERT_TRUE(stream.NextFor(&notification, milliseconds(100)));
  EXPECT_EQ(notification.properties["bright"], "4");
}

TEST(SessionTest, TraceLogsFramesBothWays) {
  LogCapture logs;
  FakeDevice device;
  auto config = QuietConfig(&logs);
  config.trace_frames = true;
  yeelight::Session session(device.TakeTransport(), config);

  auto call = session.SendAsync(yeelight::command::Toggle(yeelight::Light::kMain));
  const auto cmd = device.ReadCommand();
  ASSERT_TRUE(device.Reply(cmd["id"].get<uint64_t>(), {"ok"}));
  ASSERT_TRUE(call.Get().ok());

  EXPECT_TRUE(logs.Contains("send -> {\"id\":1,\"method\":\"toggle\",\"params\":[]}"));
  EXPECT_TRUE(logs.Contains("recv <- {\"id\":1,\"result\":[\"ok\"]}"));
}

TEST(SessionTest, InvalidConfigRefusesToStart) {
  LogCapture logs;
  FakeDevice device;
  auto config = QuietConfig(&logs);
  config.response_timeout = milliseconds(0);
  yeelight::Session session(device.TakeTransport(), config);

  EXPECT_FALSE(session.IsConnected());
  const auto result = session.Toggle();
  EXPECT_EQ(result.error.code, ErrorCode::kInvalidConfig);
  EXPECT_NE(result.error.message.find("response_timeout"), std::string::npos);
  EXPECT_TRUE(logs.Contains("invalid config"));
  EXPECT_TRUE(device.WaitForEof());
}

TEST(SessionTest, SessionWithoutTransportIsClosed) {
  LogCapture logs;
  yeelight::Session session(nullptr, QuietConfig(&logs));
  EXPECT_FALSE(session.IsConnected());
  EXPECT_EQ(session.Toggle().error.code, ErrorCode::kConnectionClosed);
  EXPECT_TRUE(session.RemoteAddress().empty());
}

TEST(SessionConnectTest, ConnectsToDiscoveredDevice) {
  LogCapture logs;
  LoopbackListener listener;
  ASSERT_TRUE(listener.ok());

  yeelight::DiscoveredDevice found;
  found.id = 0x15243f;
  found.address = "127.0.0.1";
  found.port = listener.port();

  yeelight::Error error;
  auto session = yeelight::Session::Connect(found, QuietConfig(&logs), &error);
  ASSERT_NE(session, nullptr) << error.ToString();
  EXPECT_EQ(session->RemoteAddress(), "127.0.0.1:" + std::to_string(listener.port()));

  FakeDevice device(listener.Accept());
  ASSERT_TRUE(device.ok());
  std::thread device_thread([&]() {
    const auto cmd = device.ReadCommand();
    device.Reply(cmd["id"].get<uint64_t>(), {"ok"});
  });
  EXPECT_TRUE(session->On().ok());
  device_thread.join();
}

TEST(SessionConnectTest, ZeroPortUsesConfiguredDefault) {
  LogCapture logs;
  LoopbackListener listener;
  ASSERT_TRUE(listener.ok());
  auto config = QuietConfig(&logs);
  config.default_port = listener.port();

  yeelight::Error error;
  auto session = yeelight::Session::Connect("127.0.0.1", 0, config, &error);
  ASSERT_NE(session, nullptr) << error.ToString();
  EXPECT_TRUE(session->IsConnected());
}
