// Tests for the music-mode connection handoff.
#include "yeelight/session.h"
#include "yeelight/test_hooks.h"

#include "test_util.h"

#include <gtest/gtest.h>

#include <memory>
#include <thread>

using std::chrono::milliseconds;
using yeelight::ErrorCode;
using yeelight::MusicState;
using yeelight::testutil::ConnectLoopback;
using yeelight::testutil::FakeDevice;
using yeelight::testutil::LogCapture;

namespace {

yeelight::Config MusicConfig(LogCapture* logs) {
  yeelight::Config config;
  config.music_host = "127.0.0.1";
  config.music_bind_address = "127.0.0.1";
  config.music_accept_timeout = milliseconds(2000);
  config.log_callback = logs->Callback();
  return config;
}

}  // namespace

TEST(MusicModeTest, PromotesInboundConnection) {
  LogCapture logs;
  FakeDevice control;
  yeelight::Session session(control.TakeTransport(), MusicConfig(&logs));
  EXPECT_EQ(session.GetMusicState(), MusicState::kNotStarted);
  EXPECT_EQ(yeelight::test::GetTransportGeneration(session), 0u);

  // Never answered; the control connection is superseded before it can be.
  auto orphan = session.SendAsync(yeelight::command::Toggle(yeelight::Light::kMain));

  std::unique_ptr<FakeDevice> music;
  bool control_closed = false;
  std::thread device_thread([&]() {
    control.ReadCommand();
    const auto set_music = control.ReadCommand();
    if (set_music.is_discarded() || set_music["method"] != "set_music") {
      return;
    }
    const auto& params = set_music["params"];
    if (params.size() != 3 || params[0] != 1 || params[1] != "127.0.0.1") {
      return;
    }
    control.Reply(set_music["id"].get<uint64_t>(), {"ok"});
    music = std::make_unique<FakeDevice>(ConnectLoopback(params[2].get<uint16_t>()));
    control_closed = control.WaitForEof();
  });

  yeelight::Error error;
  const bool started = session.StartMusic(&error);
  device_thread.join();

  ASSERT_TRUE(started) << error.ToString();
  EXPECT_EQ(session.GetMusicState(), MusicState::kPromoted);
  EXPECT_EQ(yeelight::test::GetTransportGeneration(session), 1u);
  EXPECT_TRUE(session.IsConnected());
  EXPECT_FALSE(session.expect_responses());
  EXPECT_TRUE(control_closed);
  EXPECT_EQ(orphan.Get().error.code, ErrorCode::kConnectionClosed);

  // Commands now flow over the device-initiated connection without replies.
  ASSERT_NE(music, nullptr);
  ASSERT_TRUE(music->ok());
  const auto result =
      session.SetBright(42, yeelight::Effect::kSudden, milliseconds(0));
  EXPECT_TRUE(result.ok());
  const auto cmd = music->ReadCommand();
  ASSERT_FALSE(cmd.is_discarded());
  EXPECT_EQ(cmd["method"], "set_bright");
  EXPECT_EQ(cmd["params"][0], 42);
  EXPECT_TRUE(logs.Contains("music mode active"));

  // Only one promotion per session.
  EXPECT_FALSE(session.StartMusic(&error));
  EXPECT_EQ(error.code, ErrorCode::kInvalidState);
}

TEST(MusicModeTest, AcceptTimeoutKeepsOriginalConnection) {
  LogCapture logs;
  FakeDevice control;
  auto config = MusicConfig(&logs);
  config.music_accept_timeout = milliseconds(100);
  yeelight::Session session(control.TakeTransport(), config);

  std::thread device_thread([&]() {
    const auto set_music = control.ReadCommand();
    control.Reply(set_music["id"].get<uint64_t>(), {"ok"});
    // Never connects back; then answers a regular command.
    const auto toggle = control.ReadCommand();
    control.Reply(toggle["id"].get<uint64_t>(), {"ok"});
  });

  yeelight::Error error;
  EXPECT_FALSE(session.StartMusic(&error));
  EXPECT_EQ(error.code, ErrorCode::kMusicModeTimeout);
  EXPECT_EQ(session.GetMusicState(), MusicState::kFailed);
  EXPECT_EQ(yeelight::test::GetTransportGeneration(session), 0u);
  EXPECT_TRUE(session.IsConnected());
  EXPECT_TRUE(session.expect_responses());

  EXPECT_TRUE(session.Toggle().ok());
  device_thread.join();
}

TEST(MusicModeTest, DeviceRefusalFailsHandoff) {
  LogCapture logs;
  FakeDevice control;
  yeelight::Session session(control.TakeTransport(), MusicConfig(&logs));

  std::thread device_thread([&]() {
    const auto set_music = control.ReadCommand();
    control.ReplyError(set_music["id"].get<uint64_t>(), -1, "general error");
  });

  yeelight::Error error;
  EXPECT_FALSE(session.StartMusic(&error));
  device_thread.join();
  EXPECT_EQ(error.code, ErrorCode::kDeviceError);
  EXPECT_EQ(error.device_code, -1);
  EXPECT_EQ(session.GetMusicState(), MusicState::kFailed);
  EXPECT_TRUE(session.IsConnected());
}

TEST(MusicModeTest, RequiresAdvertisedHost) {
  LogCapture logs;
  FakeDevice control;
  auto config = MusicConfig(&logs);
  config.music_host.clear();
  yeelight::Session session(control.TakeTransport(), config);

  yeelight::Error error;
  EXPECT_FALSE(session.StartMusic(&error));
  EXPECT_EQ(error.code, ErrorCode::kInvalidConfig);
  EXPECT_EQ(session.GetMusicState(), MusicState::kNotStarted);
}

TEST(MusicModeTest, RequiresConnectedSession) {
  LogCapture logs;
  yeelight::Session session(nullptr, MusicConfig(&logs));
  yeelight::Error error;
  EXPECT_FALSE(session.StartMusic(&error));
  EXPECT_EQ(error.code, ErrorCode::kConnectionClosed);
}
