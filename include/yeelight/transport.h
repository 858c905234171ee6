#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "yeelight/error.h"

namespace yeelight {

/**
 * Default control port of the device.
 */
constexpr uint16_t kDefaultPort = 55443;

/**
 * Bidirectional newline-delimited frame stream to one device.
 *
 * Writes may come from several threads and are serialized by the
 * implementation; reads come from a single reader thread.
 */
class Transport {
 public:
  virtual ~Transport() = default;

  /// Write one complete frame (delimiter included). Fails with kWriteError.
  virtual bool WriteFrame(const std::string& frame, Error* error) = 0;
  /// Block until the next frame (delimiter stripped) or end of stream.
  virtual bool ReadFrame(std::string* frame) = 0;
  /// Close the stream and unblock a pending ReadFrame. Idempotent.
  virtual void Close() = 0;
  /// Peer address as "host:port" (may be empty when unknown).
  virtual std::string RemoteAddress() const = 0;
};

/**
 * Transport over a connected stream socket.
 */
class TcpTransport : public Transport {
 public:
  /**
   * Connect to a device.
   *
   * @param address IPv4 address or host name.
   * @param port Control port.
   * @param timeout Connection establishment limit.
   * @param error kConnectTimeout, kConnectRefused or kConnectFailed.
   */
  static std::unique_ptr<TcpTransport> Connect(const std::string& address,
                                               uint16_t port,
                                               std::chrono::milliseconds timeout,
                                               Error* error = nullptr);

  /// Take ownership of an already connected socket.
  static std::unique_ptr<TcpTransport> Attach(int fd);

  ~TcpTransport() override;

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  bool WriteFrame(const std::string& frame, Error* error) override;
  bool ReadFrame(std::string* frame) override;
  void Close() override;
  std::string RemoteAddress() const override;

  bool closed() const { return closed_.load(); }

 private:
  explicit TcpTransport(int fd);

  int fd_ = -1;
  std::atomic<bool> closed_{false};
  std::mutex write_mutex_;
  std::string read_buffer_;
  std::string remote_address_;
};

}  // namespace yeelight
