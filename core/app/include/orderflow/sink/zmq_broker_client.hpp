#pragma once

#include "orderflow/sink/i_broker_client.hpp"

#include <zmq.hpp>

#include <memory>
#include <string>

namespace orderflow {

// -----------------------------------------------------------------------------
// ZmqBrokerClient — IBrokerClient over a ZeroMQ PUSH socket
// -----------------------------------------------------------------------------
//
// @brief  Publishes each event as a three-frame multipart message
//         [topic, key, payload] to a downstream collector.
//
// @details
// Socket setup (constructor):
//   - context with one I/O thread, socket type PUSH
//   - ZMQ_IMMEDIATE = 1: messages are only queued to completed
//     connections, so a send with no live peer blocks instead of silently
//     piling up in a pipe that may never connect
//   - ZMQ_SNDTIMEO = send_timeout_ms: that block is bounded; on expiry
//     send() returns an empty result and publish() reports a failure
//   - connect(endpoint), e.g. "tcp://localhost:5557"
//
// The collector binds a PULL socket on the endpoint and reads the three
// frames. The topic frame lets one collector demultiplex several streams.
//
// flush():
//   ZeroMQ has no explicit flush. Queued frames drain on the I/O thread;
//   close() lingers up to kLingerMs for them.
//
// Errors:
//   Constructor: zmq::error_t on an invalid endpoint (propagated).
//   publish():   timeout or zmq::error_t mapped to PublishResult::failure.
//
// Ownership:
//   Owns the context and socket through std::unique_ptr. close() (also run
//   by the destructor) resets the socket before the context.
// -----------------------------------------------------------------------------
class ZmqBrokerClient final : public IBrokerClient {
 public:
  static constexpr int kLingerMs = 2000;

  ZmqBrokerClient(std::string endpoint, int send_timeout_ms);
  ~ZmqBrokerClient() override;

  ZmqBrokerClient(const ZmqBrokerClient&) = delete;
  ZmqBrokerClient& operator=(const ZmqBrokerClient&) = delete;

  PublishResult publish(const std::string& topic, const std::string& key,
                        const std::string& payload) override;
  void flush() override;
  void close() override;

  const std::string& endpoint() const { return endpoint_; }

 private:
  std::string endpoint_;
  int send_timeout_ms_;
  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;
};

}  // namespace orderflow
