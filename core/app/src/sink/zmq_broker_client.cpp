#include "orderflow/sink/zmq_broker_client.hpp"

#include <iostream>
#include <utility>

namespace orderflow {

// -----------------------------------------------------------------------------
// Constructor: create context and PUSH socket, connect
// -----------------------------------------------------------------------------
ZmqBrokerClient::ZmqBrokerClient(std::string endpoint, int send_timeout_ms)
    : endpoint_(std::move(endpoint)), send_timeout_ms_(send_timeout_ms) {
  context_ = std::make_unique<zmq::context_t>(1);
  socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::push);

  socket_->set(zmq::sockopt::immediate, 1);
  socket_->set(zmq::sockopt::sndtimeo, send_timeout_ms_);
  socket_->set(zmq::sockopt::linger, kLingerMs);
  socket_->connect(endpoint_);

  std::cout << "[ZmqBrokerClient] connected PUSH socket to " << endpoint_
            << " (send timeout " << send_timeout_ms_ << " ms)\n";
}

// -----------------------------------------------------------------------------
// Destructor: RAII close
// -----------------------------------------------------------------------------
ZmqBrokerClient::~ZmqBrokerClient() { close(); }

// -----------------------------------------------------------------------------
// publish: [topic, key, payload] multipart
// -----------------------------------------------------------------------------
PublishResult ZmqBrokerClient::publish(const std::string& topic,
                                       const std::string& key,
                                       const std::string& payload) {
  if (!socket_) {
    return PublishResult::failure("client is closed");
  }

  try {
    zmq::message_t topic_msg(topic.data(), topic.size());
    if (!socket_->send(topic_msg, zmq::send_flags::sndmore)) {
      return PublishResult::failure(
          "send timed out after " + std::to_string(send_timeout_ms_) +
          " ms (no connected peer on " + endpoint_ + ")");
    }

    zmq::message_t key_msg(key.data(), key.size());
    if (!socket_->send(key_msg, zmq::send_flags::sndmore)) {
      return PublishResult::failure("key frame was not accepted");
    }

    zmq::message_t payload_msg(payload.data(), payload.size());
    if (!socket_->send(payload_msg, zmq::send_flags::none)) {
      return PublishResult::failure("payload frame was not accepted");
    }
  } catch (const zmq::error_t& e) {
    return PublishResult::failure(std::string("zmq error: ") + e.what());
  }

  return PublishResult::success();
}

void ZmqBrokerClient::flush() {}

// -----------------------------------------------------------------------------
// close: socket before context; linger bounds the wait for queued frames
// -----------------------------------------------------------------------------
void ZmqBrokerClient::close() {
  if (!socket_ && !context_) {
    return;
  }

  socket_.reset();
  context_.reset();

  std::cout << "[ZmqBrokerClient] closed " << endpoint_ << "\n";
}

}  // namespace orderflow
