#pragma once

#include "orderflow/sink/i_broker_client.hpp"
#include "orderflow/sink/i_event_sink.hpp"

#include <memory>
#include <string>

namespace orderflow {

// -----------------------------------------------------------------------------
// BrokerSink — publishes events to a message broker topic
// -----------------------------------------------------------------------------
//
// @brief  Serializes each event to compact JSON and publishes it with the
//         order id as key.
//
// @details
// A failed PublishResult is raised as SinkError carrying the client's
// reason, which SinkDispatcher logs as
//   [SinkDispatcher] WARNING: sink=broker failed to deliver order_id=...
// There is no retry: the event is dropped for this sink only.
//
// Ownership:
//   Owns the IBrokerClient. close() flushes and closes the client.
// -----------------------------------------------------------------------------
class BrokerSink final : public IEventSink {
 public:
  BrokerSink(std::unique_ptr<IBrokerClient> client, std::string topic);

  std::string name() const override { return "broker"; }
  void write(const OrderLifecycleEvent& event) override;
  void flush() override;
  void close() override;

  const std::string& topic() const { return topic_; }

 private:
  std::unique_ptr<IBrokerClient> client_;
  std::string topic_;
};

}  // namespace orderflow
