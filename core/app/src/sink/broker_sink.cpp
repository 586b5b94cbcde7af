#include "orderflow/sink/broker_sink.hpp"
#include "orderflow/events/event_payload.hpp"
#include "orderflow/sink/sink_error.hpp"

#include <stdexcept>
#include <utility>

namespace orderflow {

BrokerSink::BrokerSink(std::unique_ptr<IBrokerClient> client,
                       std::string topic)
    : client_(std::move(client)), topic_(std::move(topic)) {
  if (!client_) {
    throw std::invalid_argument("BrokerSink requires a broker client");
  }
  if (topic_.empty()) {
    throw std::invalid_argument("BrokerSink requires a non-empty topic");
  }
}

// -----------------------------------------------------------------------------
// write: one publish attempt, failure becomes SinkError
// -----------------------------------------------------------------------------
void BrokerSink::write(const OrderLifecycleEvent& event) {
  PublishResult result =
      client_->publish(topic_, event.order.id, serializePayload(event));
  if (!result.ok) {
    throw SinkError(result.reason);
  }
}

void BrokerSink::flush() { client_->flush(); }

void BrokerSink::close() {
  client_->flush();
  client_->close();
}

}  // namespace orderflow
