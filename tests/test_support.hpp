#pragma once

// =============================================================================
// test_support.hpp
// =============================================================================
// Shared doubles for the orderflow tests:
//   - ScriptedRandomSource: deterministic IRandomSource
//   - RecordingSink / FailingSink: IEventSink doubles that report into a
//     shared SinkLog (the dispatcher owns the sink itself)
//   - FakeBrokerClient: IBrokerClient that records or rejects publishes
// =============================================================================

#include "orderflow/events/order_lifecycle_event.hpp"
#include "orderflow/random/i_random_source.hpp"
#include "orderflow/sink/i_broker_client.hpp"
#include "orderflow/sink/i_event_sink.hpp"
#include "orderflow/sink/sink_error.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace orderflow::test {

// -----------------------------------------------------------------------------
// ScriptedRandomSource
// -----------------------------------------------------------------------------
// uniformReal(lo, hi)  lo + real_fraction * (hi - lo)
// uniformInt(lo, hi)   min(lo + int_offset, hi)
// unitInterval()       next queued value, else default_unit
// -----------------------------------------------------------------------------
class ScriptedRandomSource final : public IRandomSource {
 public:
  double real_fraction{0.0};
  std::int64_t int_offset{0};
  double default_unit{0.99};
  std::deque<double> units;

  std::uint64_t unit_draws{0};

  double uniformReal(double lo, double hi) override {
    return lo + real_fraction * (hi - lo);
  }

  std::int64_t uniformInt(std::int64_t lo, std::int64_t hi) override {
    return std::min(lo + int_offset, hi);
  }

  double unitInterval() override {
    ++unit_draws;
    if (units.empty()) {
      return default_unit;
    }
    double value = units.front();
    units.pop_front();
    return value;
  }
};

// -----------------------------------------------------------------------------
// SinkLog: what a sink saw, readable after the dispatcher took ownership.
// -----------------------------------------------------------------------------
struct SinkLog {
  std::vector<OrderLifecycleEvent> events;
  int write_attempts{0};
  int flushes{0};
  int closes{0};

  // Status sequence per order id, in delivery order.
  std::map<std::string, std::vector<domain::OrderStatus>> statusesById() const {
    std::map<std::string, std::vector<domain::OrderStatus>> out;
    for (const auto& e : events) {
      out[e.order.id].push_back(e.order.status());
    }
    return out;
  }
};

class RecordingSink final : public IEventSink {
 public:
  explicit RecordingSink(std::shared_ptr<SinkLog> log,
                         std::string name = "recording")
      : log_(std::move(log)), name_(std::move(name)) {}

  std::string name() const override { return name_; }

  void write(const OrderLifecycleEvent& event) override {
    ++log_->write_attempts;
    log_->events.push_back(event);
  }

  void flush() override { ++log_->flushes; }
  void close() override { ++log_->closes; }

 private:
  std::shared_ptr<SinkLog> log_;
  std::string name_;
};

// Throws SinkError from every write; optionally from flush/close too.
class FailingSink final : public IEventSink {
 public:
  explicit FailingSink(std::shared_ptr<SinkLog> log,
                       bool fail_on_close = false)
      : log_(std::move(log)), fail_on_close_(fail_on_close) {}

  std::string name() const override { return "failing"; }

  void write(const OrderLifecycleEvent&) override {
    ++log_->write_attempts;
    throw SinkError("broker unavailable");
  }

  void flush() override {
    ++log_->flushes;
    if (fail_on_close_) {
      throw SinkError("flush refused");
    }
  }

  void close() override {
    ++log_->closes;
    if (fail_on_close_) {
      throw SinkError("close refused");
    }
  }

 private:
  std::shared_ptr<SinkLog> log_;
  bool fail_on_close_;
};

// -----------------------------------------------------------------------------
// FakeBrokerClient
// -----------------------------------------------------------------------------
struct PublishedMessage {
  std::string topic;
  std::string key;
  std::string payload;
};

struct BrokerLog {
  std::vector<PublishedMessage> messages;
  bool fail{false};
  int flushes{0};
  int closes{0};
};

class FakeBrokerClient final : public IBrokerClient {
 public:
  explicit FakeBrokerClient(std::shared_ptr<BrokerLog> log)
      : log_(std::move(log)) {}

  PublishResult publish(const std::string& topic, const std::string& key,
                        const std::string& payload) override {
    if (log_->fail) {
      return PublishResult::failure("timed out waiting for acknowledgment");
    }
    log_->messages.push_back(PublishedMessage{topic, key, payload});
    return PublishResult::success();
  }

  void flush() override { ++log_->flushes; }
  void close() override { ++log_->closes; }

 private:
  std::shared_ptr<BrokerLog> log_;
};

}  // namespace orderflow::test
