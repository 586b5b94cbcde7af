#include "orderflow/sink/sink_dispatcher.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace orderflow {

SinkDispatcher::~SinkDispatcher() { close(); }

// -----------------------------------------------------------------------------
// addSink
// -----------------------------------------------------------------------------
SinkDispatcher::SinkId SinkDispatcher::addSink(
    std::unique_ptr<IEventSink> sink) {
  if (!sink) {
    throw std::invalid_argument("SinkDispatcher::addSink: null sink");
  }
  if (closed_) {
    throw std::logic_error("SinkDispatcher::addSink: dispatcher is closed");
  }

  SinkId id = next_id_++;
  sinks_.push_back(SinkEntry{id, std::move(sink), 0});
  return id;
}

// -----------------------------------------------------------------------------
// removeSink
// -----------------------------------------------------------------------------
bool SinkDispatcher::removeSink(SinkId id) {
  auto it = std::find_if(sinks_.begin(), sinks_.end(),
                         [id](const SinkEntry& e) { return e.id == id; });
  if (it == sinks_.end()) {
    return false;
  }

  std::unique_ptr<IEventSink> removed = std::move(it->sink);
  sinks_.erase(it);
  if (!closed_) {
    shutdownSink(*removed);
  }
  return true;
}

// -----------------------------------------------------------------------------
// dispatch: isolated write per sink
// -----------------------------------------------------------------------------
std::size_t SinkDispatcher::dispatch(const OrderLifecycleEvent& event) {
  if (closed_) {
    return 0;
  }

  std::size_t failed = 0;
  for (auto& entry : sinks_) {
    try {
      entry.sink->write(event);
    } catch (const std::exception& e) {
      ++entry.failures;
      ++total_failures_;
      ++failed;
      std::cerr << "[SinkDispatcher] WARNING: sink=" << entry.sink->name()
                << " failed to deliver order_id=" << event.order.id << ": "
                << e.what() << "\n";
    }
  }
  return failed;
}

// -----------------------------------------------------------------------------
// close: flush + close every sink, exactly once
// -----------------------------------------------------------------------------
void SinkDispatcher::close() {
  if (closed_) {
    return;
  }
  closed_ = true;

  for (auto& entry : sinks_) {
    shutdownSink(*entry.sink);
  }
}

std::uint64_t SinkDispatcher::failureCount(SinkId id) const {
  for (const auto& entry : sinks_) {
    if (entry.id == id) {
      return entry.failures;
    }
  }
  return 0;
}

// -----------------------------------------------------------------------------
// shutdownSink: flush then close; failures are logged, close always runs
// -----------------------------------------------------------------------------
void SinkDispatcher::shutdownSink(IEventSink& sink) {
  try {
    sink.flush();
  } catch (const std::exception& e) {
    std::cerr << "[SinkDispatcher] WARNING: sink=" << sink.name()
              << " flush failed: " << e.what() << "\n";
  }

  try {
    sink.close();
  } catch (const std::exception& e) {
    std::cerr << "[SinkDispatcher] WARNING: sink=" << sink.name()
              << " close failed: " << e.what() << "\n";
  }
}

}  // namespace orderflow
