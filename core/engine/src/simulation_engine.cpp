#include "orderflow/engine/simulation_engine.hpp"
#include "orderflow/time/time_utils.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace orderflow {

namespace {

SimulationConfig validated(SimulationConfig config) {
  config.validate();
  return config;
}

void sleepFor(std::int64_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
SimulationEngine::SimulationEngine(SimulationConfig config,
                                   const ITimeProvider& session_clock,
                                   const ITimeProvider& wall_clock,
                                   IRandomSource& rng, Sleeper sleeper)
    : config_(validated(std::move(config))),
      session_clock_(session_clock),
      wall_clock_(wall_clock),
      rng_(rng),
      sleeper_(sleeper ? std::move(sleeper) : Sleeper(sleepFor)),
      policy_(config_.policy, rng_),
      factory_(config_.catalog, id_gen_, policy_, rng_, session_clock_,
               wall_clock_) {}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
SimulationEngine::~SimulationEngine() { stop(); }

SinkDispatcher::SinkId SimulationEngine::addSink(
    std::unique_ptr<IEventSink> sink) {
  if (state_ == State::Stopped) {
    throw std::logic_error("SimulationEngine::addSink: engine is stopped");
  }
  return dispatcher_.addSink(std::move(sink));
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void SimulationEngine::start() {
  if (state_ != State::Idle) {
    return;
  }

  start_ms_ = session_clock_.now_ms();
  duration_ms_ = minutesToMs(config_.session_duration_minutes);
  stats_.begin(start_ms_);
  next_arrival_ms_ = start_ms_ + drawArrivalDelayMs();
  state_ = State::Running;

  std::cout << "[SimulationEngine] started. duration="
            << config_.session_duration_minutes << " min, arrival delay="
            << config_.min_delay_seconds << "-" << config_.max_delay_seconds
            << " s, sinks=" << dispatcher_.sinkCount() << ".\n";
}

// -----------------------------------------------------------------------------
// tick()
// -----------------------------------------------------------------------------
bool SimulationEngine::tick() {
  if (state_ == State::Idle) {
    throw std::logic_error("SimulationEngine::tick() called before start()");
  }
  if (state_ == State::Stopped) {
    return false;
  }

  const std::int64_t now = session_clock_.now_ms();

  // ---  1) Stop condition ----------------------------------------------------
  if (stopRequested() || now - start_ms_ >= duration_ms_) {
    if (stopRequested()) {
      std::cout << "[SimulationEngine] stop requested. Shutting down...\n";
    }
    stop();
    return false;
  }

  // ---  2) Arrival -----------------------------------------------------------
  if (now >= next_arrival_ms_) {
    admitNewOrder();
    next_arrival_ms_ = now + drawArrivalDelayMs();
  }

  // ---  3) + 4) Due orders ---------------------------------------------------
  advanceDueOrders(now);

  return true;
}

// -----------------------------------------------------------------------------
// run()
// -----------------------------------------------------------------------------
SessionSummary SimulationEngine::run() {
  start();
  while (tick()) {
    sleeper_(config_.tick_interval_ms);
  }
  return summary_.value_or(SessionSummary{});
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void SimulationEngine::stop() {
  if (state_ == State::Stopped) {
    return;
  }

  const bool was_running = state_ == State::Running;

  // ---  1) Sinks first: the summary is printed after they are closed -------
  dispatcher_.close();

  // ---  2) Freeze the summary --------------------------------------------------
  summary_ = was_running
                 ? stats_.summarize(registry_.size(), session_clock_.now_ms())
                 : SessionSummary{};

  state_ = State::Stopped;

  std::cout << "[SimulationEngine] stopped. created=" << summary_->created
            << " active=" << summary_->active_at_cutoff << ".\n";
}

// -----------------------------------------------------------------------------
// admitNewOrder: create, register, announce
// -----------------------------------------------------------------------------
void SimulationEngine::admitNewOrder() {
  const domain::Order& order = registry_.insert(factory_.create());
  stats_.recordCreated();
  emit(order, std::nullopt);
}

// -----------------------------------------------------------------------------
// advanceDueOrders: snapshot, then apply the policy to each due order
// -----------------------------------------------------------------------------
void SimulationEngine::advanceDueOrders(std::int64_t now_ms) {
  std::vector<domain::OrderId> due = registry_.collectDue(policy_, now_ms);

  if (config_.max_transitions_per_tick > 0 &&
      due.size() > static_cast<std::size_t>(config_.max_transitions_per_tick)) {
    due.resize(static_cast<std::size_t>(config_.max_transitions_per_tick));
  }

  const std::int64_t wall_now = wall_clock_.now_ms();

  for (const auto& id : due) {
    domain::Order* order = registry_.find(id);
    if (order == nullptr) {
      continue;
    }

    std::optional<Transition> transition =
        policy_.evaluate(*order, now_ms, wall_now);
    if (!transition) {
      continue;
    }

    emit(*order, transition->from);
    stats_.recordTransition(*transition);

    if (transition->isTerminal()) {
      registry_.erase(id);
    }
  }
}

// -----------------------------------------------------------------------------
// emit: snapshot the order and fan it out
// -----------------------------------------------------------------------------
void SimulationEngine::emit(const domain::Order& order,
                            std::optional<domain::OrderStatus> previous_status) {
  OrderLifecycleEvent event;
  event.order = order;
  event.previous_status = previous_status;
  event.sequence_id = next_sequence_id_++;

  stats_.recordDispatchFailures(dispatcher_.dispatch(event));
}

std::int64_t SimulationEngine::drawArrivalDelayMs() {
  return secondsToMs(
      rng_.uniformReal(config_.min_delay_seconds, config_.max_delay_seconds));
}

// -----------------------------------------------------------------------------
// toString(State)
// -----------------------------------------------------------------------------
const char* toString(SimulationEngine::State state) {
  switch (state) {
    case SimulationEngine::State::Idle:    return "idle";
    case SimulationEngine::State::Running: return "running";
    case SimulationEngine::State::Stopped: return "stopped";
  }
  return "unknown";
}

}  // namespace orderflow
