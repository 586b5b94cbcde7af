#pragma once

#include "orderflow/config/simulation_config.hpp"
#include "orderflow/events/order_lifecycle_event.hpp"
#include "orderflow/factory/order_factory.hpp"
#include "orderflow/factory/order_id_generator.hpp"
#include "orderflow/lifecycle/lifecycle_policy.hpp"
#include "orderflow/random/i_random_source.hpp"
#include "orderflow/registry/active_order_registry.hpp"
#include "orderflow/sink/sink_dispatcher.hpp"
#include "orderflow/stats/session_statistics.hpp"
#include "orderflow/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace orderflow {

// -----------------------------------------------------------------------------
// SimulationEngine
// -----------------------------------------------------------------------------
//
// @brief  Runs one bounded simulation session: admits new orders at random
//         intervals, advances every in-flight order through its lifecycle,
//         fans each change out to the sinks and reports the session at the
//         end.
//
// @details
// Session states:
//
//   Idle ──start()──> Running ──(duration elapsed | requestStop())──> Stopped
//
// One tick (tick()):
//   1. now = session clock. If a stop was requested or
//      now - start >= session duration: run the shutdown sequence, return
//      false. No order is admitted on this tick.
//   2. Arrival. If now >= next arrival: OrderFactory::create(), insert into
//      the registry, dispatch the creation event, count it, and schedule
//      the next arrival at now + uniform(min_delay, max_delay).
//   3. Snapshot the ids of every due order (ActiveOrderRegistry::collectDue)
//      before any of them is mutated.
//   4. For each snapshotted id (at most max_transitions_per_tick when that
//      cap is non-zero; the rest stay due for the next tick): apply the
//      lifecycle policy, dispatch the event, count the status update and,
//      if the order is now terminal, remove it from the registry and count
//      the outcome.
//   5. Return true.
//
// Shutdown sequence (stop(), exactly once):
//   flush + close every sink, freeze the SessionSummary, enter Stopped.
//   Duration expiry, requestStop() and the destructor all take this path.
//
// Clocks:
//   session_clock  elapsed session time, dwell gating, arrival schedule
//                  (MonotonicTimeProvider in production)
//   wall_clock     payload timestamps (LiveTimeProvider in production)
//   Tests pass one SimulationTimeProvider for both and call tick() directly
//   after advancing it, or run() with a sleeper that advances it.
//
// Thread model:
//   Single-threaded and cooperative. Every member except stop_requested_
//   is touched only from the thread that calls start()/tick()/run().
//   requestStop() is an atomic store and may be called from any thread or
//   from a signal handler.
//
// Ownership:
//   SimulationEngine
//    ├── config_       (SimulationConfig, value)
//    ├── id_gen_       (OrderIdGenerator, value, non-movable)
//    ├── policy_       (LifecyclePolicy, value)
//    ├── factory_      (OrderFactory, value, references id_gen_ and policy_)
//    ├── registry_     (ActiveOrderRegistry, value)
//    ├── dispatcher_   (SinkDispatcher, owns the sinks)
//    └── stats_        (SessionStatistics, value)
//   The clocks and the random source are borrowed and must outlive the
//   engine. Member order matters: policy_ and id_gen_ are declared before
//   factory_.
// -----------------------------------------------------------------------------
class SimulationEngine {
 public:
  enum class State { Idle, Running, Stopped };

  // Blocks the loop thread for the given number of milliseconds between
  // ticks.
  using Sleeper = std::function<void(std::int64_t)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @brief  Validates the configuration and builds the components.
  //
  // @param  config         Session configuration. validate() is called here.
  // @param  session_clock  Monotonic time source for scheduling.
  // @param  wall_clock     Wall time source for payload timestamps.
  // @param  rng            Random source for every draw in the session.
  // @param  sleeper        Inter-tick wait used by run(). Defaults to
  //                        std::this_thread::sleep_for.
  //
  // @throws ConfigError if the configuration is invalid.
  //
  // No sinks are registered; call addSink() before start().
  // -------------------------------------------------------------------------
  SimulationEngine(SimulationConfig config, const ITimeProvider& session_clock,
                   const ITimeProvider& wall_clock, IRandomSource& rng,
                   Sleeper sleeper = {});

  // Destructor calls stop() for RAII safety.
  ~SimulationEngine();

  SimulationEngine(const SimulationEngine&) = delete;
  SimulationEngine& operator=(const SimulationEngine&) = delete;
  SimulationEngine(SimulationEngine&&) = delete;
  SimulationEngine& operator=(SimulationEngine&&) = delete;

  // -------------------------------------------------------------------------
  // addSink(sink)
  // -------------------------------------------------------------------------
  // @brief  Registers an event destination. Forwarded to SinkDispatcher.
  // @throws std::logic_error once the engine is Stopped.
  // -------------------------------------------------------------------------
  SinkDispatcher::SinkId addSink(std::unique_ptr<IEventSink> sink);

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Idle -> Running. Captures the session start, resets the
  //         statistics and schedules the first arrival at
  //         start + uniform(min_delay, max_delay).
  //
  // Idempotent: does nothing if the engine is Running or Stopped.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // tick()
  // -------------------------------------------------------------------------
  // @brief  One scheduler iteration (see class comment).
  // @return true while the session is still running.
  // @throws std::logic_error if called before start().
  // -------------------------------------------------------------------------
  bool tick();

  // -------------------------------------------------------------------------
  // run()
  // -------------------------------------------------------------------------
  // @brief  start(), then tick() every tick_interval_ms until the session
  //         ends. Returns the frozen summary.
  // -------------------------------------------------------------------------
  SessionSummary run();

  // -------------------------------------------------------------------------
  // requestStop()
  // -------------------------------------------------------------------------
  // @brief  Asks the loop to stop at the next tick boundary. The shutdown
  //         path is identical to duration expiry.
  //
  // Thread-safety: async-signal-safe (lock-free atomic store).
  // -------------------------------------------------------------------------
  void requestStop() noexcept {
    stop_requested_.store(true, std::memory_order_relaxed);
  }

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Shutdown sequence. Runs exactly once; later calls are no-ops.
  //
  // @details
  // Steps:
  //   1. Flush and close every sink (SinkDispatcher::close()).
  //   2. Freeze the SessionSummary from the statistics and the registry
  //      size at cutoff.
  //   3. Enter Stopped.
  // Stopping an engine that never started yields an all-zero summary.
  // -------------------------------------------------------------------------
  void stop();

  State state() const { return state_; }
  bool stopRequested() const {
    return stop_requested_.load(std::memory_order_relaxed);
  }

  // Valid once the engine is Stopped.
  const std::optional<SessionSummary>& summary() const { return summary_; }

  const SimulationConfig& config() const { return config_; }
  const ActiveOrderRegistry& registry() const { return registry_; }
  const SessionStatistics& statistics() const { return stats_; }
  const SinkDispatcher& dispatcher() const { return dispatcher_; }

  std::int64_t nextArrivalMs() const { return next_arrival_ms_; }

 private:
  void admitNewOrder();
  void advanceDueOrders(std::int64_t now_ms);
  void emit(const domain::Order& order,
            std::optional<domain::OrderStatus> previous_status);
  std::int64_t drawArrivalDelayMs();

  const SimulationConfig config_;
  const ITimeProvider& session_clock_;
  const ITimeProvider& wall_clock_;
  IRandomSource& rng_;
  Sleeper sleeper_;

  OrderIdGenerator id_gen_;
  LifecyclePolicy policy_;
  OrderFactory factory_;
  ActiveOrderRegistry registry_;
  SinkDispatcher dispatcher_;
  SessionStatistics stats_;

  State state_{State::Idle};
  std::atomic<bool> stop_requested_{false};

  std::int64_t start_ms_{0};
  std::int64_t duration_ms_{0};
  std::int64_t next_arrival_ms_{0};
  std::uint64_t next_sequence_id_{0};

  std::optional<SessionSummary> summary_;
};

const char* toString(SimulationEngine::State state);

}  // namespace orderflow
