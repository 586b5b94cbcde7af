// -----------------------------------------------------------------------------
// orderflow_sim — e-commerce order lifecycle event generator.
//
// Startup:
//   1) Parse the command line (defaults, optional --config file, flags) and
//      validate. A ConfigError prints "[main] ERROR: ..." plus usage and
//      exits with status 2 before anything runs.
//   2) Build the random source (seeded if --seed / "seed" is given), the
//      monotonic session clock and the wall clock.
//   3) Create the SimulationEngine and register the sinks:
//        ConsoleSink  when console output is enabled
//        BrokerSink   when a broker endpoint and topic are configured; if
//                     the ZeroMQ client cannot be created the run continues
//                     without it
//   4) Install SIGINT/SIGTERM handlers that call engine.requestStop().
//   5) engine.run() until the session duration elapses or a signal arrives.
//   6) Print the session summary (sinks are already flushed and closed).
// -----------------------------------------------------------------------------

#include "orderflow/config/command_line.hpp"
#include "orderflow/config/config_error.hpp"
#include "orderflow/engine/simulation_engine.hpp"
#include "orderflow/random/mt_random_source.hpp"
#include "orderflow/sink/broker_sink.hpp"
#include "orderflow/sink/console_sink.hpp"
#include "orderflow/sink/zmq_broker_client.hpp"
#include "orderflow/time/live_time_provider.hpp"
#include "orderflow/time/monotonic_time_provider.hpp"

#include <zmq.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

// -----------------------------------------------------------------------------
// Global pointer for signal handler access.
// The only global in the program: a raw pointer to the stack-local engine,
// set once before the handlers are installed and cleared before the engine
// is destroyed.
// -----------------------------------------------------------------------------
static orderflow::SimulationEngine* g_engine_ptr = nullptr;

// -----------------------------------------------------------------------------
// stop_signal_handler
// -----------------------------------------------------------------------------
// @brief  SIGINT / SIGTERM handler.
//
// @details
// requestStop() is a lock-free atomic store. The loop notices it at the
// next tick boundary (within tick_interval_ms) and runs the same shutdown
// sequence as duration expiry, so the summary is still printed.
// -----------------------------------------------------------------------------
static void stop_signal_handler(int /*signum*/) {
  if (g_engine_ptr != nullptr) {
    g_engine_ptr->requestStop();
  }
}

int main(int argc, char** argv) {
  const std::string program = argc > 0 ? argv[0] : "orderflow_sim";

  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  orderflow::CommandLineOptions options;
  try {
    options = orderflow::parseCommandLine(argc, argv);
    if (options.help_requested) {
      std::cout << orderflow::usageText(program);
      return 0;
    }
    options.config.validate();
  } catch (const orderflow::ConfigError& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n\n"
              << orderflow::usageText(program);
    return 2;
  }

  const orderflow::SimulationConfig& config = options.config;

  // -------------------------------------------------------------------------
  // 2) Clocks and randomness
  // -------------------------------------------------------------------------
  orderflow::MonotonicTimeProvider session_clock;
  orderflow::LiveTimeProvider wall_clock;
  std::unique_ptr<orderflow::Mt19937RandomSource> rng =
      config.seed ? std::make_unique<orderflow::Mt19937RandomSource>(*config.seed)
                  : std::make_unique<orderflow::Mt19937RandomSource>();

  // -------------------------------------------------------------------------
  // 3) Engine and sinks
  // -------------------------------------------------------------------------
  orderflow::SimulationEngine engine(config, session_clock, wall_clock, *rng);

  if (config.hasBroker()) {
    try {
      auto client = std::make_unique<orderflow::ZmqBrokerClient>(
          config.broker_endpoint, config.broker_send_timeout_ms);
      engine.addSink(std::make_unique<orderflow::BrokerSink>(
          std::move(client), config.broker_topic));
      std::cout << "[main] Publishing events to " << config.broker_endpoint
                << " topic=" << config.broker_topic << "\n";
    } catch (const zmq::error_t& e) {
      std::cerr << "[main] WARNING: failed to create broker client for "
                << config.broker_endpoint << ": " << e.what()
                << ". Continuing without broker output.\n";
    }
  }

  if (config.consoleEnabled()) {
    engine.addSink(std::make_unique<orderflow::ConsoleSink>(std::cout));
  }

  if (engine.dispatcher().sinkCount() == 0) {
    std::cerr << "[main] WARNING: no event sink is active; events will only "
                 "be counted.\n";
  }

  // -------------------------------------------------------------------------
  // 4) Signal handlers
  // -------------------------------------------------------------------------
  g_engine_ptr = &engine;
  std::signal(SIGINT, stop_signal_handler);
  std::signal(SIGTERM, stop_signal_handler);

  // -------------------------------------------------------------------------
  // 5) Run
  // -------------------------------------------------------------------------
  std::cout << "[main] Generating orders for " << config.session_duration_minutes
            << " minute(s). Press Ctrl-C to stop early.\n";

  orderflow::SessionSummary summary = engine.run();

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  g_engine_ptr = nullptr;

  // -------------------------------------------------------------------------
  // 6) Report
  // -------------------------------------------------------------------------
  orderflow::printSummary(std::cout, summary);

  return 0;
}
