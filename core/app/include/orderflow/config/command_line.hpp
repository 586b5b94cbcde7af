#pragma once

#include "orderflow/config/simulation_config.hpp"

#include <string>

namespace orderflow {

// -----------------------------------------------------------------------------
// CommandLineOptions
// -----------------------------------------------------------------------------
// Result of parseCommandLine(): the fully layered (defaults, file, flags)
// but not yet validated configuration, plus whether --help was given.
// -----------------------------------------------------------------------------
struct CommandLineOptions {
  bool help_requested{false};
  std::string config_path;  // Empty when --config was not given
  SimulationConfig config;
};

// -----------------------------------------------------------------------------
// parseCommandLine(argc, argv)
// -----------------------------------------------------------------------------
//
// @brief  Builds the session configuration from argv.
//
// @details
// Flags:
//   --config PATH              JSON file applied before every other flag,
//                              wherever it appears on the line
//   --duration MINUTES         session_duration_minutes
//   --min-delay SECONDS        min_delay_seconds
//   --max-delay SECONDS        max_delay_seconds
//   --broker-endpoint URI      broker_endpoint
//   --topic NAME               broker_topic
//   --console / --no-console   console_output (mutually exclusive)
//   --tick-ms N                tick_interval_ms
//   --max-transitions N        max_transitions_per_tick
//   --seed N                   seed
//   --cancel-probability P     policy.cancellation_probability
//   -h, --help                 help_requested (parsing stops)
//
// @throws ConfigError on an unknown flag, a missing or malformed value, or
//         both --console and --no-console.
// -----------------------------------------------------------------------------
CommandLineOptions parseCommandLine(int argc, const char* const argv[]);

// Usage text printed for --help and after a ConfigError.
std::string usageText(const std::string& program);

}  // namespace orderflow
