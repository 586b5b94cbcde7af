#pragma once

#include "orderflow/domain/product.hpp"
#include "orderflow/lifecycle/lifecycle_policy_config.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace orderflow {

// -----------------------------------------------------------------------------
// SimulationConfig — every tunable of one simulation session
// -----------------------------------------------------------------------------
//
// @brief  Session duration, arrival delays, output routing, loop cadence,
//         lifecycle policy and product catalog.
//
// @details
// Layering (later wins):
//   1. built-in defaults (the member initializers below)
//   2. an optional JSON file   (applyJson / loadConfigFile)
//   3. command-line flags      (parseCommandLine, command_line.hpp)
// validate() runs once after all layers are applied and before the engine
// is constructed.
//
// Output routing:
//   The broker is configured by broker_endpoint and broker_topic together;
//   setting only one of them is a ConfigError. console_output left unset
//   means "on unless a broker is configured" (see consoleEnabled()).
//
// Thread model:
//   Plain data with value semantics, copied into SimulationEngine.
// -----------------------------------------------------------------------------
struct SimulationConfig {
  double session_duration_minutes{5.0};   // >= 0, fractional allowed
  double min_delay_seconds{1.0};          // Between consecutive arrivals
  double max_delay_seconds{60.0};

  std::string broker_endpoint;            // e.g. "tcp://localhost:5557"
  std::string broker_topic;               // e.g. "ecommerce-sales"
  int broker_send_timeout_ms{10'000};

  std::optional<bool> console_output;     // Unset: on unless broker

  int tick_interval_ms{100};              // Loop cadence, > 0
  int max_transitions_per_tick{0};        // 0 = unlimited

  std::optional<std::uint64_t> seed;      // Unset: std::random_device

  LifecyclePolicyConfig policy;
  domain::ProductCatalog catalog{domain::defaultCatalog()};

  bool hasBroker() const {
    return !broker_endpoint.empty() && !broker_topic.empty();
  }

  bool consoleEnabled() const { return console_output.value_or(!hasBroker()); }

  // -------------------------------------------------------------------------
  // validate()
  // -------------------------------------------------------------------------
  // @throws ConfigError if:
  //   - session_duration_minutes or a delay is NaN, infinite, negative or
  //     longer than kMaxIntervalSeconds (time_utils.hpp)
  //   - min_delay_seconds > max_delay_seconds
  //   - exactly one of broker_endpoint / broker_topic is set
  //   - broker_send_timeout_ms <= 0 or tick_interval_ms <= 0
  //   - max_transitions_per_tick < 0
  //   - the policy or the catalog is invalid
  // -------------------------------------------------------------------------
  void validate() const;
};

// -----------------------------------------------------------------------------
// applyJson(config, j)
// -----------------------------------------------------------------------------
//
// @brief  Overlays the keys present in j onto config.
//
// @details
// Recognized keys mirror the struct members:
//   session_duration_minutes, min_delay_seconds, max_delay_seconds,
//   broker_endpoint, broker_topic, broker_send_timeout_ms, console_output,
//   tick_interval_ms, max_transitions_per_tick, seed,
//   policy { cancellation_probability,
//            pending|confirmed|processing { min_seconds, max_seconds } },
//   catalog [ { id, name, min_price, max_price }, ... ]
//
// A "catalog" array replaces the built-in catalog wholesale.
//
// @throws ConfigError on a non-object document, an unknown key, or a value
//         of the wrong type.
// -----------------------------------------------------------------------------
void applyJson(SimulationConfig& config, const nlohmann::json& j);

// -----------------------------------------------------------------------------
// loadConfigFile(config, path)
// -----------------------------------------------------------------------------
// Reads and parses path, then applyJson(). I/O and parse errors are
// reported as ConfigError naming the file.
// -----------------------------------------------------------------------------
void loadConfigFile(SimulationConfig& config, const std::string& path);

}  // namespace orderflow
