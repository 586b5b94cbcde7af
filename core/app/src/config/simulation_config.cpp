#include "orderflow/config/simulation_config.hpp"
#include "orderflow/config/config_error.hpp"
#include "orderflow/factory/order_factory.hpp"
#include "orderflow/time/time_utils.hpp"

#include <fstream>
#include <set>
#include <string>
#include <utility>

namespace orderflow {

namespace {

void requireObject(const nlohmann::json& j, const std::string& where) {
  if (!j.is_object()) {
    throw ConfigError(where + " must be a JSON object");
  }
}

void rejectUnknownKeys(const nlohmann::json& j,
                       const std::set<std::string>& known,
                       const std::string& where) {
  for (const auto& item : j.items()) {
    if (known.count(item.key()) == 0) {
      throw ConfigError("unknown key '" + item.key() + "' in " + where);
    }
  }
}

template <typename T>
T readValue(const nlohmann::json& j, const std::string& key) {
  try {
    return j.at(key).get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("invalid value for '" + key + "': " + e.what());
  }
}

DwellRange readDwell(const nlohmann::json& j, const std::string& key) {
  const nlohmann::json& node = j.at(key);
  requireObject(node, "policy." + key);
  rejectUnknownKeys(node, {"min_seconds", "max_seconds"}, "policy." + key);

  DwellRange range;
  range.min_seconds = readValue<double>(node, "min_seconds");
  range.max_seconds = readValue<double>(node, "max_seconds");
  return range;
}

void applyPolicy(LifecyclePolicyConfig& policy, const nlohmann::json& j) {
  requireObject(j, "policy");
  rejectUnknownKeys(
      j, {"cancellation_probability", "pending", "confirmed", "processing"},
      "policy");

  if (j.contains("cancellation_probability")) {
    policy.cancellation_probability =
        readValue<double>(j, "cancellation_probability");
  }
  if (j.contains("pending")) policy.pending = readDwell(j, "pending");
  if (j.contains("confirmed")) policy.confirmed = readDwell(j, "confirmed");
  if (j.contains("processing")) policy.processing = readDwell(j, "processing");
}

domain::ProductCatalog readCatalog(const nlohmann::json& j) {
  if (!j.is_array()) {
    throw ConfigError("catalog must be a JSON array");
  }

  domain::ProductCatalog catalog;
  for (const auto& entry : j) {
    requireObject(entry, "catalog entry");
    rejectUnknownKeys(entry, {"id", "name", "min_price", "max_price"},
                      "catalog entry");

    domain::Product product;
    product.id = readValue<std::string>(entry, "id");
    product.name = readValue<std::string>(entry, "name");
    product.min_price = readValue<double>(entry, "min_price");
    product.max_price = readValue<double>(entry, "max_price");
    catalog.push_back(std::move(product));
  }
  return catalog;
}

}  // namespace

// -----------------------------------------------------------------------------
// validate
// -----------------------------------------------------------------------------
void SimulationConfig::validate() const {
  if (!isValidIntervalSeconds(session_duration_minutes * 60.0)) {
    throw ConfigError("session duration must be a finite, non-negative "
                      "number of minutes no longer than " +
                      std::to_string(kMaxIntervalSeconds / 60.0));
  }
  if (!isValidIntervalSeconds(min_delay_seconds) ||
      !isValidIntervalSeconds(max_delay_seconds)) {
    throw ConfigError("arrival delays must be finite, non-negative and at "
                      "most " + std::to_string(kMaxIntervalSeconds) + " s");
  }
  if (min_delay_seconds > max_delay_seconds) {
    throw ConfigError("min delay (" + std::to_string(min_delay_seconds) +
                      " s) must not exceed max delay (" +
                      std::to_string(max_delay_seconds) + " s)");
  }
  if (broker_endpoint.empty() != broker_topic.empty()) {
    throw ConfigError("broker endpoint and broker topic must be given "
                      "together");
  }
  if (broker_send_timeout_ms <= 0) {
    throw ConfigError("broker send timeout must be positive");
  }
  if (tick_interval_ms <= 0) {
    throw ConfigError("tick interval must be positive");
  }
  if (max_transitions_per_tick < 0) {
    throw ConfigError("max transitions per tick must be >= 0");
  }

  policy.validate();
  validateCatalog(catalog);
}

// -----------------------------------------------------------------------------
// applyJson
// -----------------------------------------------------------------------------
void applyJson(SimulationConfig& config, const nlohmann::json& j) {
  requireObject(j, "configuration");
  rejectUnknownKeys(
      j,
      {"session_duration_minutes", "min_delay_seconds", "max_delay_seconds",
       "broker_endpoint", "broker_topic", "broker_send_timeout_ms",
       "console_output", "tick_interval_ms", "max_transitions_per_tick",
       "seed", "policy", "catalog"},
      "configuration");

  if (j.contains("session_duration_minutes")) {
    config.session_duration_minutes =
        readValue<double>(j, "session_duration_minutes");
  }
  if (j.contains("min_delay_seconds")) {
    config.min_delay_seconds = readValue<double>(j, "min_delay_seconds");
  }
  if (j.contains("max_delay_seconds")) {
    config.max_delay_seconds = readValue<double>(j, "max_delay_seconds");
  }
  if (j.contains("broker_endpoint")) {
    config.broker_endpoint = readValue<std::string>(j, "broker_endpoint");
  }
  if (j.contains("broker_topic")) {
    config.broker_topic = readValue<std::string>(j, "broker_topic");
  }
  if (j.contains("broker_send_timeout_ms")) {
    config.broker_send_timeout_ms = readValue<int>(j, "broker_send_timeout_ms");
  }
  if (j.contains("console_output")) {
    config.console_output = readValue<bool>(j, "console_output");
  }
  if (j.contains("tick_interval_ms")) {
    config.tick_interval_ms = readValue<int>(j, "tick_interval_ms");
  }
  if (j.contains("max_transitions_per_tick")) {
    config.max_transitions_per_tick =
        readValue<int>(j, "max_transitions_per_tick");
  }
  if (j.contains("seed")) {
    if (!j.at("seed").is_number_unsigned()) {
      throw ConfigError("invalid value for 'seed': expected a non-negative "
                        "integer");
    }
    config.seed = j.at("seed").get<std::uint64_t>();
  }
  if (j.contains("policy")) {
    applyPolicy(config.policy, j.at("policy"));
  }
  if (j.contains("catalog")) {
    config.catalog = readCatalog(j.at("catalog"));
  }
}

// -----------------------------------------------------------------------------
// loadConfigFile
// -----------------------------------------------------------------------------
void loadConfigFile(SimulationConfig& config, const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open configuration file '" + path + "'");
  }

  nlohmann::json j;
  try {
    j = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("malformed configuration file '" + path +
                      "': " + e.what());
  }

  try {
    applyJson(config, j);
  } catch (const ConfigError& e) {
    throw ConfigError(path + ": " + e.what());
  }
}

}  // namespace orderflow
