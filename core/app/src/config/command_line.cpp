#include "orderflow/config/command_line.hpp"
#include "orderflow/config/config_error.hpp"

#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace orderflow {

namespace {

double parseDouble(const std::string& flag, const std::string& text) {
  try {
    std::size_t used = 0;
    double value = std::stod(text, &used);
    if (used == text.size()) {
      return value;
    }
  } catch (const std::logic_error&) {
    // std::invalid_argument / std::out_of_range: reported below.
  }
  throw ConfigError(flag + " expects a number, got '" + text + "'");
}

long long parseInteger(const std::string& flag, const std::string& text) {
  try {
    std::size_t used = 0;
    long long value = std::stoll(text, &used);
    if (used == text.size()) {
      return value;
    }
  } catch (const std::logic_error&) {
    // std::invalid_argument / std::out_of_range: reported below.
  }
  throw ConfigError(flag + " expects an integer, got '" + text + "'");
}

int parseInt(const std::string& flag, const std::string& text) {
  long long value = parseInteger(flag, text);
  if (value < std::numeric_limits<int>::min() ||
      value > std::numeric_limits<int>::max()) {
    throw ConfigError(flag + " value out of range: '" + text + "'");
  }
  return static_cast<int>(value);
}

std::uint64_t parseSeed(const std::string& flag, const std::string& text) {
  if (text.empty() || text[0] == '-') {
    throw ConfigError(flag + " expects a non-negative integer, got '" + text +
                      "'");
  }
  try {
    std::size_t used = 0;
    unsigned long long value = std::stoull(text, &used);
    if (used == text.size()) {
      return static_cast<std::uint64_t>(value);
    }
  } catch (const std::logic_error&) {
    // std::invalid_argument / std::out_of_range: reported below.
  }
  throw ConfigError(flag + " expects a non-negative integer, got '" + text +
                    "'");
}

}  // namespace

// -----------------------------------------------------------------------------
// parseCommandLine: file first, then flags in order
// -----------------------------------------------------------------------------
CommandLineOptions parseCommandLine(int argc, const char* const argv[]) {
  CommandLineOptions options;

  auto valueOf = [&](int& i, const std::string& flag) -> std::string {
    if (i + 1 >= argc) {
      throw ConfigError(flag + " requires a value");
    }
    return argv[++i];
  };

  // Pass 1: help and the configuration file.
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      options.help_requested = true;
      return options;
    }
    if (arg == "--config") {
      options.config_path = valueOf(i, arg);
    }
  }

  if (!options.config_path.empty()) {
    loadConfigFile(options.config, options.config_path);
  }

  // Pass 2: individual flags override the file.
  SimulationConfig& cfg = options.config;
  bool console_flag = false;
  bool no_console_flag = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config") {
      ++i;
    } else if (arg == "--duration") {
      cfg.session_duration_minutes = parseDouble(arg, valueOf(i, arg));
    } else if (arg == "--min-delay") {
      cfg.min_delay_seconds = parseDouble(arg, valueOf(i, arg));
    } else if (arg == "--max-delay") {
      cfg.max_delay_seconds = parseDouble(arg, valueOf(i, arg));
    } else if (arg == "--broker-endpoint") {
      cfg.broker_endpoint = valueOf(i, arg);
    } else if (arg == "--topic") {
      cfg.broker_topic = valueOf(i, arg);
    } else if (arg == "--console") {
      console_flag = true;
    } else if (arg == "--no-console") {
      no_console_flag = true;
    } else if (arg == "--tick-ms") {
      cfg.tick_interval_ms = parseInt(arg, valueOf(i, arg));
    } else if (arg == "--max-transitions") {
      cfg.max_transitions_per_tick = parseInt(arg, valueOf(i, arg));
    } else if (arg == "--seed") {
      cfg.seed = parseSeed(arg, valueOf(i, arg));
    } else if (arg == "--cancel-probability") {
      cfg.policy.cancellation_probability = parseDouble(arg, valueOf(i, arg));
    } else {
      throw ConfigError("unknown argument '" + arg + "'");
    }
  }

  if (console_flag && no_console_flag) {
    throw ConfigError("--console and --no-console are mutually exclusive");
  }
  if (console_flag) {
    cfg.console_output = true;
  } else if (no_console_flag) {
    cfg.console_output = false;
  }

  return options;
}

// -----------------------------------------------------------------------------
// usageText
// -----------------------------------------------------------------------------
std::string usageText(const std::string& program) {
  std::ostringstream out;
  out << "Usage: " << program << " [options]\n"
      << "\n"
      << "Simulates e-commerce orders moving through\n"
      << "pending -> confirmed -> processing -> shipped (or cancelled)\n"
      << "and emits one JSON event per lifecycle change.\n"
      << "\n"
      << "Options:\n"
      << "  --config PATH             JSON configuration file\n"
      << "  --duration MINUTES        session length (default 5)\n"
      << "  --min-delay SECONDS       min delay between new orders "
         "(default 1)\n"
      << "  --max-delay SECONDS       max delay between new orders "
         "(default 60)\n"
      << "  --broker-endpoint URI     ZeroMQ endpoint of the event "
         "collector\n"
      << "  --topic NAME              topic frame sent with every event\n"
      << "  --console                 print events (default unless a broker "
         "is set)\n"
      << "  --no-console              do not print events\n"
      << "  --tick-ms N               loop cadence in ms (default 100)\n"
      << "  --max-transitions N       cap per tick, 0 = unlimited "
         "(default 0)\n"
      << "  --seed N                  fixed random seed\n"
      << "  --cancel-probability P    per-check cancellation probability "
         "(default 0.08)\n"
      << "  -h, --help                show this help\n"
      << "\n"
      << "Examples:\n"
      << "  " << program << "\n"
      << "  " << program
      << " --broker-endpoint tcp://localhost:5557 --topic ecommerce-sales\n"
      << "  " << program << " --duration 10 --min-delay 2 --max-delay 30\n";
  return out.str();
}

}  // namespace orderflow
