#pragma once

#include <stdexcept>

namespace orderflow {

// -----------------------------------------------------------------------------
// ConfigError
// -----------------------------------------------------------------------------
// Responsibility: Fatal startup validation failure (bad flag combination,
// out-of-range value, unreadable or malformed configuration file).
//
// Derives from std::invalid_argument so generic handlers still catch it;
// main() catches it specifically to print the message and exit with a
// non-zero status before the simulation loop starts.
// -----------------------------------------------------------------------------
class ConfigError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

}  // namespace orderflow
