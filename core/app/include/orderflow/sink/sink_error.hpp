#pragma once

#include <stdexcept>

namespace orderflow {

// -----------------------------------------------------------------------------
// SinkError
// -----------------------------------------------------------------------------
// Raised by an IEventSink when one delivery fails (broker rejected or timed
// out, stream in a failed state). SinkDispatcher catches it per sink, logs
// it and counts it; it never reaches the engine loop.
// -----------------------------------------------------------------------------
class SinkError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace orderflow
