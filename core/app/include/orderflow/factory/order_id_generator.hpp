#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace orderflow {

// -----------------------------------------------------------------------------
// OrderIdGenerator — collision-free order identifier source
// -----------------------------------------------------------------------------
//
// @brief  Produces unique order identifiers of the form "ORD-NNNNNNNN" from
//         an atomic counter.
//
// @details
// The counter starts at kFirstSequence (10000000) so that every identifier
// has the familiar eight-digit shape. Each call to next_id() returns a value
// different from every previous call on the same generator, which is what
// makes the registry's "keyed by identity" contract safe: a duplicate key
// can only come from a programming error, never from an unlucky draw.
//
// Identifiers are sequential, never random: the registry rejects a
// duplicate id, so two orders must never share one.
//
// Thread model:
//   next_id() is safe to call concurrently from any number of threads.
//
// Ownership:
//   Owned by value by SimulationEngine and passed by reference to
//   OrderFactory.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  static constexpr std::uint64_t kFirstSequence = 10'000'000;

  explicit OrderIdGenerator(std::uint64_t first_sequence = kFirstSequence)
      : next_sequence_(first_sequence) {}

  // Non-copyable, non-movable: copying an ID generator would create two
  // sources producing duplicate IDs.
  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  // -------------------------------------------------------------------------
  // next_id()
  // -------------------------------------------------------------------------
  // @brief  Returns the next unique identifier, e.g. "ORD-10000000".
  //
  // @details
  // fetch_add(1, relaxed): only uniqueness is required, no ordering with
  // other memory operations.
  // -------------------------------------------------------------------------
  std::string next_id() {
    return "ORD-" +
           std::to_string(next_sequence_.fetch_add(1, std::memory_order_relaxed));
  }

 private:
  std::atomic<std::uint64_t> next_sequence_;
};

}  // namespace orderflow
