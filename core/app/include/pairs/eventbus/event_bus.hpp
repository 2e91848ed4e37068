#pragma once

#include "pairs/events/event.hpp"

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace pairs {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
//
// @brief  Synchronous publish-subscribe channel for one simulation run.
//
// @details
// The PositionLedger and SimulationEngine publish what happened (opens,
// closes, skipped entries, daily snapshots); logging, reporting and tests
// subscribe without the publishers knowing about them.
//
// Each SimulationEngine owns its bus, and a run is single-threaded, so the
// bus has no lock. Strategy variants running concurrently each publish on
// their own bus. Subscribers that share state across buses (e.g. one
// std::cout) must synchronize themselves.
//
// Subscriptions live as long as the bus. Dispatch order is subscription
// order. A callback may subscribe during publish(); the new subscriber
// receives events from the next publish().
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  // Registers a callback for every event kind.
  SubscriptionId subscribe(GenericCallback callback);

  // Registers a callback invoked only for events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  void publish(const Event& event);

  std::size_t subscriberCount() const { return subscribers_.size(); }

 private:
  struct Subscriber {
    SubscriptionId id;
    GenericCallback callback;
  };

  SubscriptionId next_id_{0};
  std::vector<Subscriber> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  return subscribe(GenericCallback(
      [cb = std::move(callback)](const Event& event) {
        if (const auto* typed = std::get_if<EventType>(&event)) {
          cb(*typed);
        }
      }));
}

}  // namespace pairs
