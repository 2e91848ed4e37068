#include "pairs/eventbus/event_bus.hpp"

namespace pairs {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  const SubscriptionId id = next_id_++;
  subscribers_.push_back(Subscriber{id, std::move(callback)});
  return id;
}

void EventBus::publish(const Event& event) {
  // Iterate a snapshot: callbacks are allowed to subscribe, which would
  // invalidate iterators into subscribers_.
  const std::vector<Subscriber> snapshot = subscribers_;
  for (const auto& s : snapshot) {
    s.callback(event);
  }
}

}  // namespace pairs
