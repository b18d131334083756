#include "sentinel/eventbus/event_bus.hpp"

#include <algorithm>

namespace sentinel {

EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  return add(std::nullopt, std::move(callback));
}

EventBus::SubscriptionId EventBus::add(std::optional<std::size_t> index,
                                       GenericCallback callback) {
  std::lock_guard lock(mutex_);
  SubscriptionId id = next_id_++;
  subscribers_.push_back(SubscriberEntry{id, index, std::move(callback)});
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  subscribers_.erase(
      std::remove_if(subscribers_.begin(), subscribers_.end(),
                     [id](const SubscriberEntry& e) { return e.id == id; }),
      subscribers_.end());
}

// -----------------------------------------------------------------------------
// publish: copy matching subscribers under the lock, call them outside it
// -----------------------------------------------------------------------------
void EventBus::publish(const Event& event) {
  std::vector<GenericCallback> matching;
  {
    std::lock_guard lock(mutex_);
    for (const auto& entry : subscribers_) {
      if (!entry.index || *entry.index == event.index()) {
        matching.push_back(entry.callback);
      }
    }
  }
  for (const auto& callback : matching) {
    callback(event);
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscribers_.size();
}

}  // namespace sentinel
