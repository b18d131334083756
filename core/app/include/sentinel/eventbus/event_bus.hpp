#pragma once

#include "sentinel/events/event.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace sentinel {

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
//
// @brief  Publish-subscribe channel for engine notifications.
//
// @details
// Subscribers register either for every event or for one alternative of the
// Event variant. Typed subscriptions are filtered by variant index before the
// callback is invoked, so a subscriber for KillSwitchEvent is never called
// for fills.
//
// Thread model:
//   subscribe, unsubscribe and publish are safe from any thread. Callbacks
//   run synchronously on the publishing thread. The subscriber list is copied
//   under the lock and callbacks run without it, so a callback may publish or
//   unsubscribe without deadlocking.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  SubscriptionId subscribe(GenericCallback callback);

  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  struct SubscriberEntry {
    SubscriptionId id{0};
    std::optional<std::size_t> index;  // nullopt: every alternative
    GenericCallback callback;
  };

  SubscriptionId add(std::optional<std::size_t> index,
                     GenericCallback callback);

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::vector<SubscriberEntry> subscribers_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  const std::size_t index = Event(std::in_place_type<EventType>).index();
  GenericCallback wrapped = [cb = std::move(callback)](const Event& event) {
    if (const auto* ptr = std::get_if<EventType>(&event)) {
      cb(*ptr);
    }
  };
  return add(index, std::move(wrapped));
}

}  // namespace sentinel
