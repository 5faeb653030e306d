#include "event_bus.hpp"

#include <algorithm>
#include <exception>

#include "internal/observability/logging.hpp"

namespace claims::events {

EventBus::SubscriptionId EventBus::Subscribe(Handler handler) {
  std::lock_guard lock(mutex_);
  const auto      id = next_id_++;
  subscriptions_.push_back({id, std::nullopt, std::move(handler)});
  return id;
}

EventBus::SubscriptionId EventBus::Subscribe(EventKind kind, Handler handler) {
  std::lock_guard lock(mutex_);
  const auto      id = next_id_++;
  subscriptions_.push_back({id, kind, std::move(handler)});
  return id;
}

bool EventBus::Unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(), [id](const Subscription& s) {
    return s.id == id;
  });
  if (it == subscriptions_.end()) return false;
  subscriptions_.erase(it);
  return true;
}

void EventBus::Publish(const ClaimEvent& event) {
  std::vector<Subscription> targets;
  {
    std::lock_guard lock(mutex_);
    for (const auto& s : subscriptions_) {
      if (!s.kind || *s.kind == event.kind) targets.push_back(s);
    }
  }

  for (const auto& s : targets) {
    try {
      s.handler(event);
    } catch (const std::exception& e) {
      CLAIMS_LOG_ERROR("event subscriber failed", {observability::StringField("event", ToString(event.kind)),
                                                   observability::StringField("claim_id", event.claim_id),
                                                   observability::CountField("subscription", s.id),
                                                   observability::StringField("error", e.what())});
    }
  }
}

std::size_t EventBus::SubscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscriptions_.size();
}

} // namespace claims::events
