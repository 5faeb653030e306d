#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

#include "claim_event.hpp"

namespace claims::events {

/*
  In-process publish/subscribe for claim events.

  Publish() snapshots the subscriber list under the lock and invokes the
  handlers outside it, so a handler may publish or (un)subscribe. A throwing
  handler is logged and does not affect the other subscribers or the
  publisher.
*/
class EventBus {
 public:
  using Handler        = std::function<void(const ClaimEvent&)>;
  using SubscriptionId = std::uint64_t;

  SubscriptionId Subscribe(Handler handler);
  SubscriptionId Subscribe(EventKind kind, Handler handler);
  bool           Unsubscribe(SubscriptionId id);

  void Publish(const ClaimEvent& event);

  std::size_t SubscriberCount() const;

 private:
  struct Subscription {
    SubscriptionId           id;
    std::optional<EventKind> kind;
    Handler                  handler;
  };

  mutable std::mutex        mutex_;
  std::vector<Subscription> subscriptions_;
  SubscriptionId            next_id_ = 1;
};

} // namespace claims::events
