#ifndef SOLO_EVENT_DISPATCHER_HPP
#define SOLO_EVENT_DISPATCHER_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace solo {

using SubscriptionId = std::uint64_t;

// Fan-out of "new instance" notifications to registered handlers.
// Handlers run on whichever thread calls dispatch(), normally the listener
// thread; marshaling to a UI thread is up to the subscriber.
class EventDispatcher {
public:
  using NewInstanceHandler = std::function<void()>;
  using MessageHandler = std::function<void(const std::string &)>;

  SubscriptionId onNewInstance(NewInstanceHandler handler);
  SubscriptionId onNewInstanceWithMessage(MessageHandler handler);

  // Returns false if the id is unknown (already removed).
  bool unsubscribe(SubscriptionId id);

  // Fires every onNewInstance handler, then, for a non-empty payload, every
  // onNewInstanceWithMessage handler.
  void dispatch(const std::string &payload);

private:
  std::mutex mutex_;
  SubscriptionId nextId_ = 1;
  std::map<SubscriptionId, NewInstanceHandler> newInstanceHandlers_;
  std::map<SubscriptionId, MessageHandler> messageHandlers_;
};

} // namespace solo

#endif // SOLO_EVENT_DISPATCHER_HPP
