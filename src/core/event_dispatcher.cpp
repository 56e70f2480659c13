#include "solo/event_dispatcher.hpp"
#include "solo/logger.hpp"
#include <exception>
#include <utility>
#include <vector>

namespace solo {

SubscriptionId EventDispatcher::onNewInstance(NewInstanceHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  SubscriptionId id = nextId_++;
  newInstanceHandlers_.emplace(id, std::move(handler));
  return id;
}

SubscriptionId EventDispatcher::onNewInstanceWithMessage(MessageHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  SubscriptionId id = nextId_++;
  messageHandlers_.emplace(id, std::move(handler));
  return id;
}

bool EventDispatcher::unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return newInstanceHandlers_.erase(id) + messageHandlers_.erase(id) > 0;
}

void EventDispatcher::dispatch(const std::string &payload) {
  // Snapshot so handlers may (un)subscribe without deadlocking.
  std::vector<NewInstanceHandler> plain;
  std::vector<MessageHandler> withMessage;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[id, handler] : newInstanceHandlers_)
      plain.push_back(handler);
    if (!payload.empty()) {
      for (const auto &[id, handler] : messageHandlers_)
        withMessage.push_back(handler);
    }
  }

  for (auto &handler : plain) {
    try {
      handler();
    } catch (const std::exception &e) {
      LOG_ERROR("onNewInstance handler threw: " + std::string(e.what()));
    } catch (...) {
      LOG_ERROR("onNewInstance handler threw a non-standard exception");
    }
  }

  for (auto &handler : withMessage) {
    try {
      handler(payload);
    } catch (const std::exception &e) {
      LOG_ERROR("onNewInstanceWithMessage handler threw: " +
                std::string(e.what()));
    } catch (...) {
      LOG_ERROR("onNewInstanceWithMessage handler threw a non-standard "
                "exception");
    }
  }
}

} // namespace solo
