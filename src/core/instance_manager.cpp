#include "solo/instance_manager.hpp"
#include "solo/errors.hpp"
#include "solo/logger.hpp"
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace solo {

InstanceManager::InstanceManager(std::string identity, ManagerOptions options)
    : identity_(std::move(identity)), options_(std::move(options)),
      paths_(options_.runtimeDir) {
  RuntimePaths::validateIdentity(identity_);
  LOG_DEBUG("Instance manager for '" + identity_ + "' uses " +
            paths_.dir().string());
}

InstanceManager::~InstanceManager() { stop(); }

InstanceClaim &InstanceManager::claimLocked() {
  if (!claim_) {
    claim_ = std::make_unique<InstanceClaim>(paths_.claimFile(identity_));
  }
  return *claim_;
}

bool InstanceManager::isPrimary() {
  std::lock_guard<std::mutex> lock(mutex_);
  return claim_ && claim_->isHeld();
}

bool InstanceManager::checkAnotherInstance(
    bool exitOnFound, const std::optional<std::string> &message) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (claimLocked().tryAcquire()) {
      Logger::instance().setRole("primary");
      return false;
    }
  }

  Logger::instance().setRole("secondary");
  LOG_INFO("The application is already running.");

  try {
    if (!notifyEndpoint(paths_.channelFile(identity_), message,
                        options_.channel.connectTimeout)) {
      LOG_WARN("Primary instance closed the channel before the message was "
               "fully sent");
    }
  } catch (const ConnectError &e) {
    LOG_WARN("Could not notify the primary instance: " + std::string(e.what()));

    if (options_.reclaimOnUnreachable) {
      std::lock_guard<std::mutex> lock(mutex_);
      if (claimLocked().tryAcquire()) {
        Logger::instance().setRole("primary");
        LOG_INFO("Previous primary instance is gone; taking over");
        return false;
      }
    }
    if (!exitOnFound)
      throw;
  }

  if (exitOnFound) {
    LOG_INFO("Exiting because another instance is running");
    std::exit(EXIT_SUCCESS);
  }
  return true;
}

bool InstanceManager::checkAnotherInstance(bool exitOnFound) {
  return checkAnotherInstance(exitOnFound, std::nullopt);
}

bool InstanceManager::checkAnotherInstance(const std::string &message) {
  return checkAnotherInstance(true, message);
}

bool InstanceManager::checkAnotherInstance(const char *message) {
  return checkAnotherInstance(std::string(message));
}

bool InstanceManager::checkAnotherInstance() {
  return checkAnotherInstance(true);
}

std::unique_ptr<ChannelServer> InstanceManager::makeBoundServerLocked() {
  if (listening_) {
    throw std::logic_error("Already waiting for other instances of '" +
                           identity_ + "'");
  }
  if (!claim_ || !claim_->isHeld()) {
    throw ChannelBindError("Only the primary instance of '" + identity_ +
                           "' may listen for other instances");
  }
  auto server = std::make_unique<ChannelServer>(paths_.channelFile(identity_),
                                                events_, options_.channel);
  server->bind();
  return server;
}

void InstanceManager::waitForOtherInstances() {
  std::unique_ptr<ChannelServer> server;
  std::stop_token token;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    server = makeBoundServerLocked();
    foregroundStop_ = std::stop_source();
    token = foregroundStop_.get_token();
    listening_ = true;
  }

  try {
    server->run(token);
  } catch (...) {
    listening_ = false;
    throw;
  }
  listening_ = false;
}

void InstanceManager::waitForOtherInstances(bool runInBackground) {
  if (!runInBackground) {
    waitForOtherInstances();
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (!listening_) {
    // Reap a loop that ended on its own before replacing its server.
    background_.stop();
  }
  server_ = makeBoundServerLocked();
  listening_ = true;

  ChannelServer *server = server_.get();
  background_.start([this, server](std::stop_token token) {
    try {
      server->run(token);
    } catch (...) {
      listening_ = false;
      throw;
    }
    listening_ = false;
  });
}

void InstanceManager::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    foregroundStop_.request_stop();
  }
  background_.stop();
}

std::unique_ptr<InstanceManager>
newInstanceManager(const std::string &identity, ManagerOptions options) {
  return std::make_unique<InstanceManager>(identity, std::move(options));
}

} // namespace solo
