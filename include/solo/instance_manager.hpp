#ifndef SOLO_INSTANCE_MANAGER_HPP
#define SOLO_INSTANCE_MANAGER_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>

#include "solo/event_dispatcher.hpp"
#include "solo/instance_claim.hpp"
#include "solo/listener_task.hpp"
#include "solo/notification_channel.hpp"
#include "solo/runtime_paths.hpp"

namespace solo {

struct ManagerOptions {
  // Empty: SOLO_RUNTIME_DIR, XDG_RUNTIME_DIR, then the temp directory.
  std::string runtimeDir;
  ChannelOptions channel;
  // When the claim is held but nobody answers on the channel, retry the
  // claim once before treating this process as secondary.
  bool reclaimOnUnreachable = false;
};

// Single-instance coordination for one application identity.
//
// Typical startup:
//
//   auto manager = solo::newInstanceManager(appId);
//   manager->events().onNewInstanceWithMessage(showArgs);
//   if (!manager->checkAnotherInstance(true, joinedArgs))
//     manager->waitForOtherInstances(true);
//
// Event handlers run on the listener thread.
class InstanceManager {
public:
  using Options = ManagerOptions;

  explicit InstanceManager(std::string identity,
                           ManagerOptions options = ManagerOptions());
  ~InstanceManager();

  InstanceManager(const InstanceManager &) = delete;
  InstanceManager &operator=(const InstanceManager &) = delete;

  // Returns false if this process now holds the claim (it is the primary).
  // Otherwise notifies the primary with message and, if exitOnFound,
  // terminates the process with EXIT_SUCCESS whether or not the primary
  // answered. Returns true when it does not exit.
  // Throws ConnectError when the primary is unreachable and exitOnFound is
  // false, ClaimError when the claim cannot be evaluated.
  bool checkAnotherInstance(bool exitOnFound,
                            const std::optional<std::string> &message);
  bool checkAnotherInstance(bool exitOnFound);
  bool checkAnotherInstance(const std::string &message);
  bool checkAnotherInstance(const char *message);
  bool checkAnotherInstance();

  // Serves notifications on the calling thread until stop().
  void waitForOtherInstances();
  // Serves notifications on the manager's background thread when
  // runInBackground, on the calling thread otherwise. The endpoint is bound
  // before this returns, so ChannelBindError is raised here.
  void waitForOtherInstances(bool runInBackground);

  // Ends any running listener loop and joins the background thread.
  void stop();

  bool listening() const { return listening_; }
  bool isPrimary();

  EventDispatcher &events() { return events_; }
  const std::string &identity() const { return identity_; }
  const RuntimePaths &paths() const { return paths_; }

private:
  InstanceClaim &claimLocked();
  std::unique_ptr<ChannelServer> makeBoundServerLocked();

  std::string identity_;
  Options options_;
  RuntimePaths paths_;
  EventDispatcher events_;

  std::mutex mutex_;
  std::unique_ptr<InstanceClaim> claim_;
  std::unique_ptr<ChannelServer> server_;
  std::stop_source foregroundStop_;
  std::atomic<bool> listening_{false};

  // Declared last: joined before the server and dispatcher go away.
  ListenerTask background_;
};

std::unique_ptr<InstanceManager>
newInstanceManager(const std::string &identity,
                   ManagerOptions options = ManagerOptions());

} // namespace solo

#endif // SOLO_INSTANCE_MANAGER_HPP
