#ifndef SOLO_INSTANCE_CLAIM_HPP
#define SOLO_INSTANCE_CLAIM_HPP

#include <filesystem>
#include <string>

namespace solo {

// Exclusive, machine-wide claim backed by flock(2) on a lock file. The kernel
// drops the lock with the last descriptor, so a crashed owner never leaves the
// claim wedged.
class InstanceClaim {
public:
  explicit InstanceClaim(const std::filesystem::path &lockPath);
  ~InstanceClaim();

  InstanceClaim(const InstanceClaim &) = delete;
  InstanceClaim &operator=(const InstanceClaim &) = delete;

  // Returns true if this is the primary instance (acquired the lock).
  // Returns false if another instance holds it. Never blocks.
  // Throws ClaimError when the lock cannot be evaluated.
  bool tryAcquire();

  bool isHeld() const { return lockFd_ != -1; }
  const std::filesystem::path &path() const { return lockPath_; }

private:
  std::filesystem::path lockPath_;
  int lockFd_ = -1;
};

} // namespace solo

#endif // SOLO_INSTANCE_CLAIM_HPP
