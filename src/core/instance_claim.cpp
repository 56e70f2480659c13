#include "solo/instance_claim.hpp"
#include "solo/errors.hpp"
#include "solo/logger.hpp"
#include <cerrno>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace solo {

InstanceClaim::InstanceClaim(const std::filesystem::path &lockPath)
    : lockPath_(lockPath) {}

InstanceClaim::~InstanceClaim() {
  if (lockFd_ != -1) {
    flock(lockFd_, LOCK_UN);
    close(lockFd_);
    lockFd_ = -1;
  }
}

bool InstanceClaim::tryAcquire() {
  if (lockFd_ != -1)
    return true;

  int fd = open(lockPath_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0666);
  if (fd == -1) {
    int err = errno;
    LOG_ERROR("Failed to open lock file: " + lockPath_.string());
    throw ClaimError(errnoMessage("open " + lockPath_.string(), err));
  }

  int rc;
  do {
    rc = flock(fd, LOCK_EX | LOCK_NB);
  } while (rc == -1 && errno == EINTR);

  if (rc == -1) {
    int err = errno;
    close(fd);
    if (err == EWOULDBLOCK) {
      // Another instance holds the lock
      LOG_DEBUG("Claim " + lockPath_.string() + " is held by another process");
      return false;
    }
    LOG_ERROR("Failed to flock " + lockPath_.string());
    throw ClaimError(errnoMessage("flock " + lockPath_.string(), err));
  }

  lockFd_ = fd;
  LOG_INFO("Acquired claim " + lockPath_.string());
  return true;
}

} // namespace solo
