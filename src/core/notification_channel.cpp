#include "solo/notification_channel.hpp"
#include "solo/errors.hpp"
#include "solo/logger.hpp"
#include "solo/runtime_paths.hpp"
#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <utility>

namespace solo {

namespace {

constexpr std::chrono::milliseconds kWriteTimeout{2000};
constexpr std::chrono::milliseconds kConnectRetryInterval{10};

bool makeAddress(const std::filesystem::path &endpoint, sockaddr_un &addr,
                 socklen_t &len) {
  const std::string &path = endpoint.native();
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  if (path.size() >= sizeof(addr.sun_path))
    return false;
  std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
  len = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + path.size() +
                               1);
  return true;
}

// SO_SNDTIMEO also bounds a blocking AF_UNIX connect() on a full backlog.
void setSendTimeout(int fd, std::chrono::milliseconds timeout) {
  auto ms = std::max<long long>(timeout.count(), 1); // zero means "forever"
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(ms / 1000);
  tv.tv_usec = static_cast<suseconds_t>((ms % 1000) * 1000);
  if (setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == -1) {
    LOG_WARN(errnoMessage("Failed to set channel send timeout", errno));
  }
}

int pollMillis(std::chrono::milliseconds d) {
  return static_cast<int>(std::max<long long>(d.count(), 1));
}

} // namespace

ChannelServer::ChannelServer(std::filesystem::path endpoint,
                             EventDispatcher &events, ChannelOptions options)
    : endpoint_(std::move(endpoint)), events_(events), options_(options) {}

ChannelServer::~ChannelServer() { closeListener(); }

void ChannelServer::bind() {
  if (listenFd_ != -1)
    return;

  sockaddr_un addr;
  socklen_t len;
  if (!makeAddress(endpoint_, addr, len)) {
    throw ChannelBindError("Channel path too long for a Unix socket: " +
                           endpoint_.string());
  }

  int lastErr = 0;
  const int retries = std::max(options_.bindRetries, 0);
  for (int attempt = 0; attempt <= retries; ++attempt) {
    if (attempt > 0) {
      LOG_WARN("Retrying bind of " + endpoint_.string() + " (" +
               std::to_string(attempt) + "/" + std::to_string(retries) + ")");
      std::this_thread::sleep_for(options_.bindRetryDelay);
    }

    // A socket file left at the endpoint belongs to a dead primary.
    std::error_code ec;
    if (std::filesystem::is_socket(endpoint_, ec)) {
      std::filesystem::remove(endpoint_, ec);
      if (!ec)
        LOG_DEBUG("Removed stale channel socket " + endpoint_.string());
    }

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
    if (fd == -1) {
      lastErr = errno;
      continue;
    }
    if (::bind(fd, reinterpret_cast<const sockaddr *>(&addr), len) == 0 &&
        listen(fd, options_.backlog) == 0) {
      listenFd_ = fd;
      LOG_INFO("Channel bound at " + endpoint_.string());
      return;
    }
    lastErr = errno;
    close(fd);
  }

  LOG_ERROR("Failed to bind channel " + endpoint_.string());
  throw ChannelBindError(errnoMessage("bind " + endpoint_.string(), lastErr));
}

void ChannelServer::run(std::stop_token token) {
  bind();
  LOG_INFO("Waiting for other instances on " + endpoint_.string());

  while (!token.stop_requested()) {
    pollfd pfd{listenFd_, POLLIN, 0};
    int rc = poll(&pfd, 1, pollMillis(options_.pollInterval));
    if (rc == 0)
      continue;
    if (rc == -1) {
      if (errno == EINTR)
        continue;
      int err = errno;
      closeListener();
      throw Error(errnoMessage("poll " + endpoint_.string(), err));
    }

    int clientFd = accept4(listenFd_, nullptr, nullptr,
                           SOCK_CLOEXEC | SOCK_NONBLOCK);
    if (clientFd == -1) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK ||
          errno == ECONNABORTED)
        continue;
      int err = errno;
      closeListener();
      throw Error(errnoMessage("accept " + endpoint_.string(), err));
    }
    handleConnection(clientFd, token);
  }

  closeListener();
  LOG_INFO("Stopped waiting for other instances");
}

void ChannelServer::handleConnection(int clientFd, std::stop_token token) {
  std::string message = readUntilClosed(clientFd, token);
  LOG_INFO("New instance detected (" + std::to_string(message.size()) +
           " byte message)");
  events_.dispatch(message);
  close(clientFd);
}

std::string ChannelServer::readUntilClosed(int clientFd,
                                           std::stop_token token) {
  std::string payload;
  char buf[4096];
  auto deadline = std::chrono::steady_clock::now() + options_.readTimeout;

  while (true) {
    ssize_t n = recv(clientFd, buf, sizeof(buf), 0);
    if (n > 0) {
      payload.append(buf, static_cast<size_t>(n));
      deadline = std::chrono::steady_clock::now() + options_.readTimeout;
      continue;
    }
    if (n == 0)
      break;
    if (errno == EINTR)
      continue;
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      // Peer dropped mid-write; keep what arrived.
      LOG_WARN(errnoMessage("Read from new instance failed", errno));
      break;
    }

    if (token.stop_requested()) {
      LOG_WARN("Stop requested while reading from a new instance");
      break;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      LOG_WARN("New instance went silent without closing; using " +
               std::to_string(payload.size()) + " bytes received");
      break;
    }
    pollfd pfd{clientFd, POLLIN, 0};
    if (poll(&pfd, 1, pollMillis(std::min(remaining, options_.pollInterval))) ==
            -1 &&
        errno != EINTR) {
      LOG_WARN(errnoMessage("Waiting for new instance data failed", errno));
      break;
    }
  }
  return payload;
}

void ChannelServer::closeListener() {
  if (listenFd_ == -1)
    return;
  close(listenFd_);
  listenFd_ = -1;
  std::error_code ec;
  std::filesystem::remove(endpoint_, ec);
}

bool notifyEndpoint(const std::filesystem::path &endpoint,
                    const std::optional<std::string> &message,
                    std::chrono::milliseconds timeout) {
  sockaddr_un addr;
  socklen_t len;
  if (!makeAddress(endpoint, addr, len)) {
    throw ConnectError("Channel path too long for a Unix socket: " +
                       endpoint.string());
  }

  using Clock = std::chrono::steady_clock;
  const auto deadline = Clock::now() + timeout;
  int fd = -1;
  int lastErr = 0;

  // The endpoint may not exist yet or may be between binds; retry until the
  // deadline, a single timed attempt overall.
  while (true) {
    fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd == -1) {
      throw ConnectError(errnoMessage("socket", errno));
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now());
    setSendTimeout(fd, remaining);

    if (connect(fd, reinterpret_cast<const sockaddr *>(&addr), len) == 0)
      break;

    lastErr = errno;
    close(fd);
    fd = -1;
    if (lastErr != ENOENT && lastErr != ECONNREFUSED && lastErr != EAGAIN &&
        lastErr != EINTR) {
      throw ConnectError(errnoMessage("connect " + endpoint.string(), lastErr));
    }
    auto now = Clock::now();
    if (now >= deadline)
      break;
    std::this_thread::sleep_for(std::min<Clock::duration>(
        kConnectRetryInterval, deadline - now));
  }

  if (fd == -1) {
    LOG_WARN("No primary instance answered on " + endpoint.string());
    throw ConnectError(errnoMessage(
        "No primary instance listening on " + endpoint.string() + " within " +
            std::to_string(timeout.count()) + "ms",
        lastErr));
  }

  bool ok = true;
  if (message) {
    setSendTimeout(fd, kWriteTimeout);
    const char *data = message->data();
    size_t left = message->size();
    while (left > 0) {
      ssize_t n = send(fd, data, left, MSG_NOSIGNAL);
      if (n == -1) {
        if (errno == EINTR)
          continue;
        LOG_WARN(errnoMessage("Failed to send message to primary instance",
                              errno));
        ok = false;
        break;
      }
      data += n;
      left -= static_cast<size_t>(n);
    }
  }

  close(fd);
  return ok;
}

bool notifyPrimary(const std::string &identity,
                   const std::optional<std::string> &message,
                   std::chrono::milliseconds timeout) {
  RuntimePaths paths;
  return notifyEndpoint(paths.channelFile(identity), message, timeout);
}

} // namespace solo
