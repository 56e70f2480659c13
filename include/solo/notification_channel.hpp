#ifndef SOLO_NOTIFICATION_CHANNEL_HPP
#define SOLO_NOTIFICATION_CHANNEL_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>

#include "solo/event_dispatcher.hpp"

namespace solo {

inline constexpr std::chrono::milliseconds kDefaultConnectTimeout{100};

struct ChannelOptions {
  std::chrono::milliseconds connectTimeout = kDefaultConnectTimeout;
  // Idle time after which a silent client is treated as closed.
  std::chrono::milliseconds readTimeout{2000};
  // How often a waiting server re-checks its stop token.
  std::chrono::milliseconds pollInterval{50};
  int backlog = 16;
  int bindRetries = 3;
  std::chrono::milliseconds bindRetryDelay{100};
};

// Primary side of the channel: a Unix stream socket that accepts one client at
// a time, reads until the client closes and hands the payload to the
// dispatcher. Only the claim holder may run it, since bind() replaces a stale
// socket file left at the endpoint.
class ChannelServer {
public:
  ChannelServer(std::filesystem::path endpoint, EventDispatcher &events,
                ChannelOptions options = {});
  ~ChannelServer();

  ChannelServer(const ChannelServer &) = delete;
  ChannelServer &operator=(const ChannelServer &) = delete;

  // Binds and listens, retrying up to options.bindRetries times.
  // Throws ChannelBindError.
  void bind();

  // Accepts connections until stop is requested, binding first if needed.
  // The socket file is removed on return.
  void run(std::stop_token token);

  bool bound() const { return listenFd_ != -1; }

private:
  void handleConnection(int clientFd, std::stop_token token);
  std::string readUntilClosed(int clientFd, std::stop_token token);
  void closeListener();

  std::filesystem::path endpoint_;
  EventDispatcher &events_;
  ChannelOptions options_;
  int listenFd_ = -1;
};

// Secondary side: connects to endpoint within timeout, writes message if
// present and disconnects. Nothing is read back.
// Throws ConnectError if no server accepts within the timeout. Returns false if
// the connection broke while writing.
bool notifyEndpoint(const std::filesystem::path &endpoint,
                    const std::optional<std::string> &message,
                    std::chrono::milliseconds timeout = kDefaultConnectTimeout);

// Same as notifyEndpoint() for the channel of identity in the default runtime
// directory.
bool notifyPrimary(const std::string &identity,
                   const std::optional<std::string> &message,
                   std::chrono::milliseconds timeout = kDefaultConnectTimeout);

} // namespace solo

#endif // SOLO_NOTIFICATION_CHANNEL_HPP
