#ifndef SOLO_CONFIG_HPP
#define SOLO_CONFIG_HPP

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

#include "solo/instance_manager.hpp"

namespace solo {

struct GeneralConfig {
  std::string identity = "";
  std::string runtimeDir = ""; // empty = SOLO_RUNTIME_DIR / XDG_RUNTIME_DIR
  bool reclaimOnUnreachable = false;
};

struct ChannelConfig {
  int connectTimeoutMs = 100;
  int readTimeoutMs = 2000;
  int pollIntervalMs = 50;
  int backlog = 16;
  int bindRetries = 3;
  int bindRetryDelayMs = 100;
};

struct LogConfig {
  std::string file = ""; // empty = console only
  bool verbose = false;
};

class Config {
public:
  Config() = default;

  // Missing file: defaults are kept and written back. Parse errors are logged
  // and leave the defaults in place.
  void load(const std::filesystem::path &configPath);
  void save();

  // All or nothing: throws nlohmann::json::exception on a wrong-typed key and
  // keeps the current values. Out-of-range channel values fall back to their
  // defaults with a warning.
  void fromJson(const nlohmann::json &j);
  nlohmann::json toJson() const;

  // Runtime directory, policy and channel settings as manager options.
  InstanceManager::Options options() const;

  // Getters
  GeneralConfig &getGeneral() { return general_; }
  ChannelConfig &getChannel() { return channel_; }
  LogConfig &getLog() { return log_; }

private:
  std::filesystem::path configPath_;
  GeneralConfig general_;
  ChannelConfig channel_;
  LogConfig log_;
};

} // namespace solo

#endif // SOLO_CONFIG_HPP
