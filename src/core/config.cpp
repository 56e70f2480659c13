#include "solo/config.hpp"
#include "solo/logger.hpp"
#include <fstream>
#include <string>
#include <utility>

namespace solo {

using json = nlohmann::json;

void Config::load(const std::filesystem::path &path) {
  configPath_ = path;

  if (!std::filesystem::exists(path)) {
    LOG_WARN("Config file not found at " + path.string() + ". Using defaults.");
    save();
    return;
  }

  try {
    std::ifstream file(path);
    json j;
    file >> j;
    fromJson(j);
    LOG_INFO("Configuration loaded from " + path.string());
    save();
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to parse config file: " + std::string(e.what()));
  }
}

namespace {

// Non-positive timeouts would cut clients off before their bytes arrive.
int positiveOr(const std::string &key, int value, int fallback) {
  if (value > 0)
    return value;
  LOG_WARN("Config channel." + key + " must be positive (got " +
           std::to_string(value) + "); using " + std::to_string(fallback));
  return fallback;
}

int nonNegativeOr(const std::string &key, int value, int fallback) {
  if (value >= 0)
    return value;
  LOG_WARN("Config channel." + key + " must not be negative (got " +
           std::to_string(value) + "); using " + std::to_string(fallback));
  return fallback;
}

} // namespace

void Config::fromJson(const json &j) {
  // Parsed into copies so a type error leaves the current values untouched.
  GeneralConfig general = general_;
  ChannelConfig channel = channel_;
  LogConfig log = log_;
  const ChannelConfig defaults;

  if (j.contains("general")) {
    auto &g = j["general"];
    general.identity = g.value("identity", "");
    general.runtimeDir = g.value("runtime_dir", "");
    general.reclaimOnUnreachable = g.value("reclaim_on_unreachable", false);
  }

  if (j.contains("channel")) {
    auto &c = j["channel"];
    channel.connectTimeoutMs =
        positiveOr("connect_timeout_ms",
                   c.value("connect_timeout_ms", defaults.connectTimeoutMs),
                   defaults.connectTimeoutMs);
    channel.readTimeoutMs =
        positiveOr("read_timeout_ms",
                   c.value("read_timeout_ms", defaults.readTimeoutMs),
                   defaults.readTimeoutMs);
    channel.pollIntervalMs =
        positiveOr("poll_interval_ms",
                   c.value("poll_interval_ms", defaults.pollIntervalMs),
                   defaults.pollIntervalMs);
    channel.backlog = positiveOr(
        "backlog", c.value("backlog", defaults.backlog), defaults.backlog);
    channel.bindRetries =
        nonNegativeOr("bind_retries",
                      c.value("bind_retries", defaults.bindRetries),
                      defaults.bindRetries);
    channel.bindRetryDelayMs =
        nonNegativeOr("bind_retry_delay_ms",
                      c.value("bind_retry_delay_ms", defaults.bindRetryDelayMs),
                      defaults.bindRetryDelayMs);
  }

  if (j.contains("log")) {
    auto &l = j["log"];
    log.file = l.value("file", "");
    log.verbose = l.value("verbose", false);
  }

  general_ = std::move(general);
  channel_ = channel;
  log_ = std::move(log);
}

json Config::toJson() const {
  json j;
  j["general"] = {{"identity", general_.identity},
                  {"runtime_dir", general_.runtimeDir},
                  {"reclaim_on_unreachable", general_.reclaimOnUnreachable}};
  j["channel"] = {{"connect_timeout_ms", channel_.connectTimeoutMs},
                  {"read_timeout_ms", channel_.readTimeoutMs},
                  {"poll_interval_ms", channel_.pollIntervalMs},
                  {"backlog", channel_.backlog},
                  {"bind_retries", channel_.bindRetries},
                  {"bind_retry_delay_ms", channel_.bindRetryDelayMs}};
  j["log"]["file"] = log_.file;
  j["log"]["verbose"] = log_.verbose;
  return j;
}

void Config::save() {
  if (configPath_.empty())
    return;

  std::error_code ec;
  if (configPath_.has_parent_path()) {
    std::filesystem::create_directories(configPath_.parent_path(), ec);
  }

  std::ofstream file(configPath_);
  if (!file) {
    LOG_ERROR("Failed to write config file: " + configPath_.string());
    return;
  }
  file << toJson().dump(4);
  LOG_DEBUG("Configuration saved to " + configPath_.string());
}

InstanceManager::Options Config::options() const {
  InstanceManager::Options opts;
  opts.runtimeDir = general_.runtimeDir;
  opts.reclaimOnUnreachable = general_.reclaimOnUnreachable;
  opts.channel.connectTimeout = std::chrono::milliseconds(channel_.connectTimeoutMs);
  opts.channel.readTimeout = std::chrono::milliseconds(channel_.readTimeoutMs);
  opts.channel.pollInterval = std::chrono::milliseconds(channel_.pollIntervalMs);
  opts.channel.backlog = channel_.backlog;
  opts.channel.bindRetries = channel_.bindRetries;
  opts.channel.bindRetryDelay = std::chrono::milliseconds(channel_.bindRetryDelayMs);
  return opts;
}

} // namespace solo
