#include "solo/runtime_paths.hpp"
#include "solo/logger.hpp"
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace solo {

RuntimePaths::RuntimePaths(const std::string& dirOverride) {
    dir_ = resolveDir(dirOverride);

    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        // Surfaces later as a ClaimError/ChannelBindError with the real cause.
        LOG_WARN("Could not create runtime directory " + dir_.string() + ": " + ec.message());
    }
}

std::filesystem::path RuntimePaths::resolveDir(const std::string& override) {
    if (!override.empty()) return std::filesystem::absolute(override);

    const char* envPath = std::getenv("SOLO_RUNTIME_DIR");
    if (envPath && strlen(envPath) > 0) return std::filesystem::absolute(envPath);

    const char* xdgRuntime = std::getenv("XDG_RUNTIME_DIR");
    if (xdgRuntime && strlen(xdgRuntime) > 0) return std::filesystem::absolute(xdgRuntime);

    return std::filesystem::temp_directory_path();
}

std::filesystem::path RuntimePaths::claimFile(const std::string& identity) const {
    validateIdentity(identity);
    return dir_ / (identity + "Mutex");
}

std::filesystem::path RuntimePaths::channelFile(const std::string& identity) const {
    validateIdentity(identity);
    return dir_ / (identity + "Pipe");
}

void RuntimePaths::validateIdentity(const std::string& identity) {
    if (identity.empty()) {
        throw std::invalid_argument("Application identity must not be empty");
    }
    if (identity.find('/') != std::string::npos || identity.find('\0') != std::string::npos) {
        throw std::invalid_argument("Application identity contains a path separator or NUL: " + identity);
    }
}

} // namespace solo
