#ifndef SOLO_RUNTIME_PATHS_HPP
#define SOLO_RUNTIME_PATHS_HPP

#include <string>
#include <filesystem>

namespace solo {

class RuntimePaths {
public:
    // Resolves the directory holding the claim file and the channel socket.
    // If dirOverride is empty, it checks SOLO_RUNTIME_DIR, then XDG_RUNTIME_DIR,
    // then the system temp directory. The directory is created if missing.
    explicit RuntimePaths(const std::string& dirOverride = "");

    std::filesystem::path dir() const { return dir_; }

    // <dir>/<identity>Mutex
    std::filesystem::path claimFile(const std::string& identity) const;
    // <dir>/<identity>Pipe
    std::filesystem::path channelFile(const std::string& identity) const;

    // Throws std::invalid_argument for identities that cannot name a file.
    static void validateIdentity(const std::string& identity);

private:
    std::filesystem::path dir_;

    static std::filesystem::path resolveDir(const std::string& override);
};

} // namespace solo

#endif // SOLO_RUNTIME_PATHS_HPP
