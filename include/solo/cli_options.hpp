#ifndef SOLO_CLI_OPTIONS_HPP
#define SOLO_CLI_OPTIONS_HPP

#include <optional>
#include <string>
#include <vector>

namespace solo {

struct CliOptions {
  std::string identity;
  std::string configPath;
  bool verbose = false;
  bool exitOnFound = true;
  bool showHelp = false;
  bool showVersion = false;
  // Remaining words joined by single spaces; empty when none were given.
  std::optional<std::string> message;
};

// Parses the arguments after the program name. Everything after "--" is part
// of the message. Throws std::invalid_argument on a usage error.
CliOptions parseCommandLine(const std::vector<std::string> &args);

} // namespace solo

#endif // SOLO_CLI_OPTIONS_HPP
