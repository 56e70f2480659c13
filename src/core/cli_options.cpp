#include "solo/cli_options.hpp"
#include <stdexcept>

namespace solo {

CliOptions parseCommandLine(const std::vector<std::string> &args) {
  CliOptions opts;
  std::vector<std::string> words;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (arg == "-h" || arg == "--help") {
      opts.showHelp = true;
    } else if (arg == "--version") {
      opts.showVersion = true;
    } else if (arg == "-v" || arg == "--verbose") {
      opts.verbose = true;
    } else if (arg == "--no-exit") {
      opts.exitOnFound = false;
    } else if (arg == "-i" || arg == "--identity" || arg == "-c" ||
               arg == "--config") {
      if (i + 1 >= args.size())
        throw std::invalid_argument("Missing value for " + arg);
      if (arg == "-i" || arg == "--identity")
        opts.identity = args[++i];
      else
        opts.configPath = args[++i];
    } else if (arg == "--") {
      words.insert(words.end(), args.begin() + i + 1, args.end());
      break;
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw std::invalid_argument("Unknown option " + arg);
    } else {
      words.push_back(arg);
    }
  }

  if (!words.empty()) {
    std::string joined = words.front();
    for (size_t i = 1; i < words.size(); ++i)
      joined += " " + words[i];
    opts.message = joined;
  }
  return opts;
}

} // namespace solo
