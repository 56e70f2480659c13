#include "solo/cli_options.hpp"
#include "solo/config.hpp"
#include "solo/errors.hpp"
#include "solo/instance_manager.hpp"
#include "solo/logger.hpp"
#include "solo/version.hpp"
#include <csignal>
#include <iostream>
#include <pthread.h>
#include <stdexcept>
#include <string>
#include <vector>

void showHelp() {
  std::cout
      << "solo - run one instance, forward the rest\n\n"
      << "Usage: solo [options] [message...]\n\n"
      << "The first process for an identity becomes the primary and prints\n"
      << "every message sent by later launches until interrupted. Later\n"
      << "launches forward their remaining arguments and exit.\n\n"
      << "Options:\n"
      << "  -i, --identity ID  Application identity (or general.identity in "
         "the config)\n"
      << "  -c, --config PATH  JSON configuration file\n"
      << "  -v, --verbose      Enable verbose logging to stdout\n"
      << "      --no-exit      Report instead of exiting when another "
         "instance runs\n"
      << "  -h, --help         Show this help message\n"
      << "      --version      Show version\n";
}

int main(int argc, char *argv[]) {
  solo::CliOptions cli;
  try {
    cli = solo::parseCommandLine(
        std::vector<std::string>(argv + 1, argv + argc));
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << "\n\n";
    showHelp();
    return 1;
  }

  if (cli.showHelp) {
    showHelp();
    return 0;
  }
  if (cli.showVersion) {
    std::cout << "solo v" << solo::SOLO_VERSION_STRING << "\n";
    return 0;
  }

  solo::Logger::instance().init("", cli.verbose);

  solo::Config config;
  if (!cli.configPath.empty()) {
    config.load(cli.configPath);
    auto &logCfg = config.getLog();
    solo::Logger::instance().init(logCfg.file, cli.verbose || logCfg.verbose);
  }

  std::string identity = cli.identity;
  if (identity.empty())
    identity = config.getGeneral().identity;
  if (identity.empty()) {
    std::cerr << "No identity given. Use --identity or general.identity.\n\n";
    showHelp();
    return 1;
  }

  // Block termination signals before any thread starts so they are only
  // delivered through sigwait() below.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  if (int err = pthread_sigmask(SIG_BLOCK, &signals, nullptr); err != 0) {
    LOG_ERROR(solo::errnoMessage("Failed to block termination signals", err));
    return 2;
  }

  try {
    auto manager = solo::newInstanceManager(identity, config.options());

    if (manager->checkAnotherInstance(cli.exitOnFound, cli.message)) {
      std::cout << "[solo] Another instance of '" << identity
                << "' is running; message forwarded.\n";
      return 0;
    }

    manager->events().onNewInstance(
        [] { std::cout << "[solo] New instance launched" << std::endl; });
    manager->events().onNewInstanceWithMessage([](const std::string &msg) {
      std::cout << "[solo] Message: " << msg << std::endl;
    });

    LOG_INFO("Primary instance of '" + identity + "' started");
    if (cli.message)
      std::cout << "[solo] Started with: " << *cli.message << std::endl;

    manager->waitForOtherInstances(true);

    int sig = 0;
    if (int err = sigwait(&signals, &sig); err != 0) {
      LOG_ERROR(solo::errnoMessage("Waiting for a termination signal failed",
                                   err));
    } else {
      LOG_INFO("Received signal " + std::to_string(sig) + ", shutting down");
    }
    manager->stop();
  } catch (const solo::ConnectError &e) {
    std::cerr << "[solo] Another instance holds the claim but did not answer: "
              << e.what() << "\n";
    return 2;
  } catch (const std::invalid_argument &e) {
    LOG_ERROR(e.what());
    return 1;
  } catch (const std::exception &e) {
    LOG_ERROR(e.what());
    return 2;
  }

  return 0;
}
