/* @file main.cpp
 * @brief hvload command-line entry point
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>
#include <string>

// POSIX headers
#include <signal.h>

// Third-party headers
#include <nlohmann/json.hpp>

// HVLoad headers
#include "core/AppConfig.hpp"
#include "core/ConfigLoader.hpp"
#include "core/Errors.hpp"
#include "core/ProfileLoader.hpp"
#include "core/SystemCoordinator.hpp"

using namespace hvload::core;

namespace {

  ControlFlags g_flags;

  void onInterrupt(int) { g_flags.stop = true; }
  void onPauseToggle(int) { g_flags.togglePause = true; }

  void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "  --config <file>        configuration (default config.json)\n"
              << "  --profile <name>       profile to run\n"
              << "  --registration <id>    vehicle registration / pack id\n"
              << "  --operator <name>      overrides operator_name\n"
              << "  --location <text>      overrides location\n"
              << "  --comment <text>       free-form comment for the report\n"
              << "  --test-mode            use the simulated instrument\n"
              << "  --list-profiles        print profile names and exit\n"
              << "  --check                query the load (IDN, V/I/P, input, function) and exit\n"
              << "SIGINT stops the discharge safely; SIGUSR1 toggles pause.\n";
  }

  struct Args {
    std::string configPath{ "config.json" };
    std::string profile;
    std::string registration;
    std::string operatorName;
    std::string location;
    std::string comment;
    bool testMode{ false };
    bool listProfiles{ false };
    bool check{ false };
  };

  Args parseArgs(int argc, char* argv[]) {
    Args a;
    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      auto value = [&]() -> std::string {
        if (i + 1 >= argc)
          throw std::invalid_argument(arg + " needs a value");
        return argv[++i];
      };

      if (arg == "--config")
        a.configPath = value();
      else if (arg == "--profile")
        a.profile = value();
      else if (arg == "--registration")
        a.registration = value();
      else if (arg == "--operator")
        a.operatorName = value();
      else if (arg == "--location")
        a.location = value();
      else if (arg == "--comment")
        a.comment = value();
      else if (arg == "--test-mode")
        a.testMode = true;
      else if (arg == "--list-profiles")
        a.listProfiles = true;
      else if (arg == "--check")
        a.check = true;
      else
        throw std::invalid_argument("unknown option " + arg);
    }
    return a;
  }

} // namespace

int main(int argc, char* argv[]) {
  Args args;
  try {
    args = parseArgs(argc, argv);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << '\n';
    printUsage(argv[0]);
    return 2;
  }

  try {
    ConfigLoader loader(args.configPath);
    AppConfig config;
    if (loader.exists())
      config = AppConfig::fromJson(loader.load());
    else
      std::cerr << "[main] " << args.configPath << " not found, using defaults\n";
    if (args.testMode)
      config.testMode = true;

    ProfileMap profiles = loadProfiles(config.profilesFile);
    if (args.listProfiles) {
      for (const auto& [name, p] : profiles) {
        std::cout << name << '\n';
        for (const auto& s : p.steps)
          std::cout << "  " << describe(s) << '\n';
      }
      return 0;
    }
    if (args.check) {
      SystemCoordinator coordinator(std::move(config), std::move(profiles));
      coordinator.initialize();
      coordinator.calibrationCheck();
      return 0;
    }
    if (args.profile.empty()) {
      printUsage(argv[0]);
      return 2;
    }

    RunRequest request;
    request.profileName = args.profile;
    request.metadata.registration = args.registration;
    request.metadata.operatorName = args.operatorName.empty() ? config.operatorName : args.operatorName;
    request.metadata.location = args.location.empty() ? config.location : args.location;
    request.metadata.comments = args.comment;

    SystemCoordinator coordinator(std::move(config), std::move(profiles));
    coordinator.initialize();

    signal(SIGINT, onInterrupt);
    signal(SIGTERM, onInterrupt);
    signal(SIGUSR1, onPauseToggle);

    return coordinator.run(request, g_flags);
  } catch (const DischargeError& e) {
    std::cerr << "[main] " << toString(e.kind()) << ": " << e.what();
    if (!e.context().empty())
      std::cerr << " (" << e.context() << ')';
    std::cerr << '\n';
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "[main] " << e.what() << '\n';
    return 1;
  }
}
