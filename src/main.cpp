#include "core/ConfigManager.h"
#include "core/Constants.h"
#include "core/Logger.h"
#include "core/TtlLruCache.h"
#include "network/NetworkManager.h"
#include "services/AuroraAggregator.h"
#include "services/IpApiProvider.h"
#include "services/IpWhoIsProvider.h"
#include "services/LocationResolver.h"
#include "services/NOAAProvider.h"
#include "tools/ReportFormatter.h"
#include "tools/ToolServer.h"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

static void printUsage() {
  std::printf(
      "Usage: auroracast [options]\n"
      "\n"
      "Without --tool, serves JSON tool requests on stdin, one per line.\n"
      "\n"
      "Options:\n"
      "  --config PATH       config file (default "
      "$XDG_CONFIG_HOME/auroracast/config.json)\n"
      "  --log-level LEVEL   trace, debug, info, warn, error\n"
      "  --tool NAME         run one tool and print its report\n"
      "  --lat DEG           latitude for --tool\n"
      "  --lon DEG           longitude for --tool\n"
      "  --hours N           hours_ahead for get_aurora_prediction\n"
      "  --list-tools        print the available tools\n"
      "  -h, --help          show this help\n");
}

int main(int argc, char *argv[]) {
  std::string configPath;
  std::string logLevel;
  std::string tool;
  nlohmann::json toolArgs = nlohmann::json::object();
  bool listTools = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      configPath = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      logLevel = argv[++i];
    } else if (arg == "--tool" && i + 1 < argc) {
      tool = argv[++i];
    } else if (arg == "--lat" && i + 1 < argc) {
      toolArgs["latitude"] = argv[++i];
    } else if (arg == "--lon" && i + 1 < argc) {
      toolArgs["longitude"] = argv[++i];
    } else if (arg == "--hours" && i + 1 < argc) {
      toolArgs["hours_ahead"] = argv[++i];
    } else if (arg == "--list-tools") {
      listTools = true;
    } else if (arg == "-h" || arg == "--help") {
      printUsage();
      return EXIT_SUCCESS;
    } else {
      std::fprintf(stderr, "Unknown option: %s\n", arg.c_str());
      printUsage();
      return EXIT_FAILURE;
    }
  }

  if (listTools) {
    for (const auto &t : ToolServer::tools())
      std::printf("%-26s %s\n", t.name, t.description);
    return EXIT_SUCCESS;
  }

  AppConfig cfg;
  ConfigManager cfgMgr;
  bool haveConfigPath = cfgMgr.init(configPath);

  // Logging is configured from the file, so read it before Log::init and
  // report problems once the logger exists.
  std::string loadError;
  bool loaded = haveConfigPath && cfgMgr.load(cfg, &loadError);
  Log::init(cfg.logDir);
  Log::setLevel(Log::parseLevel(logLevel.empty() ? cfg.logLevel : logLevel));

  LOG_INFO("Starting AuroraCast v{}...", AuroraCast::VERSION);
  if (!haveConfigPath) {
    LOG_W("Main", "could not resolve config path, using defaults");
  } else if (!loadError.empty()) {
    LOG_W("Main", "ignoring {} ({}), using defaults",
          cfgMgr.configPath().string(), loadError);
  } else if (!loaded && configPath.empty()) {
    // First run: leave a default file behind for the user to edit.
    if (cfgMgr.save(cfg))
      LOG_I("Main", "wrote default config to {}", cfgMgr.configPath().string());
    else
      LOG_W("Main", "could not write default config to {}",
            cfgMgr.configPath().string());
  } else if (!loaded) {
    LOG_W("Main", "config {} not found, using defaults",
          cfgMgr.configPath().string());
  }

  if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
    LOG_ERROR("curl_global_init failed");
    return EXIT_FAILURE;
  }

  int exitCode = EXIT_SUCCESS;
  {
    TtlLruCache cache(static_cast<std::size_t>(cfg.cacheCapacity));
    NetworkManager net(cfg.userAgent);

    std::vector<std::unique_ptr<LocationProvider>> providers;
    providers.push_back(
        std::make_unique<IpApiProvider>(net, cfg.locationTimeout));
    providers.push_back(
        std::make_unique<IpWhoIsProvider>(net, cfg.locationTimeout));

    LocationResolver resolver(cache, std::move(providers), cfg.ttl.location);
    NOAAProvider noaa(net, cache, cfg);
    AuroraAggregator aggregator(cache, noaa, cfg.ttl.ovation);
    ReportFormatter reports(resolver, aggregator, noaa, cache);
    ToolServer server(reports);

    if (tool.empty()) {
      server.run(std::cin, std::cout);
    } else {
      try {
        std::cout << server.call(tool, toolArgs) << std::endl;
      } catch (const std::exception &e) {
        LOG_E("Main", "{} failed: {}", tool, e.what());
        std::fprintf(stderr, "Error: %s\n", e.what());
        exitCode = EXIT_FAILURE;
      }
    }
  }

  curl_global_cleanup();
  spdlog::shutdown();
  return exitCode;
}
