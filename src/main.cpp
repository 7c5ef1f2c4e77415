// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "version.hpp"
#include <iostream> // CLI output and early errors before logger initialized
#include <filesystem>
#include <system_error>

void print_usage(const char *program_name) {
  std::cout
      << "Usage: " << program_name << " [options]\n"
      << "\n"
      << "Options:\n"
      << "  --blocksdir=<path>   Directory with blkNNNNN.dat files (default: ~/.bitcoin/blocks)\n"
      << "  --datadir=<path>     Data directory for lock and log files (default: ~/.chainquery)\n"
      << "  --network=<name>     Block file network: main, testnet, regtest, signet (default: main)\n"
      << "  --bind=<addr>        HTTP bind address (default: 127.0.0.1)\n"
      << "  --port=<port>        HTTP port (default: 9000)\n"
      << "  --httpthreads=<n>    HTTP worker threads (default: 4)\n"
      << "  --maxreorgdepth=<n>  Refuse reorgs disconnecting more than n blocks (0 = unlimited)\n"
      << "  --maxorphans=<n>     Out-of-order blocks kept waiting for their parent (default: 1000)\n"
      << "\n"
      << "Logging:\n"
      << "  --loglevel=<level>   Set global log level (trace,debug,info,warn,error,critical)\n"
      << "                       Default: info\n"
      << "  --debug=<component>  Enable trace logging for specific component(s)\n"
      << "                       Components: chain, ingest, http, app, all\n"
      << "                       Can be comma-separated: --debug=chain,http\n"
      << "  --printtoconsole     Also log to the console (default: debug.log only)\n"
      << "\n"
      << "Other:\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    chainquery::app::AppConfig config;
    std::string log_level = "info";
    std::vector<std::string> debug_components;
    bool print_to_console = false;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help") {
        print_usage(argv[0]);
        return 0;
      } else if (arg == "--version") {
        std::cout << chainquery::GetFullVersionString() << std::endl;
        std::cout << chainquery::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.find("--blocksdir=") == 0) {
        config.blocksdir = arg.substr(12);
      } else if (arg.find("--datadir=") == 0) {
        config.datadir = arg.substr(10);
      } else if (arg.find("--network=") == 0) {
        config.network = arg.substr(10);
        if (!chainquery::ingest::GetNetworkMagic(config.network)) {
          std::cerr << "Error: Unknown network: " << config.network << std::endl;
          std::cerr << "Network must be one of main, testnet, regtest, signet"
                    << std::endl;
          return 1;
        }
      } else if (arg.find("--bind=") == 0) {
        config.bind_address = arg.substr(7);
      } else if (arg.find("--port=") == 0) {
        auto port_opt = chainquery::util::SafeParsePort(arg.substr(7));
        if (!port_opt) {
          std::cerr << "Error: Invalid port number: " << arg.substr(7) << std::endl;
          std::cerr << "Port must be a number between 1 and 65535" << std::endl;
          return 1;
        }
        config.port = *port_opt;
      } else if (arg.find("--httpthreads=") == 0) {
        auto threads_opt = chainquery::util::SafeParseInt(arg.substr(14), 1, 256);
        if (!threads_opt) {
          std::cerr << "Error: Invalid thread count: " << arg.substr(14) << std::endl;
          std::cerr << "Thread count must be a number between 1 and 256" << std::endl;
          return 1;
        }
        config.http_threads = static_cast<size_t>(*threads_opt);
      } else if (arg.find("--maxreorgdepth=") == 0) {
        auto depth_opt = chainquery::util::SafeParseInt(arg.substr(16), 0, 1000000);
        if (!depth_opt) {
          std::cerr << "Error: Invalid max reorg depth: " << arg.substr(16) << std::endl;
          std::cerr << "Depth must be a number between 0 and 1000000" << std::endl;
          return 1;
        }
        config.max_reorg_depth = *depth_opt;
      } else if (arg.find("--maxorphans=") == 0) {
        auto orphans_opt = chainquery::util::SafeParseInt(arg.substr(13), 0, 1000000);
        if (!orphans_opt) {
          std::cerr << "Error: Invalid orphan limit: " << arg.substr(13) << std::endl;
          std::cerr << "Limit must be a number between 0 and 1000000" << std::endl;
          return 1;
        }
        config.max_orphan_blocks = static_cast<size_t>(*orphans_opt);
      } else if (arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else if (arg.find("--debug=") == 0) {
        // Comma-separated: --debug=chain,http
        for (const auto &component :
             chainquery::util::SplitString(arg.substr(8), ',')) {
          debug_components.push_back(component);
        }
      } else if (arg == "--printtoconsole") {
        print_to_console = true;
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        print_usage(argv[0]);
        return 1;
      }
    }

    // Ensure datadir exists before initializing file logger
    std::error_code ec;
    std::filesystem::create_directories(config.datadir, ec);
    if (ec) {
      std::cerr << "Error: Cannot create data directory " << config.datadir
                << ": " << ec.message() << std::endl;
      return 1;
    }

    std::string log_file = (config.datadir / "debug.log").string();
    chainquery::util::LogManager::Initialize(log_level, true, log_file,
                                             print_to_console);

    for (const auto &component : debug_components) {
      if (component == "all") {
        chainquery::util::LogManager::SetLogLevel("trace");
      } else if (!chainquery::util::LogManager::SetComponentLevel(component,
                                                                  "trace")) {
        LOG_WARN("Ignoring unknown debug component '{}'", component);
      }
    }

    // Nested scope: the application must be destroyed before the logger
    {
      chainquery::app::Application app(config);

      if (!app.initialize()) {
        LOG_ERROR("Failed to initialize application");
        return 1;
      }

      if (!app.start()) {
        LOG_ERROR("Failed to start application");
        return 1;
      }

      app.wait_for_shutdown();
    }

    chainquery::util::LogManager::Shutdown();
    return 0;

  } catch (const std::exception &e) {
    std::cerr << "Fatal exception: " << e.what() << std::endl;
    chainquery::util::LogManager::Shutdown();
    return 1;
  }
}
