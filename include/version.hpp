// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace chainquery {

// Software version
constexpr int CLIENT_VERSION_MAJOR = 0;
constexpr int CLIENT_VERSION_MINOR = 3;
constexpr int CLIENT_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." +
         std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Unicity Foundation";

inline std::string GetFullVersionString() {
  return "chainquery version " + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

namespace colors {
constexpr const char *RESET = "\033[0m";
constexpr const char *BLUE = "\033[1;34m";  // main
constexpr const char *RED = "\033[1;31m";   // testnet, signet
constexpr const char *GREEN = "\033[1;32m"; // regtest
} // namespace colors

// One-box startup banner naming the version and the block-file network
inline std::string GetStartupBanner(const std::string &network) {
  const char *color = colors::RESET;
  if (network == "main" || network == "mainnet") {
    color = colors::BLUE;
  } else if (network == "testnet" || network == "test" || network == "signet") {
    color = colors::RED;
  } else if (network == "regtest") {
    color = colors::GREEN;
  }

  const std::string rule(48, '=');
  std::string banner;
  banner += "\n";
  banner += color;
  banner += rule + "\n";
  banner += "  chainquery - block and transaction index\n";
  banner += "  Version: " + GetVersionString() + "\n";
  banner += "  Network: " + network + "\n";
  banner += "  " + GetCopyrightString() + "\n";
  banner += rule;
  banner += colors::RESET;
  banner += "\n\n";
  return banner;
}

} // namespace chainquery
