// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/files.hpp"
#include <cstdlib>
#include <system_error>

namespace chainquery {
namespace util {

namespace {

std::filesystem::path home_directory() {
  const char *home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return std::filesystem::current_path();
  }
  return std::filesystem::path(home);
}

} // namespace

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  if (std::filesystem::is_directory(dir, ec)) {
    return true;
  }
  std::filesystem::create_directories(dir, ec);
  return !ec && std::filesystem::is_directory(dir, ec);
}

std::filesystem::path get_default_datadir() {
  return home_directory() / ".chainquery";
}

std::filesystem::path get_default_blocksdir() {
  return home_directory() / ".bitcoin" / "blocks";
}

} // namespace util
} // namespace chainquery
