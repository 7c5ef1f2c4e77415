// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace chainquery {
namespace util {

enum class LockResult {
  Success,
  ErrorWrite, // lock file could not be created
  ErrorLock,  // another process holds the lock
};

/**
 * Exclusive advisory lock on <directory>/<lockfile_name> (fcntl F_SETLK).
 *
 * Held until the object is destroyed or Release() is called. Keeps two
 * daemons from sharing one data directory.
 */
class DirectoryLock {
public:
  explicit DirectoryLock(std::filesystem::path directory,
                         std::string lockfile_name = ".lock");
  ~DirectoryLock();

  DirectoryLock(const DirectoryLock &) = delete;
  DirectoryLock &operator=(const DirectoryLock &) = delete;

  LockResult Acquire();
  void Release();

  bool IsHeld() const { return fd_ != -1; }
  const std::string &GetReason() const { return reason_; }
  std::filesystem::path GetPath() const { return directory_ / lockfile_name_; }

private:
  std::filesystem::path directory_;
  std::string lockfile_name_;
  std::string reason_;
  int fd_{-1};
};

} // namespace util
} // namespace chainquery
