// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/fs_lock.hpp"
#include "util/logging.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <set>
#include <unistd.h>

namespace chainquery {
namespace util {

// Lock files held by this process (fcntl locks never conflict within one
// process, and closing any descriptor on the file drops the lock)
static std::mutex g_dir_locks_mutex;
static std::set<std::string> g_dir_locks;

DirectoryLock::DirectoryLock(std::filesystem::path directory,
                             std::string lockfile_name)
    : directory_(std::move(directory)), lockfile_name_(std::move(lockfile_name)) {}

DirectoryLock::~DirectoryLock() { Release(); }

LockResult DirectoryLock::Acquire() {
  if (fd_ != -1) {
    return LockResult::Success;
  }

  const auto path = GetPath();
  std::lock_guard<std::mutex> guard(g_dir_locks_mutex);
  if (g_dir_locks.count(path.string()) != 0) {
    reason_ = "already locked by this process";
    LOG_ERROR("Failed to lock directory {}: {}", directory_.string(), reason_);
    return LockResult::ErrorLock;
  }

  // O_CLOEXEC: a child process must not inherit the lock
  int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd == -1) {
    reason_ = std::strerror(errno);
    LOG_ERROR("Failed to open lock file {}: {}", path.string(), reason_);
    return LockResult::ErrorWrite;
  }

  struct flock lock {};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = 0;
  lock.l_len = 0; // whole file

  if (fcntl(fd, F_SETLK, &lock) == -1) {
    reason_ = std::strerror(errno);
    close(fd);
    LOG_ERROR("Failed to lock directory {}: {}", directory_.string(), reason_);
    return LockResult::ErrorLock;
  }

  fd_ = fd;
  g_dir_locks.insert(path.string());
  LOG_TRACE("Acquired directory lock: {}", directory_.string());
  return LockResult::Success;
}

void DirectoryLock::Release() {
  if (fd_ == -1) {
    return;
  }
  std::lock_guard<std::mutex> guard(g_dir_locks_mutex);
  // Closing the descriptor drops the fcntl lock
  close(fd_);
  fd_ = -1;
  g_dir_locks.erase(GetPath().string());
  LOG_TRACE("Released directory lock: {}", directory_.string());
}

} // namespace util
} // namespace chainquery
