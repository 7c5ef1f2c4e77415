// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace chainquery {
namespace util {

/**
 * Process-wide spdlog setup with one named logger per component.
 *
 * Components: default, chain, ingest, http, app. All loggers share the same
 * sinks (console, plus a rotating debug.log when file logging is enabled).
 *
 * Thread-safety: every method may be called from any thread. The first
 * Initialize() wins; GetLogger() initializes with defaults if nobody did.
 */
class LogManager {
public:
  /**
   * @param log_level trace, debug, info, warn, error, critical or off
   * @param log_to_file also write to a rotating file (10MB x 3)
   * @param log_file_path file sink location, parent directory is created
   * @param log_to_console keep the colored stdout sink when logging to file
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log",
                         bool log_to_console = true);

  // Flush and drop every logger. Later logging re-creates a silent logger.
  static void Shutdown();

  // Logger for a component; unknown names fall back to "default"
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  static void SetLogLevel(const std::string &level);

  // Returns false for an unknown component
  static bool SetComponentLevel(const std::string &component,
                                const std::string &level);

  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace chainquery

#define LOG_TRACE(...)                                                         \
  chainquery::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  chainquery::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  chainquery::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  chainquery::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  chainquery::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_CHAIN_TRACE(...)                                                   \
  chainquery::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  chainquery::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  chainquery::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  chainquery::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  chainquery::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_INGEST_TRACE(...)                                                  \
  chainquery::util::LogManager::GetLogger("ingest")->trace(__VA_ARGS__)
#define LOG_INGEST_DEBUG(...)                                                  \
  chainquery::util::LogManager::GetLogger("ingest")->debug(__VA_ARGS__)
#define LOG_INGEST_INFO(...)                                                   \
  chainquery::util::LogManager::GetLogger("ingest")->info(__VA_ARGS__)
#define LOG_INGEST_WARN(...)                                                   \
  chainquery::util::LogManager::GetLogger("ingest")->warn(__VA_ARGS__)
#define LOG_INGEST_ERROR(...)                                                  \
  chainquery::util::LogManager::GetLogger("ingest")->error(__VA_ARGS__)

#define LOG_HTTP_TRACE(...)                                                    \
  chainquery::util::LogManager::GetLogger("http")->trace(__VA_ARGS__)
#define LOG_HTTP_DEBUG(...)                                                    \
  chainquery::util::LogManager::GetLogger("http")->debug(__VA_ARGS__)
#define LOG_HTTP_INFO(...)                                                     \
  chainquery::util::LogManager::GetLogger("http")->info(__VA_ARGS__)
#define LOG_HTTP_WARN(...)                                                     \
  chainquery::util::LogManager::GetLogger("http")->warn(__VA_ARGS__)
#define LOG_HTTP_ERROR(...)                                                    \
  chainquery::util::LogManager::GetLogger("http")->error(__VA_ARGS__)
