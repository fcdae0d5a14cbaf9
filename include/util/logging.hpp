// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace dagsync {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the ledger core.
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of stdout
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Thread-safe: Uses std::call_once internally. Multiple calls are safe;
   * only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "dagsync.log");

  /**
   * Shutdown logging system (flushes buffers)
   * Subsequent logging calls after shutdown fall back to a muted console logger.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name ("dag", "gossip", "sync", "crypto", "app")
   *
   * Auto-initializes if not initialized. Unknown names map to "default".
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  // Set log level for a single component
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace dagsync

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  dagsync::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  dagsync::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  dagsync::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  dagsync::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  dagsync::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_DAG_TRACE(...)                                                     \
  dagsync::util::LogManager::GetLogger("dag")->trace(__VA_ARGS__)
#define LOG_DAG_DEBUG(...)                                                     \
  dagsync::util::LogManager::GetLogger("dag")->debug(__VA_ARGS__)
#define LOG_DAG_INFO(...)                                                      \
  dagsync::util::LogManager::GetLogger("dag")->info(__VA_ARGS__)
#define LOG_DAG_WARN(...)                                                      \
  dagsync::util::LogManager::GetLogger("dag")->warn(__VA_ARGS__)
#define LOG_DAG_ERROR(...)                                                     \
  dagsync::util::LogManager::GetLogger("dag")->error(__VA_ARGS__)

#define LOG_GOSSIP_TRACE(...)                                                  \
  dagsync::util::LogManager::GetLogger("gossip")->trace(__VA_ARGS__)
#define LOG_GOSSIP_DEBUG(...)                                                  \
  dagsync::util::LogManager::GetLogger("gossip")->debug(__VA_ARGS__)
#define LOG_GOSSIP_INFO(...)                                                   \
  dagsync::util::LogManager::GetLogger("gossip")->info(__VA_ARGS__)
#define LOG_GOSSIP_WARN(...)                                                   \
  dagsync::util::LogManager::GetLogger("gossip")->warn(__VA_ARGS__)
#define LOG_GOSSIP_ERROR(...)                                                  \
  dagsync::util::LogManager::GetLogger("gossip")->error(__VA_ARGS__)

#define LOG_SYNC_TRACE(...)                                                    \
  dagsync::util::LogManager::GetLogger("sync")->trace(__VA_ARGS__)
#define LOG_SYNC_DEBUG(...)                                                    \
  dagsync::util::LogManager::GetLogger("sync")->debug(__VA_ARGS__)
#define LOG_SYNC_INFO(...)                                                     \
  dagsync::util::LogManager::GetLogger("sync")->info(__VA_ARGS__)
#define LOG_SYNC_WARN(...)                                                     \
  dagsync::util::LogManager::GetLogger("sync")->warn(__VA_ARGS__)
#define LOG_SYNC_ERROR(...)                                                    \
  dagsync::util::LogManager::GetLogger("sync")->error(__VA_ARGS__)

#define LOG_CRYPTO_DEBUG(...)                                                  \
  dagsync::util::LogManager::GetLogger("crypto")->debug(__VA_ARGS__)
#define LOG_CRYPTO_ERROR(...)                                                  \
  dagsync::util::LogManager::GetLogger("crypto")->error(__VA_ARGS__)

#define LOG_APP_DEBUG(...)                                                     \
  dagsync::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...)                                                      \
  dagsync::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  dagsync::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
