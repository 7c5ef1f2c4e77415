// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "chain/chainstate_manager.hpp"
#include "ingest/block_file_feed.hpp"
#include "ingest/ingestion_pipeline.hpp"
#include "query/query_engine.hpp"
#include "rest/http_server.hpp"
#include "rest/rest_service.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include <atomic>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

namespace chainquery {
namespace app {

// Application configuration
struct AppConfig {
  // Data directory (lock file, debug.log)
  std::filesystem::path datadir;

  // Directory holding blkNNNNN.dat files
  std::filesystem::path blocksdir;

  // Network name, selects the block-file magic
  std::string network = "main";

  // HTTP front end
  std::string bind_address = "127.0.0.1";
  uint16_t port = 9000;
  size_t http_threads = 4;

  // Deepest reorg the index will perform (0 = unlimited)
  int max_reorg_depth = 0;

  // Out-of-order blocks held while waiting for their parent
  size_t max_orphan_blocks = 1000;

  AppConfig()
      : datadir(util::get_default_datadir()),
        blocksdir(util::get_default_blocksdir()) {}
};

// Application - owns the chain index, the ingestion thread and the HTTP
// server. Handles signals and coordinates shutdown.
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Component access
  validation::ChainstateManager &chainstate_manager() {
    return *chainstate_manager_;
  }
  const query::QueryEngine &query_engine() const { return *query_engine_; }

  // Status
  bool is_running() const { return running_; }
  bool is_ingesting() const { return ingesting_; }

  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<bool> ingesting_{false};
  std::atomic<bool> stop_ingestion_{false};

  std::unique_ptr<util::DirectoryLock> datadir_lock_;

  // Components (initialized in order, destroyed in reverse)
  std::unique_ptr<validation::ChainstateManager> chainstate_manager_;
  std::unique_ptr<ingest::BlockFileFeed> block_feed_;
  std::unique_ptr<ingest::IngestionPipeline> pipeline_;
  std::unique_ptr<query::QueryEngine> query_engine_;
  std::unique_ptr<rest::RestService> rest_service_;
  std::unique_ptr<rest::HttpServer> http_server_;

  std::thread ingest_thread_;

  // Initialization steps
  bool init_datadir();
  bool init_chain();
  bool init_ingest();
  bool init_http();

  void ingestion_loop();

  void shutdown();

  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace chainquery
