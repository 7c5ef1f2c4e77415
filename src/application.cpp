// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <chrono>
#include <iostream>
#include <unistd.h> // write(), STDOUT_FILENO (async-signal-safe)

namespace chainquery {
namespace app {

Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  std::cout << GetStartupBanner(config_.network) << std::flush;

  LOG_INFO("Initializing chainquery...");

  if (!init_datadir()) {
    LOG_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_chain()) {
    LOG_ERROR("Failed to initialize chain index");
    return false;
  }

  if (!init_ingest()) {
    LOG_ERROR("Failed to initialize block ingestion");
    return false;
  }

  if (!init_http()) {
    LOG_ERROR("Failed to initialize HTTP server");
    return false;
  }

  LOG_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_ERROR("Application already running");
    return false;
  }
  if (!http_server_ || !pipeline_) {
    LOG_ERROR("Application not initialized");
    return false;
  }

  LOG_INFO("Starting chainquery...");

  setup_signal_handlers();

  // Queries are served while ingestion is still running
  if (!http_server_->Start(config_.bind_address, config_.port)) {
    LOG_ERROR("Failed to start HTTP server");
    return false;
  }

  running_ = true;
  ingesting_ = true;
  ingest_thread_ = std::thread(&Application::ingestion_loop, this);

  LOG_INFO("chainquery started successfully");
  LOG_INFO("Data directory: {}", config_.datadir.string());
  LOG_INFO("Blocks directory: {}", config_.blocksdir.string());
  LOG_INFO("Listening on {}:{}", config_.bind_address, http_server_->GetPort());
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }

  LOG_INFO("Shutting down chainquery...");
  running_ = false;

  // Stop ingestion first so no writer runs while components go away
  stop_ingestion_ = true;
  if (ingest_thread_.joinable()) {
    LOG_INFO("Waiting for ingestion thread...");
    ingest_thread_.join();
  }

  if (http_server_) {
    LOG_INFO("Stopping HTTP server...");
    http_server_->Stop();
  }

  if (pipeline_) {
    const ingest::IngestStats s = pipeline_->GetStats();
    LOG_INFO("Indexed {} blocks ({} malformed, {} duplicate, {} unknown parent)",
             s.accepted, s.malformed, s.duplicate, s.unknown_parent);
  }

  if (datadir_lock_) {
    LOG_INFO("Releasing data directory lock...");
    datadir_lock_->Release();
  }

  LOG_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }

  datadir_lock_ = std::make_unique<util::DirectoryLock>(config_.datadir);
  util::LockResult lock_result = datadir_lock_->Acquire();

  if (lock_result == util::LockResult::ErrorWrite) {
    LOG_ERROR("Cannot write to data directory: {}", config_.datadir.string());
    return false;
  }

  if (lock_result == util::LockResult::ErrorLock) {
    LOG_ERROR("Cannot obtain a lock on data directory {}. "
              "chainquery is probably already running.",
              config_.datadir.string());
    return false;
  }

  LOG_DEBUG("Successfully locked data directory");
  return true;
}

bool Application::init_chain() {
  LOG_INFO("Initializing chain index...");

  validation::ChainstateOptions options;
  options.max_reorg_depth = config_.max_reorg_depth;
  chainstate_manager_ = std::make_unique<validation::ChainstateManager>(options);

  if (config_.max_reorg_depth > 0) {
    LOG_INFO("Reorgs deeper than {} blocks will be refused",
             config_.max_reorg_depth);
  }
  return true;
}

bool Application::init_ingest() {
  auto magic = ingest::GetNetworkMagic(config_.network);
  if (!magic) {
    LOG_ERROR("Unknown network '{}'", config_.network);
    return false;
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(config_.blocksdir, ec)) {
    // Not fatal: the service still answers (an empty chain)
    LOG_WARN("Blocks directory {} does not exist, nothing to ingest",
             config_.blocksdir.string());
  }

  block_feed_ = std::make_unique<ingest::BlockFileFeed>(config_.blocksdir, *magic);

  ingest::IngestionPipeline::Options options;
  options.max_orphan_blocks = config_.max_orphan_blocks;
  pipeline_ = std::make_unique<ingest::IngestionPipeline>(*chainstate_manager_,
                                                          *block_feed_, options);
  return true;
}

bool Application::init_http() {
  LOG_INFO("Initializing HTTP server...");

  query_engine_ = std::make_unique<query::QueryEngine>(*chainstate_manager_);
  rest_service_ = std::make_unique<rest::RestService>(*query_engine_);
  http_server_ = std::make_unique<rest::HttpServer>(*rest_service_,
                                                    config_.http_threads);
  return true;
}

void Application::ingestion_loop() {
  try {
    const auto started = std::chrono::steady_clock::now();
    const bool finished = pipeline_->Run(stop_ingestion_);
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started);

    if (finished) {
      LOG_INFO("Block ingestion complete in {}s: {} blocks indexed, tip height {}",
               elapsed.count(), chainstate_manager_->GetBlockCount(),
               chainstate_manager_->GetChainHeight());
      if (block_feed_->GetFramingErrors() > 0) {
        LOG_WARN("{} block file framing errors, some blocks were skipped",
                 block_feed_->GetFramingErrors());
      }
    }
  } catch (const std::exception &e) {
    LOG_ERROR("Ingestion thread failed: {}", e.what());
  }
  ingesting_ = false;
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    const char *msg = "\nReceived signal\n";
    ssize_t ignored = write(STDOUT_FILENO, msg, 17);
    (void)ignored;

    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace chainquery
