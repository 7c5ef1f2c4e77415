// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test logging setup: quiet console logging for the whole test run

#include <catch2/reporters/catch_reporter_event_listener.hpp>
#include <catch2/reporters/catch_reporter_registrars.hpp>
#include "util/logging.hpp"
#include <cstdlib>
#include <string>

// Initialize logging for tests (console only, no file)
void InitializeTestLogging(const std::string& level) {
    chainquery::util::LogManager::Initialize(level, false, "");

    // "trace" should reach LOG_CHAIN_TRACE, LOG_INGEST_TRACE, ... too
    if (level == "trace") {
        for (const auto& component : chainquery::util::LogManager::Components()) {
            chainquery::util::LogManager::SetComponentLevel(component, "trace");
        }
    }
}

void ShutdownTestLogging() {
    chainquery::util::LogManager::Shutdown();
}

namespace {

// CHAINQUERY_TEST_LOGLEVEL=debug turns on logging while debugging a test
class TestLoggingListener : public Catch::EventListenerBase {
public:
    using Catch::EventListenerBase::EventListenerBase;

    void testRunStarting(const Catch::TestRunInfo&) override {
        const char* level = std::getenv("CHAINQUERY_TEST_LOGLEVEL");
        InitializeTestLogging(level ? level : "off");
    }

    void testRunEnded(const Catch::TestRunStats&) override {
        ShutdownTestLogging();
    }
};

} // namespace

CATCH_REGISTER_LISTENER(TestLoggingListener)
