#include <catch2/catch_test_macros.hpp>
#include "../../include/sitewatch/common/CancellationToken.h"
#include "../../include/sitewatch/common/Logger.h"
#include "../../include/sitewatch/common/ServiceConfig.h"
#include "../../include/sitewatch/crawler/CrawlLogger.h"

#include <cstdlib>
#include <thread>
#include <vector>

using namespace sitewatch::common;

TEST_CASE("CancellationToken - copies share state", "[CancellationToken]") {
    CancellationToken token;
    CancellationToken copy = token;
    REQUIRE_FALSE(copy.isCancelled());
    REQUIRE(copy.waitFor(std::chrono::milliseconds(1)));

    token.cancel();
    REQUIRE(copy.isCancelled());
    REQUIRE_FALSE(copy.waitFor(std::chrono::milliseconds(1000)));
}

TEST_CASE("CancellationToken - cancel wakes a waiting thread", "[CancellationToken]") {
    CancellationToken token;
    auto start = std::chrono::steady_clock::now();
    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token.cancel();
    });
    bool completed = token.waitFor(std::chrono::seconds(10));
    canceller.join();
    REQUIRE_FALSE(completed);
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
}

TEST_CASE("Logger - level names and secret redaction", "[Logger]") {
    REQUIRE(parseLogLevel("debug") == LogLevel::DEBUG);
    REQUIRE(parseLogLevel("WARN") == LogLevel::WARNING);
    REQUIRE(parseLogLevel("warning") == LogLevel::WARNING);
    REQUIRE(parseLogLevel("Error") == LogLevel::ERR);
    REQUIRE(parseLogLevel("none") == LogLevel::NONE);
    REQUIRE(parseLogLevel("chatty") == LogLevel::INFO);

    REQUIRE(redactSecret("hunter2") == "***(7 chars)");
}

TEST_CASE("ServiceConfig - reads the environment with defaults", "[ServiceConfig]") {
    ::unsetenv("SCHEDULER_WORKERS");
    ::unsetenv("CREDENTIAL_ENCRYPTION_KEY");
    ::unsetenv("CHANGE_THRESHOLD_PERCENT");
    ::unsetenv("INTERNAL_DOMAIN_SUFFIXES");

    SECTION("Defaults") {
        auto config = ServiceConfig::fromEnvironment();
        REQUIRE(config.schedulerWorkers == 4);
        REQUIRE_FALSE(config.credentialEncryptionKey);
        REQUIRE(config.changeThresholdPercent == 5.0);
        REQUIRE(config.internalDomainSuffixes.empty());
    }

    SECTION("Overrides") {
        ::setenv("SCHEDULER_WORKERS", "8", 1);
        ::setenv("CREDENTIAL_ENCRYPTION_KEY", "s3cret", 1);
        ::setenv("INTERNAL_DOMAIN_SUFFIXES", "corp.example.com, .intra", 1);
        auto config = ServiceConfig::fromEnvironment();
        REQUIRE(config.schedulerWorkers == 8);
        REQUIRE(config.credentialEncryptionKey == std::optional<std::string>("s3cret"));
        REQUIRE(config.internalDomainSuffixes == std::vector<std::string>{"corp.example.com", ".intra"});
    }

    SECTION("Malformed numbers fall back to the default") {
        ::setenv("SCHEDULER_WORKERS", "lots", 1);
        ::setenv("CHANGE_THRESHOLD_PERCENT", "250", 1);
        auto config = ServiceConfig::fromEnvironment();
        REQUIRE(config.schedulerWorkers == 4);
        REQUIRE(config.changeThresholdPercent == 5.0);
    }

    ::unsetenv("SCHEDULER_WORKERS");
    ::unsetenv("CREDENTIAL_ENCRYPTION_KEY");
    ::unsetenv("CHANGE_THRESHOLD_PERCENT");
    ::unsetenv("INTERNAL_DOMAIN_SUFFIXES");
}

TEST_CASE("CrawlLogger - sinks", "[CrawlLogger]") {
    using sitewatch::crawler::CrawlLogger;
    std::vector<std::string> general;
    std::vector<std::string> perRun;

    SECTION("No sink is a no-op") {
        CrawlLogger::broadcastLog("nobody listens");
        CrawlLogger::broadcastSessionLog("run-1", "nobody listens");
        REQUIRE(general.empty());
    }

    SECTION("Run messages fall back to the general sink") {
        CrawlLogger::setLogBroadcastFunction([&](const std::string& message, const std::string& level) {
            general.push_back(level + ":" + message);
        });
        CrawlLogger::broadcastLog("hello", "warning");
        CrawlLogger::broadcastSessionLog("run-1", "page done");
        REQUIRE(general == std::vector<std::string>{"warning:hello", "info:page done (Run: run-1)"});
    }

    SECTION("Run sink receives the run id") {
        CrawlLogger::setLogBroadcastFunction([&](const std::string& message, const std::string&) {
            general.push_back(message);
        });
        CrawlLogger::setRunLogBroadcastFunction(
            [&](const std::string& runId, const std::string& message, const std::string& level) {
                perRun.push_back(runId + "|" + level + "|" + message);
            });
        CrawlLogger::broadcastSessionLog("run-2", "failed", "error");
        REQUIRE(perRun == std::vector<std::string>{"run-2|error|failed"});
        REQUIRE(general.empty());
    }

    CrawlLogger::setLogBroadcastFunction(nullptr);
    CrawlLogger::setRunLogBroadcastFunction(nullptr);
}
