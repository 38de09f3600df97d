#pragma once

#include "Logger.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sitewatch::common {

// Process configuration, read once from the environment at startup.
struct ServiceConfig {
    std::string mongoUri = "mongodb://localhost:27017";
    std::string mongoDatabase = "sitewatch";
    std::optional<std::string> credentialEncryptionKey;
    std::string templatesPath = "/app/config/templates";
    LogLevel logLevel = LogLevel::INFO;
    std::string logFile;
    std::optional<std::string> browserlessUrl;
    std::chrono::milliseconds spaRenderingTimeout{30000};
    std::optional<std::string> embeddingServiceUrl;
    std::optional<std::string> embeddingApiKey;
    int schedulerWorkers = 4;
    std::string userAgent = "SitewatchBot/1.0";
    std::vector<std::string> internalDomainSuffixes;
    double changeThresholdPercent = 5.0;

    static ServiceConfig fromEnvironment();
};

} // namespace sitewatch::common
