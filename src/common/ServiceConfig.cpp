#include "../../include/sitewatch/common/ServiceConfig.h"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace sitewatch::common {

namespace {

std::optional<std::string> readEnv(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return std::nullopt;
    }
    return std::string(value);
}

int readIntEnv(const char* name, int fallback, int minValue) {
    auto raw = readEnv(name);
    if (!raw) return fallback;
    try {
        int parsed = std::stoi(*raw);
        if (parsed < minValue) {
            LOG_WARNING(std::string("Ignoring out-of-range ") + name + "=" + *raw + ", using " + std::to_string(fallback));
            return fallback;
        }
        return parsed;
    } catch (const std::exception&) {
        LOG_WARNING(std::string("Invalid ") + name + "=" + *raw + ", using " + std::to_string(fallback));
        return fallback;
    }
}

double readDoubleEnv(const char* name, double fallback) {
    auto raw = readEnv(name);
    if (!raw) return fallback;
    try {
        double parsed = std::stod(*raw);
        if (parsed < 0.0 || parsed > 100.0) {
            LOG_WARNING(std::string("Ignoring out-of-range ") + name + "=" + *raw);
            return fallback;
        }
        return parsed;
    } catch (const std::exception&) {
        LOG_WARNING(std::string("Invalid ") + name + "=" + *raw + ", using default");
        return fallback;
    }
}

std::vector<std::string> splitList(const std::string& raw) {
    std::vector<std::string> out;
    std::stringstream ss(raw);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

} // namespace

ServiceConfig ServiceConfig::fromEnvironment() {
    ServiceConfig config;

    if (auto v = readEnv("MONGODB_URI")) config.mongoUri = *v;
    if (auto v = readEnv("MONGODB_DATABASE")) config.mongoDatabase = *v;
    config.credentialEncryptionKey = readEnv("CREDENTIAL_ENCRYPTION_KEY");
    if (auto v = readEnv("TEMPLATES_PATH")) config.templatesPath = *v;
    if (auto v = readEnv("LOG_LEVEL")) config.logLevel = parseLogLevel(*v);
    if (auto v = readEnv("LOG_FILE")) config.logFile = *v;
    config.browserlessUrl = readEnv("BROWSERLESS_URL");
    config.spaRenderingTimeout = std::chrono::milliseconds(
        readIntEnv("SPA_RENDERING_TIMEOUT", static_cast<int>(config.spaRenderingTimeout.count()), 1000));
    config.embeddingServiceUrl = readEnv("EMBEDDING_SERVICE_URL");
    config.embeddingApiKey = readEnv("EMBEDDING_API_KEY");
    config.schedulerWorkers = readIntEnv("SCHEDULER_WORKERS", config.schedulerWorkers, 1);
    if (auto v = readEnv("CRAWLER_USER_AGENT")) config.userAgent = *v;
    if (auto v = readEnv("INTERNAL_DOMAIN_SUFFIXES")) config.internalDomainSuffixes = splitList(*v);
    config.changeThresholdPercent = readDoubleEnv("CHANGE_THRESHOLD_PERCENT", config.changeThresholdPercent);

    return config;
}

} // namespace sitewatch::common
