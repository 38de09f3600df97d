#pragma once

#include <chrono>
#include <curl/curl.h>
#include <set>
#include <string>
#include <vector>

namespace sitewatch::crawler {

struct CrawlOptions {
    int maxDepth = 2;
    int maxPages = 100;
    // ECMAScript regular expressions matched anywhere in the URL; "*" matches everything
    std::vector<std::string> includePatterns;
    std::vector<std::string> excludePatterns;
    bool waitForDynamic = false;
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds delayBetweenRequests{1000};
    bool respectRobots = false;
    bool saveContent = true;
    bool enableCredentialPrompting = true;
    bool extractImages = true;
    std::string userAgent = "SitewatchBot/1.0";
    size_t maxRedirects = 5;

    int maxRetries = 2;
    std::chrono::milliseconds baseRetryDelay{1000};
    float backoffMultiplier = 2.0f;
    std::chrono::milliseconds maxRetryDelay{30000};
    std::chrono::milliseconds rateLimitDelay{10000};

    std::set<int> retryableHttpCodes = {408, 429, 500, 502, 503, 504, 520, 521, 522, 523, 524};

    std::set<CURLcode> retryableCurlCodes = {
        CURLE_OPERATION_TIMEDOUT,
        CURLE_COULDNT_CONNECT,
        CURLE_COULDNT_RESOLVE_HOST,
        CURLE_RECV_ERROR,
        CURLE_SEND_ERROR,
        CURLE_GOT_NOTHING,
        CURLE_PARTIAL_FILE,
        CURLE_SSL_CONNECT_ERROR
    };
};

} // namespace sitewatch::crawler
