#pragma once

#include "FailureType.h"
#include "ScrapedPage.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sitewatch::crawler {

struct CrawlError {
    std::string url;
    std::string error;
    int depth = 0;
    int statusCode = 0;
    FailureType failureType = FailureType::UNKNOWN;
    bool isAuthError = false;
    bool needsCredentials = false;
    std::optional<std::string> loginMethod;
};

struct AuthenticationAttempts {
    int sso = 0;
    int credentials = 0;
    int failed = 0;
};

struct CrawlSummary {
    size_t totalPages = 0;
    size_t successfulPages = 0;
    size_t failedPages = 0;
    std::chrono::system_clock::time_point startTime{};
    std::chrono::system_clock::time_point endTime{};
    std::chrono::milliseconds duration{0};
    AuthenticationAttempts authenticationAttempts;
    bool cancelled = false;
};

struct CrawlResult {
    std::string baseUrl;
    std::vector<ScrapedPage> pages;
    std::vector<CrawlError> errors;
    CrawlSummary summary;
};

} // namespace sitewatch::crawler
