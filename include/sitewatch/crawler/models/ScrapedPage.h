#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace sitewatch::crawler {

enum class AuthMethod {
    NONE,
    CREDENTIALS,
    SSO
};

struct Heading {
    int level = 1;
    std::string text;
};

struct PageMetadata {
    std::string domain;
    std::string description;
    std::vector<std::string> keywords;
    std::string author;
    std::string publishedDate;
    std::string modifiedDate;
    std::string language;
    std::vector<std::string> links;
    std::vector<std::string> images;
    std::vector<Heading> headings;
    size_t wordCount = 0;
    int readingTimeMinutes = 0;
    int depth = 0;
    std::string parentUrl;
    std::string contentType = "public";  // public | internal | credential-based
    AuthMethod authMethod = AuthMethod::NONE;
};

// Result of fetching and extracting one URL; immutable once produced.
struct ScrapedPage {
    std::string url;
    std::string finalUrl;
    int statusCode = 0;
    std::string title;
    std::string content;
    std::string contentHash;
    PageMetadata metadata;
    std::chrono::system_clock::time_point scrapedAt{};
};

inline const char* authMethodName(AuthMethod method) {
    switch (method) {
        case AuthMethod::CREDENTIALS: return "credentials";
        case AuthMethod::SSO: return "sso";
        default: return "none";
    }
}

} // namespace sitewatch::crawler
