#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <regex>
#include <mutex>
#include <chrono>

namespace sitewatch::crawler {

// robots.txt rules per host. Hosts that were never parsed allow everything.
class RobotsTxtParser {
public:
    RobotsTxtParser();
    ~RobotsTxtParser();

    // Parse robots.txt content for a host, replacing earlier rules
    void parseRobotsTxt(const std::string& host, const std::string& content);

    // Check if a URL is allowed to be crawled. The group whose user-agent
    // token appears in `userAgent` wins; otherwise the "*" group applies.
    bool isAllowed(const std::string& url, const std::string& userAgent) const;

    // Crawl-delay for the matching group, or zero when none was given
    std::chrono::milliseconds getCrawlDelay(const std::string& host, const std::string& userAgent) const;

    // Check if robots.txt is cached for a host
    bool isCached(const std::string& host) const;

private:
    struct RobotsRule {
        std::vector<std::regex> disallowPatterns;
        std::vector<std::regex> allowPatterns;
        std::chrono::milliseconds crawlDelay{0};
    };

    struct HostRules {
        std::unordered_map<std::string, RobotsRule> userAgentRules;
        RobotsRule defaultRules;
        std::chrono::system_clock::time_point lastUpdated;
    };

    // Parse a single robots.txt directive
    void parseLine(const std::string& directive, const std::string& value, RobotsRule& rule);

    // Converts a robots path pattern (with * and $) into an anchored regex
    static std::regex toRegex(const std::string& pattern);

    const RobotsRule& ruleFor(const HostRules& rules, const std::string& userAgent) const;

    // Check if a path matches any pattern
    bool matchesPattern(const std::string& path, const std::vector<std::regex>& patterns) const;

    std::unordered_map<std::string, HostRules> hostRules;
    mutable std::mutex rulesMutex;
};

} // namespace sitewatch::crawler
