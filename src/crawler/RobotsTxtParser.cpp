#include "RobotsTxtParser.h"
#include "../../include/sitewatch/common/Logger.h"
#include "../../include/sitewatch/common/UrlUtils.h"
#include <sstream>
#include <algorithm>
#include <cctype>

namespace sitewatch::crawler {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

RobotsTxtParser::RobotsTxtParser() {
    LOG_DEBUG("RobotsTxtParser constructor called");
}

RobotsTxtParser::~RobotsTxtParser() = default;

void RobotsTxtParser::parseRobotsTxt(const std::string& host, const std::string& content) {
    LOG_INFO("RobotsTxtParser::parseRobotsTxt called for host: " + host);
    std::lock_guard<std::mutex> lock(rulesMutex);

    HostRules rules;
    rules.lastUpdated = std::chrono::system_clock::now();

    std::istringstream stream(content);
    std::string line;
    // Consecutive User-agent lines share one group
    std::vector<std::string> currentAgents = {"*"};
    bool lastWasAgent = false;

    while (std::getline(stream, line)) {
        // Strip comments
        size_t hash = line.find('#');
        if (hash != std::string::npos) {
            line.erase(hash);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            LOG_DEBUG("Ignoring malformed robots.txt line: " + line);
            continue;
        }
        // Directive names are case-insensitive, values (paths) are not
        const std::string directive = toLower(trim(line.substr(0, colon)));
        const std::string value = trim(line.substr(colon + 1));

        if (directive == "user-agent") {
            if (!lastWasAgent) {
                currentAgents.clear();
            }
            currentAgents.push_back(toLower(value));
            lastWasAgent = true;
            continue;
        }
        lastWasAgent = false;

        for (const auto& agent : currentAgents) {
            RobotsRule& rule = (agent == "*") ? rules.defaultRules : rules.userAgentRules[agent];
            parseLine(directive, value, rule);
        }
    }

    hostRules[host] = std::move(rules);
    LOG_INFO("Finished parsing robots.txt for host: " + host);
}

const RobotsTxtParser::RobotsRule& RobotsTxtParser::ruleFor(const HostRules& rules, const std::string& userAgent) const {
    const std::string lowerUserAgent = toLower(userAgent);
    for (const auto& [agent, rule] : rules.userAgentRules) {
        if (!agent.empty() && lowerUserAgent.find(agent) != std::string::npos) {
            return rule;
        }
    }
    return rules.defaultRules;
}

bool RobotsTxtParser::isAllowed(const std::string& url, const std::string& userAgent) const {
    std::lock_guard<std::mutex> lock(rulesMutex);

    auto parsed = common::parseUrl(url);
    if (!parsed) {
        LOG_DEBUG("Unparseable URL, allowing: " + url);
        return true;
    }

    auto it = hostRules.find(parsed->host);
    if (it == hostRules.end()) {
        return true;
    }

    std::string path = parsed->path;
    if (!parsed->query.empty()) {
        path += "?" + parsed->query;
    }

    const RobotsRule& rule = ruleFor(it->second, userAgent);

    // Check allow patterns first
    if (matchesPattern(path, rule.allowPatterns)) {
        LOG_DEBUG("URL explicitly allowed by robots.txt: " + url);
        return true;
    }
    if (matchesPattern(path, rule.disallowPatterns)) {
        LOG_DEBUG("URL disallowed by robots.txt: " + url);
        return false;
    }
    return true;
}

std::chrono::milliseconds RobotsTxtParser::getCrawlDelay(const std::string& host, const std::string& userAgent) const {
    std::lock_guard<std::mutex> lock(rulesMutex);

    auto it = hostRules.find(host);
    if (it == hostRules.end()) {
        return std::chrono::milliseconds(0);
    }
    return ruleFor(it->second, userAgent).crawlDelay;
}

bool RobotsTxtParser::isCached(const std::string& host) const {
    std::lock_guard<std::mutex> lock(rulesMutex);
    return hostRules.find(host) != hostRules.end();
}

std::regex RobotsTxtParser::toRegex(const std::string& pattern) {
    std::string regexPattern = "^";
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '*') {
            regexPattern += ".*";
        } else if (c == '$' && i + 1 == pattern.size()) {
            regexPattern += "$";
        } else if (std::string(".^$|()[]{}+?\\/").find(c) != std::string::npos) {
            regexPattern += '\\';
            regexPattern += c;
        } else {
            regexPattern += c;
        }
    }
    return std::regex(regexPattern);
}

void RobotsTxtParser::parseLine(const std::string& directive, const std::string& value, RobotsRule& rule) {
    if (directive == "disallow") {
        if (!value.empty()) {
            rule.disallowPatterns.push_back(toRegex(value));
            LOG_DEBUG("Added disallow pattern: " + value);
        }
    } else if (directive == "allow") {
        if (!value.empty()) {
            rule.allowPatterns.push_back(toRegex(value));
            LOG_DEBUG("Added allow pattern: " + value);
        }
    } else if (directive == "crawl-delay") {
        try {
            float delay = std::stof(value);
            if (delay >= 0) {
                rule.crawlDelay = std::chrono::milliseconds(static_cast<long long>(delay * 1000));
                LOG_INFO("Set crawl delay to: " + std::to_string(rule.crawlDelay.count()) + "ms");
            }
        } catch (const std::exception& e) {
            // Invalid crawl delay, keep default
            LOG_WARNING("Invalid crawl delay: " + value + " (" + e.what() + "), keeping default");
        }
    } else {
        LOG_TRACE("Unrecognized directive in robots.txt: " + directive);
    }
}

bool RobotsTxtParser::matchesPattern(const std::string& path, const std::vector<std::regex>& patterns) const {
    for (const auto& pattern : patterns) {
        if (std::regex_search(path, pattern)) {
            return true;
        }
    }
    return false;
}

} // namespace sitewatch::crawler
