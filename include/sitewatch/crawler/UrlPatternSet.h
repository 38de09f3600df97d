#pragma once

#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

namespace sitewatch::crawler {

// A list of ECMAScript URL patterns compiled once. A pattern matches when it is
// found anywhere in the URL; the bare pattern "*" matches every URL.
class UrlPatternSet {
public:
    UrlPatternSet() = default;

    // Throws std::invalid_argument naming the first pattern that fails to compile.
    explicit UrlPatternSet(const std::vector<std::string>& patterns) {
        for (const auto& pattern : patterns) {
            if (pattern == "*") {
                matchAll_ = true;
                continue;
            }
            try {
                regexes_.emplace_back(pattern, std::regex::ECMAScript);
            } catch (const std::regex_error& e) {
                throw std::invalid_argument("Invalid URL pattern '" + pattern + "': " + e.what());
            }
        }
    }

    bool empty() const { return !matchAll_ && regexes_.empty(); }

    bool matches(const std::string& url) const {
        if (matchAll_) return true;
        for (const auto& re : regexes_) {
            if (std::regex_search(url, re)) return true;
        }
        return false;
    }

private:
    bool matchAll_ = false;
    std::vector<std::regex> regexes_;
};

} // namespace sitewatch::crawler
