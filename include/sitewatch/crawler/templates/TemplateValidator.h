#pragma once
#include "TemplateTypes.h"
#include "../UrlPatternSet.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <string>

namespace sitewatch {
namespace crawler {
namespace templates {

struct ValidationResult {
    bool valid;
    std::string message;
};

inline bool isValidTemplateId(const std::string& id) {
    if (id.empty() || id.length() > 64) return false;
    // Lower-case alphanumeric, hyphens, underscores
    return std::all_of(id.begin(), id.end(), [](char c) {
        return (std::isalnum(static_cast<unsigned char>(c)) && !std::isupper(static_cast<unsigned char>(c))) ||
               c == '-' || c == '_';
    });
}

namespace detail {

inline bool isStringArray(const nlohmann::json& j) {
    if (!j.is_array()) return false;
    for (const auto& v : j) if (!v.is_string()) return false;
    return true;
}

inline ValidationResult checkIntRange(const nlohmann::json& obj, const char* section, const char* key,
                                      long long min, long long max) {
    if (!obj.contains(key)) return {true, "ok"};
    std::string field = std::string(section) + "." + key;
    if (!obj[key].is_number_integer()) {
        return {false, field + " must be an integer"};
    }
    long long value = obj[key].get<long long>();
    if (value < min || value > max) {
        return {false, field + " must be between " + std::to_string(min) + " and " + std::to_string(max)};
    }
    return {true, "ok"};
}

inline ValidationResult checkStringArrays(const nlohmann::json& obj, const char* section,
                                          std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (obj.contains(key) && !isStringArray(obj[key])) {
            return {false, std::string(section) + "." + key + " must be an array of strings"};
        }
    }
    return {true, "ok"};
}

} // namespace detail

// Structural check of a template document before fromJson() is applied to it.
inline ValidationResult validateTemplateJson(const nlohmann::json& body) {
    if (!body.is_object()) return {false, "Template must be a JSON object"};

    if (!body.contains("id") || !body["id"].is_string()) {
        return {false, "id is required and must be a string"};
    }
    if (!isValidTemplateId(body["id"].get<std::string>())) {
        return {false, "id must be 1-64 characters, lower-case alphanumeric with hyphens/underscores only"};
    }
    if (!body.contains("name") || !body["name"].is_string() || body["name"].get<std::string>().empty()) {
        return {false, "name is required and must be a non-empty string"};
    }
    if (body.contains("category")) {
        if (!body["category"].is_string() || !categoryFromString(body["category"].get<std::string>())) {
            return {false, "category must be one of documentation, ecommerce, news, corporate, blog, wiki, social, custom"};
        }
    }

    if (body.contains("crawlOptions")) {
        const auto& cfg = body["crawlOptions"];
        if (!cfg.is_object()) return {false, "crawlOptions must be an object"};
        for (auto check : {detail::checkIntRange(cfg, "crawlOptions", "maxDepth", 1, 10),
                           detail::checkIntRange(cfg, "crawlOptions", "maxPages", 1, 10000),
                           detail::checkIntRange(cfg, "crawlOptions", "timeout", 1000, 300000),
                           detail::checkIntRange(cfg, "crawlOptions", "delayBetweenRequests", 0, 60000)}) {
            if (!check.valid) return check;
        }
        for (const char* flag : {"waitForDynamic", "respectRobots", "saveContent", "enableCredentialPrompting"}) {
            if (cfg.contains(flag) && !cfg[flag].is_boolean()) {
                return {false, std::string("crawlOptions.") + flag + " must be a boolean"};
            }
        }
    }

    if (body.contains("selectors")) {
        const auto& sel = body["selectors"];
        if (!sel.is_object()) return {false, "selectors must be an object"};
        auto check = detail::checkStringArrays(sel, "selectors",
            {"contentPriority", "excludeElements", "linkPatterns", "titleSelectors", "descriptionSelectors"});
        if (!check.valid) return check;
    }

    if (body.contains("urlPatterns")) {
        const auto& pat = body["urlPatterns"];
        if (!pat.is_object()) return {false, "urlPatterns must be an object"};
        auto check = detail::checkStringArrays(pat, "urlPatterns", {"include", "exclude", "followPatterns"});
        if (!check.valid) return check;
        for (const char* key : {"include", "exclude"}) {
            if (!pat.contains(key)) continue;
            try {
                UrlPatternSet compiled(pat[key].get<std::vector<std::string>>());
            } catch (const std::invalid_argument& e) {
                return {false, std::string("urlPatterns.") + key + ": " + e.what()};
            }
        }
    }

    if (body.contains("behaviors")) {
        const auto& beh = body["behaviors"];
        if (!beh.is_object()) return {false, "behaviors must be an object"};
        auto check = detail::checkIntRange(beh, "behaviors", "delayBetweenRequests", 0, 60000);
        if (!check.valid) return check;
    }

    return {true, "ok"};
}

} // namespace templates
} // namespace crawler
} // namespace sitewatch
