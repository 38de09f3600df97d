#pragma once
#include "TemplateTypes.h"
#include "TemplateValidator.h"
#include "../../common/Logger.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

namespace sitewatch {
namespace crawler {
namespace templates {

inline nlohmann::json toJson(const WebsiteTemplate& t) {
    nlohmann::json j;
    j["id"] = t.id;
    j["name"] = t.name;
    j["description"] = t.description;
    j["category"] = categoryToString(t.category);
    j["crawlOptions"] = {
        {"maxDepth", t.crawl.maxDepth},
        {"maxPages", t.crawl.maxPages},
        {"waitForDynamic", t.crawl.waitForDynamic},
        {"timeout", t.crawl.timeoutMs},
        {"delayBetweenRequests", t.crawl.delayBetweenRequestsMs},
        {"respectRobots", t.crawl.respectRobots},
        {"saveContent", t.crawl.saveContent},
        {"enableCredentialPrompting", t.crawl.enableCredentialPrompting}
    };
    j["selectors"] = {
        {"contentPriority", t.selectors.contentPriority},
        {"excludeElements", t.selectors.excludeElements},
        {"linkPatterns", t.selectors.linkPatterns},
        {"titleSelectors", t.selectors.titleSelectors},
        {"descriptionSelectors", t.selectors.descriptionSelectors}
    };
    j["urlPatterns"] = {
        {"include", t.urlPatterns.include},
        {"exclude", t.urlPatterns.exclude},
        {"followPatterns", t.urlPatterns.followPatterns}
    };
    j["metadata"] = {
        {"detectArticles", t.metadata.detectArticles},
        {"extractAuthors", t.metadata.extractAuthors},
        {"extractDates", t.metadata.extractDates},
        {"extractCategories", t.metadata.extractCategories},
        {"extractTags", t.metadata.extractTags}
    };
    j["behaviors"] = {
        {"respectRobots", t.behaviors.respectRobots},
        {"delayBetweenRequests", t.behaviors.delayBetweenRequestsMs},
        {"retryFailedPages", t.behaviors.retryFailedPages},
        {"skipDuplicateContent", t.behaviors.skipDuplicateContent},
        {"extractImages", t.behaviors.extractImages},
        {"extractDownloads", t.behaviors.extractDownloads}
    };
    return j;
}

// Missing sections keep WebsiteTemplate defaults. Expects a document that
// passed validateTemplateJson(); type mismatches throw nlohmann::json::exception.
inline WebsiteTemplate fromJson(const nlohmann::json& j) {
    WebsiteTemplate t;
    t.id = j.value("id", "");
    t.name = j.value("name", "");
    t.description = j.value("description", "");
    if (auto category = categoryFromString(j.value("category", "custom"))) {
        t.category = *category;
    }
    if (j.contains("crawlOptions") && j["crawlOptions"].is_object()) {
        const auto& cfg = j["crawlOptions"];
        t.crawl.maxDepth = cfg.value("maxDepth", t.crawl.maxDepth);
        t.crawl.maxPages = cfg.value("maxPages", t.crawl.maxPages);
        t.crawl.waitForDynamic = cfg.value("waitForDynamic", t.crawl.waitForDynamic);
        t.crawl.timeoutMs = cfg.value("timeout", t.crawl.timeoutMs);
        t.crawl.delayBetweenRequestsMs = cfg.value("delayBetweenRequests", t.crawl.delayBetweenRequestsMs);
        t.crawl.respectRobots = cfg.value("respectRobots", t.crawl.respectRobots);
        t.crawl.saveContent = cfg.value("saveContent", t.crawl.saveContent);
        t.crawl.enableCredentialPrompting = cfg.value("enableCredentialPrompting", t.crawl.enableCredentialPrompting);
    }
    if (j.contains("selectors") && j["selectors"].is_object()) {
        const auto& sel = j["selectors"];
        if (sel.contains("contentPriority")) t.selectors.contentPriority = sel["contentPriority"].get<std::vector<std::string>>();
        if (sel.contains("excludeElements")) t.selectors.excludeElements = sel["excludeElements"].get<std::vector<std::string>>();
        if (sel.contains("linkPatterns")) t.selectors.linkPatterns = sel["linkPatterns"].get<std::vector<std::string>>();
        if (sel.contains("titleSelectors")) t.selectors.titleSelectors = sel["titleSelectors"].get<std::vector<std::string>>();
        if (sel.contains("descriptionSelectors")) t.selectors.descriptionSelectors = sel["descriptionSelectors"].get<std::vector<std::string>>();
    }
    if (j.contains("urlPatterns") && j["urlPatterns"].is_object()) {
        const auto& pat = j["urlPatterns"];
        if (pat.contains("include")) t.urlPatterns.include = pat["include"].get<std::vector<std::string>>();
        if (pat.contains("exclude")) t.urlPatterns.exclude = pat["exclude"].get<std::vector<std::string>>();
        if (pat.contains("followPatterns")) t.urlPatterns.followPatterns = pat["followPatterns"].get<std::vector<std::string>>();
    }
    if (j.contains("metadata") && j["metadata"].is_object()) {
        const auto& md = j["metadata"];
        t.metadata.detectArticles = md.value("detectArticles", t.metadata.detectArticles);
        t.metadata.extractAuthors = md.value("extractAuthors", t.metadata.extractAuthors);
        t.metadata.extractDates = md.value("extractDates", t.metadata.extractDates);
        t.metadata.extractCategories = md.value("extractCategories", t.metadata.extractCategories);
        t.metadata.extractTags = md.value("extractTags", t.metadata.extractTags);
    }
    if (j.contains("behaviors") && j["behaviors"].is_object()) {
        const auto& beh = j["behaviors"];
        t.behaviors.respectRobots = beh.value("respectRobots", t.behaviors.respectRobots);
        t.behaviors.delayBetweenRequestsMs = beh.value("delayBetweenRequests", t.behaviors.delayBetweenRequestsMs);
        t.behaviors.retryFailedPages = beh.value("retryFailedPages", t.behaviors.retryFailedPages);
        t.behaviors.skipDuplicateContent = beh.value("skipDuplicateContent", t.behaviors.skipDuplicateContent);
        t.behaviors.extractImages = beh.value("extractImages", t.behaviors.extractImages);
        t.behaviors.extractDownloads = beh.value("extractDownloads", t.behaviors.extractDownloads);
    }
    return t;
}

namespace detail {

inline void appendValidTemplate(const nlohmann::json& j, const std::string& source,
                                std::vector<WebsiteTemplate>& out) {
    auto validation = validateTemplateJson(j);
    if (!validation.valid) {
        LOG_WARNING("Skipping invalid template in " + source + ": " + validation.message);
        return;
    }
    out.push_back(fromJson(j));
}

} // namespace detail

// A file holds either one template object or an array of them. Invalid entries
// are logged and skipped; an unreadable or malformed file yields nothing.
inline std::vector<WebsiteTemplate> loadTemplatesFromFile(const std::string& path) {
    std::vector<WebsiteTemplate> out;
    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_WARNING("Cannot open template file: " + path);
        return out;
    }
    try {
        nlohmann::json root;
        in >> root;
        if (root.is_array()) {
            for (const auto& j : root) detail::appendValidTemplate(j, path, out);
        } else {
            detail::appendValidTemplate(root, path, out);
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_WARNING("Failed to load templates from " + path + ": " + e.what());
        out.clear();
    }
    return out;
}

inline std::vector<WebsiteTemplate> loadTemplatesFromDirectory(const std::string& dirPath) {
    std::vector<WebsiteTemplate> out;
    std::error_code ec;
    if (!std::filesystem::is_directory(dirPath, ec)) {
        return out;
    }
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dirPath, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        LOG_WARNING("Failed to list template directory " + dirPath + ": " + ec.message());
    }
    // Directory order is unspecified; sort so duplicate-id resolution is stable
    std::sort(files.begin(), files.end());
    for (const auto& file : files) {
        auto loaded = loadTemplatesFromFile(file.string());
        out.insert(out.end(), loaded.begin(), loaded.end());
    }
    return out;
}

// Accepts either a directory of *.json files or a single file; a missing path yields nothing.
inline std::vector<WebsiteTemplate> loadTemplates(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) return loadTemplatesFromDirectory(path);
    if (std::filesystem::is_regular_file(path, ec)) return loadTemplatesFromFile(path);
    LOG_DEBUG("No additional templates at " + path);
    return {};
}

inline bool saveTemplateToFile(const WebsiteTemplate& t, const std::string& path) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR("Cannot write template file: " + path);
        return false;
    }
    out << toJson(t).dump(2);
    return static_cast<bool>(out);
}

} // namespace templates
} // namespace crawler
} // namespace sitewatch
