#include "../../include/sitewatch/crawler/BrowserlessClient.h"
#include "../../include/sitewatch/common/Logger.h"
#include "../../include/sitewatch/common/UrlUtils.h"
#include "../../include/sitewatch/crawler/CrawlLogger.h"
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sitewatch::crawler {

class BrowserlessClient::Impl {
public:
    explicit Impl(const std::string& browserlessUrl)
        : browserlessUrl_(browserlessUrl)
        , userAgent_("Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/124.0.0.0 Safari/537.36") {
        while (!browserlessUrl_.empty() && browserlessUrl_.back() == '/') {
            browserlessUrl_.pop_back();
        }
    }

    BrowserlessRenderResult renderUrl(const std::string& url,
                                      int timeoutMs,
                                      bool waitForNetworkIdle,
                                      const std::map<std::string, std::string>& headers,
                                      const std::vector<auth::CookieSpec>& cookies,
                                      const std::optional<auth::BasicAuth>& credentials) {
        BrowserlessRenderResult result;
        auto startTime = std::chrono::steady_clock::now();

        const std::string cleanedUrl = common::sanitizeUrl(url);
        LOG_INFO("Starting headless browser rendering for: " + cleanedUrl);
        CrawlLogger::broadcastLog("Starting headless browser rendering for: " + cleanedUrl, "info");

        CURL* curl = curl_easy_init();
        if (!curl) {
            result.error = "Failed to create CURL handle";
            LOG_ERROR("Failed to create local CURL handle for BrowserlessClient");
            return result;
        }

        const std::string endpoint = browserlessUrl_ + "/content";

        json payload = {
            {"url", cleanedUrl},
            {"gotoOptions", {
                {"waitUntil", waitForNetworkIdle ? "networkidle0" : "load"},
                {"timeout", timeoutMs}
            }},
            {"rejectResourceTypes", json::array({"image", "media", "font"})}
        };
        if (!headers.empty()) {
            payload["setExtraHTTPHeaders"] = headers;
        }
        if (!cookies.empty()) {
            json jar = json::array();
            for (const auto& c : cookies) {
                jar.push_back({{"name", c.name}, {"value", c.value}, {"domain", c.domain}, {"path", c.path}});
            }
            payload["cookies"] = jar;
        }
        if (credentials) {
            payload["authenticate"] = {{"username", credentials->username}, {"password", credentials->password}};
        }
        const std::string body = payload.dump();
        // The payload may carry credentials; only its size is logged
        LOG_DEBUG("Browserless endpoint: " + endpoint + ", payload size: " + std::to_string(body.size()) + " bytes");

        char errbuf[CURL_ERROR_SIZE] = {0};
        curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        // Leave headroom over the in-browser navigation timeout
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeoutMs) + 5000L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 5000L);
        curl_easy_setopt(curl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        struct curl_slist* requestHeaders = nullptr;
        requestHeaders = curl_slist_append(requestHeaders, "Content-Type: application/json");
        requestHeaders = curl_slist_append(requestHeaders, ("User-Agent: " + userAgent_).c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, requestHeaders);

        std::string response;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

        CURLcode res = curl_easy_perform(curl);
        curl_slist_free_all(requestHeaders);

        long httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        curl_easy_cleanup(curl);
        result.statusCode = static_cast<int>(httpCode);
        result.renderTime = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime);

        if (res != CURLE_OK) {
            result.error = "CURL error: " + std::string(curl_easy_strerror(res)) + " | errbuf=" + errbuf;
            std::string msg = "Browserless unavailable for: " + cleanedUrl + " - falling back to static HTML [" +
                              result.error + ", duration_ms=" + std::to_string(result.renderTime.count()) + "]";
            LOG_WARNING(msg);
            CrawlLogger::broadcastLog(msg, "warning");
            return result;
        }

        if (httpCode == 200) {
            result.html = std::move(response);
            result.success = true;
            LOG_INFO("Successfully rendered page via browserless: " + cleanedUrl + ", size: " +
                     std::to_string(result.html.size()) + " bytes, render_time_ms=" +
                     std::to_string(result.renderTime.count()));
        } else {
            result.error = "Browserless returned HTTP " + std::to_string(httpCode);
            LOG_ERROR("Browserless error for " + cleanedUrl + ": " + result.error);
            CrawlLogger::broadcastLog("Headless browser rendering failed for: " + cleanedUrl + " - HTTP " +
                                      std::to_string(httpCode), "error");
        }
        return result;
    }

    bool isAvailable() {
        CURL* curl = curl_easy_init();
        if (!curl) return false;

        const std::string healthUrl = browserlessUrl_ + "/health";
        curl_easy_setopt(curl, CURLOPT_URL, healthUrl.c_str());
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, 5000L);
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));

        CURLcode res = curl_easy_perform(curl);
        long httpCode = 0;
        if (res == CURLE_OK) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        } else {
            LOG_DEBUG("Browserless health check failed: " + std::string(curl_easy_strerror(res)));
        }
        curl_easy_cleanup(curl);
        return httpCode == 200;
    }

    void setUserAgent(const std::string& userAgent) {
        userAgent_ = userAgent;
    }

private:
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
        auto* response = static_cast<std::string*>(userp);
        size_t totalSize = size * nmemb;
        response->append(static_cast<char*>(contents), totalSize);
        return totalSize;
    }

    std::string browserlessUrl_;
    std::string userAgent_;
};

BrowserlessClient::BrowserlessClient(const std::string& browserlessUrl)
    : pImpl(std::make_unique<Impl>(browserlessUrl)) {}

BrowserlessClient::~BrowserlessClient() = default;

BrowserlessRenderResult BrowserlessClient::renderUrl(const std::string& url,
                                                     int timeoutMs,
                                                     bool waitForNetworkIdle,
                                                     const std::map<std::string, std::string>& headers,
                                                     const std::vector<auth::CookieSpec>& cookies,
                                                     const std::optional<auth::BasicAuth>& credentials) {
    return pImpl->renderUrl(url, timeoutMs, waitForNetworkIdle, headers, cookies, credentials);
}

bool BrowserlessClient::isAvailable() {
    return pImpl->isAvailable();
}

void BrowserlessClient::setUserAgent(const std::string& userAgent) {
    pImpl->setUserAgent(userAgent);
}

} // namespace sitewatch::crawler
