#include "PageFetcher.h"
#include "../../include/sitewatch/common/Logger.h"
#include "../../include/sitewatch/common/UrlUtils.h"
#include "../../include/sitewatch/crawler/CrawlLogger.h"
#include <algorithm>
#include <cctype>
#include <numeric>
#include <vector>

namespace sitewatch::crawler {

namespace {

struct HeaderCapture {
    std::vector<std::string> setCookies;
    std::string contentType;
};

std::string trimCopy(const std::string& s) {
    size_t start = 0;
    size_t end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool startsWithNoCase(const std::string& s, const std::string& prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

bool isRedirectStatus(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

PageFetchResult cancelledResult(const std::string& url) {
    PageFetchResult result;
    result.errorMessage = "Request cancelled";
    result.curlCode = CURLE_ABORTED_BY_CALLBACK;
    result.finalUrl = url;
    return result;
}

} // namespace

PageFetcher::PageFetcher(const std::string& userAgent,
                         std::chrono::milliseconds timeout,
                         size_t maxRedirects)
    : userAgent(userAgent)
    , timeout(timeout)
    , maxRedirects(maxRedirects)
    , verifySSL(true)
    , spaRenderingEnabled(false)
    , spaRenderTimeout(30000) {
    LOG_DEBUG("PageFetcher constructor called with userAgent: " + userAgent);
}

PageFetcher::~PageFetcher() = default;

PageFetchResult PageFetcher::get(const std::string& url,
                                 auth::BrowsingContext& context,
                                 const common::CancellationToken& cancel) {
    PageFetchResult result = request(url, nullptr, context, cancel);
    if (result.success && !cancel.isCancelled()) {
        renderIfSpa(result, result.finalUrl.empty() ? url : result.finalUrl, context);
    }
    return result;
}

PageFetchResult PageFetcher::postForm(const std::string& url,
                                      const FormFields& fields,
                                      auth::BrowsingContext& context,
                                      const common::CancellationToken& cancel) {
    const std::string body = encodeForm(fields);
    LOG_DEBUG("PageFetcher::postForm to " + common::sanitizeUrl(url) + " with " + std::to_string(fields.size()) + " fields");
    return request(url, &body, context, cancel);
}

PageFetchResult PageFetcher::request(const std::string& url,
                                     const std::string* formBody,
                                     auth::BrowsingContext& context,
                                     const common::CancellationToken& cancel) {
    const std::string originHost = common::extractHost(url);
    std::string current = common::sanitizeUrl(url);
    const std::string* body = formBody;

    for (size_t hop = 0; ; ++hop) {
        if (cancel.isCancelled()) {
            return cancelledResult(current);
        }

        std::string location;
        // Basic credentials never leave the host they were configured for
        bool sendCredentials = common::extractHost(current) == originHost;
        PageFetchResult result = performOnce(current, body, sendCredentials, context, cancel, location);

        if (!isRedirectStatus(result.statusCode) || location.empty()) {
            result.finalUrl = current;
            return result;
        }

        if (hop >= maxRedirects) {
            result.success = false;
            result.curlCode = CURLE_TOO_MANY_REDIRECTS;
            result.errorMessage = "Too many redirects (limit " + std::to_string(maxRedirects) + ")";
            result.finalUrl = current;
            LOG_WARNING(result.errorMessage + " for URL: " + common::sanitizeUrl(url));
            return result;
        }

        LOG_DEBUG("Following redirect " + std::to_string(result.statusCode) + ": " + current + " -> " + location);
        // 301/302/303 after a form POST continue as a GET; 307/308 repeat the POST
        if (body && result.statusCode != 307 && result.statusCode != 308) {
            body = nullptr;
        }
        current = location;
    }
}

PageFetchResult PageFetcher::performOnce(const std::string& url,
                                         const std::string* formBody,
                                         bool sendCredentials,
                                         auth::BrowsingContext& context,
                                         const common::CancellationToken& cancel,
                                         std::string& location) {
    PageFetchResult result;

    // Use a local curl handle for this request to avoid multi-threading issues
    CURL* localCurl = curl_easy_init();
    if (!localCurl) {
        result.errorMessage = "Failed to create local CURL handle";
        result.curlCode = CURLE_FAILED_INIT;
        LOG_ERROR("Error: " + result.errorMessage);
        return result;
    }

    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(localCurl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(localCurl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
    curl_easy_setopt(localCurl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(localCurl, CURLOPT_USERAGENT, userAgent.c_str());
    curl_easy_setopt(localCurl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(localCurl, CURLOPT_ACCEPT_ENCODING, "");

    long timeoutMs = static_cast<long>(timeout.count());
    LOG_TRACE("Setting timeout: " + std::to_string(timeoutMs) + "ms");
    curl_easy_setopt(localCurl, CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(localCurl, CURLOPT_CONNECTTIMEOUT_MS, std::min(timeoutMs, 10000L));
    curl_easy_setopt(localCurl, CURLOPT_DNS_CACHE_TIMEOUT, 300L);
    curl_easy_setopt(localCurl, CURLOPT_IPRESOLVE, CURL_IPRESOLVE_WHATEVER);

    // Redirects are walked in request() so cookies are applied per hop
    curl_easy_setopt(localCurl, CURLOPT_FOLLOWLOCATION, 0L);

    curl_easy_setopt(localCurl, CURLOPT_SSL_VERIFYPEER, verifySSL ? 1L : 0L);
    curl_easy_setopt(localCurl, CURLOPT_SSL_VERIFYHOST, verifySSL ? 2L : 0L);

    struct curl_slist* headers = nullptr;
    for (const auto& header : context.requestHeadersFor(url)) {
        std::string headerStr = header.first + ": " + header.second;
        headers = curl_slist_append(headers, headerStr.c_str());
    }
    if (formBody) {
        headers = curl_slist_append(headers, "Content-Type: application/x-www-form-urlencoded");
        curl_easy_setopt(localCurl, CURLOPT_POST, 1L);
        curl_easy_setopt(localCurl, CURLOPT_POSTFIELDS, formBody->c_str());
        curl_easy_setopt(localCurl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(formBody->size()));
    }
    if (headers) {
        curl_easy_setopt(localCurl, CURLOPT_HTTPHEADER, headers);
    }

    std::string credentials;
    std::optional<auth::BasicAuth> basic;
    if (sendCredentials) {
        basic = context.basicAuthFor(url);
    }
    if (basic) {
        credentials = basic->username + ":" + basic->password;
        curl_easy_setopt(localCurl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
        curl_easy_setopt(localCurl, CURLOPT_USERPWD, credentials.c_str());
    }

    std::string responseData;
    curl_easy_setopt(localCurl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(localCurl, CURLOPT_WRITEDATA, &responseData);

    HeaderCapture capture;
    curl_easy_setopt(localCurl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(localCurl, CURLOPT_HEADERDATA, &capture);

    curl_easy_setopt(localCurl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(localCurl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(localCurl, CURLOPT_XFERINFODATA, const_cast<common::CancellationToken*>(&cancel));

    LOG_DEBUG("Performing CURL " + std::string(formBody ? "POST" : "GET") + " request: " + url);
    CURLcode res = curl_easy_perform(localCurl);

    if (headers) {
        curl_slist_free_all(headers);
    }

    if (res != CURLE_OK) {
        curl_easy_cleanup(localCurl);
        if (res == CURLE_ABORTED_BY_CALLBACK && cancel.isCancelled()) {
            LOG_INFO("Request cancelled: " + url);
            return cancelledResult(url);
        }
        result.errorMessage = std::string(curl_easy_strerror(res)) + " | errbuf=" + errbuf;
        result.curlCode = res;
        LOG_ERROR("CURL error: " + result.errorMessage + " | url_hex=" + common::hexDump(url));
        return result;
    }

    long statusCode = 0;
    curl_easy_getinfo(localCurl, CURLINFO_RESPONSE_CODE, &statusCode);
    result.statusCode = static_cast<int>(statusCode);

    if (result.statusCode >= 200 && result.statusCode < 300) {
        LOG_INFO("HTTP SUCCESS (" + std::to_string(result.statusCode) + "): " + url);
    } else if (result.statusCode >= 300 && result.statusCode < 400) {
        LOG_INFO("HTTP REDIRECT (" + std::to_string(result.statusCode) + "): " + url);
    } else if (result.statusCode >= 400 && result.statusCode < 500) {
        LOG_WARNING("HTTP CLIENT ERROR (" + std::to_string(result.statusCode) + "): " + url);
    } else if (result.statusCode >= 500) {
        LOG_ERROR("HTTP SERVER ERROR (" + std::to_string(result.statusCode) + "): " + url);
    }

    char* redirectUrl = nullptr;
    curl_easy_getinfo(localCurl, CURLINFO_REDIRECT_URL, &redirectUrl);
    if (redirectUrl) {
        location = redirectUrl;
    }
    curl_easy_cleanup(localCurl);

    for (const auto& cookie : capture.setCookies) {
        context.storeSetCookie(url, cookie);
    }

    result.contentType = capture.contentType;
    result.content = std::move(responseData);
    result.success = (result.statusCode >= 200 && result.statusCode < 300);
    if (!result.success && !isRedirectStatus(result.statusCode)) {
        result.errorMessage = "HTTP " + std::to_string(result.statusCode);
    }
    LOG_DEBUG("Response size: " + std::to_string(result.content.size()) + " bytes, content type: " + result.contentType);
    return result;
}

void PageFetcher::renderIfSpa(PageFetchResult& result, const std::string& url, const auth::BrowsingContext& context) {
    if (!spaRenderingEnabled || !isSpaPage(result.content, url)) {
        return;
    }
    LOG_INFO("SPA detected, attempting to render with browserless: " + url);
    CrawlLogger::broadcastLog("SPA detected for: " + url + " - switching to headless browser", "info");

    if (!browserlessClient) {
        LOG_WARNING("BrowserlessClient not available for SPA rendering");
        return;
    }

    const std::string host = common::extractHost(url);
    const auto parsed = common::parseUrl(url);
    std::vector<auth::CookieSpec> cookies;
    for (const auto& cookie : context.cookies()) {
        if (auth::cookieDomainMatches(host, cookie.domain) &&
            auth::cookiePathMatches(parsed ? parsed->path : "/", cookie.path)) {
            cookies.push_back(cookie);
        }
    }

    int renderTimeout = static_cast<int>(std::max(spaRenderTimeout, timeout).count());
    auto renderResult = browserlessClient->renderUrl(url, renderTimeout, true, context.headersFor(url), cookies,
                                                     context.basicAuthFor(url));
    if (renderResult.success && !renderResult.html.empty()) {
        LOG_INFO("Successfully rendered SPA, content size: " + std::to_string(renderResult.html.size()) +
                 " bytes, render_time_ms=" + std::to_string(renderResult.renderTime.count()));
        CrawlLogger::broadcastLog("SPA successfully rendered for: " + url + " (size=" +
                                  std::to_string(renderResult.html.size()) + " bytes, duration_ms=" +
                                  std::to_string(renderResult.renderTime.count()) + ")", "info");
        result.content = std::move(renderResult.html);
    } else {
        std::string msg = "SPA rendering failed for: " + url + " - " + renderResult.error + " (using original content)";
        LOG_WARNING(msg);
        CrawlLogger::broadcastLog(msg, "warning");
    }
}

std::string PageFetcher::encodeForm(const FormFields& fields) {
    std::string body;
    CURL* handle = curl_easy_init();
    for (const auto& field : fields) {
        if (!body.empty()) body += '&';
        char* name = curl_easy_escape(handle, field.first.c_str(), static_cast<int>(field.first.size()));
        char* value = curl_easy_escape(handle, field.second.c_str(), static_cast<int>(field.second.size()));
        if (name) body += name;
        body += '=';
        if (value) body += value;
        curl_free(name);
        curl_free(value);
    }
    if (handle) curl_easy_cleanup(handle);
    return body;
}

void PageFetcher::setVerifySSL(bool verify) {
    LOG_DEBUG("PageFetcher::setVerifySSL called with: " + std::string(verify ? "true" : "false"));
    verifySSL = verify;
}

size_t PageFetcher::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::string* responseData = static_cast<std::string*>(userp);
    size_t totalSize = size * nmemb;
    responseData->append(static_cast<char*>(contents), totalSize);
    return totalSize;
}

size_t PageFetcher::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* capture = static_cast<HeaderCapture*>(userdata);
    size_t totalSize = size * nitems;
    std::string line(buffer, totalSize);

    // A new status line (e.g. after "100 Continue") starts a fresh header block
    if (startsWithNoCase(line, "HTTP/")) {
        capture->setCookies.clear();
        capture->contentType.clear();
    } else if (startsWithNoCase(line, "set-cookie:")) {
        capture->setCookies.push_back(trimCopy(line.substr(11)));
    } else if (startsWithNoCase(line, "content-type:")) {
        capture->contentType = trimCopy(line.substr(13));
    }
    return totalSize;
}

int PageFetcher::progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow) {
    (void)dltotal;
    (void)dlnow;
    (void)ultotal;
    (void)ulnow;

    const auto* cancel = static_cast<const common::CancellationToken*>(clientp);
    return (cancel && cancel->isCancelled()) ? 1 : 0;
}

void PageFetcher::setSpaRendering(bool enable,
                                  const std::string& browserlessUrl,
                                  std::chrono::milliseconds renderTimeout) {
    const std::string cleaned = common::sanitizeUrl(browserlessUrl);
    LOG_DEBUG("PageFetcher::setSpaRendering called with enable: " + std::string(enable ? "true" : "false") + ", url: " + cleaned);
    spaRenderingEnabled = enable && !cleaned.empty();
    spaRenderTimeout = renderTimeout;

    if (spaRenderingEnabled) {
        browserlessClient = std::make_unique<BrowserlessClient>(cleaned);
        browserlessClient->setUserAgent(userAgent);
        LOG_INFO("BrowserlessClient initialized for SPA rendering");
    } else {
        browserlessClient.reset();
    }
}

bool PageFetcher::isSpaPage(const std::string& html, const std::string& url) const {
    // Only markers that are specific to client-rendered frameworks
    static const std::vector<std::string> definiteSpaIndicators = {
        // React
        "data-reactroot", "ReactDOM.render", "ReactDOM.createRoot", "ReactDOM.hydrate",
        // Next.js
        "__NEXT_DATA__", "_next/static/chunks/",
        // Nuxt.js
        "__NUXT__", "window.$nuxt",
        // Gatsby
        "___gatsby", "window.___loader",
        // AngularJS and Angular
        "ng-app=\"", "angular.module", "<app-root", "ng-version",
        // Vue
        "Vue.createApp", "new Vue(", "data-v-app",
        // Ember
        "ember-application", "Ember.Application",
        // Serialized client state
        "window.__PRELOADED_STATE__", "window.__INITIAL_STATE__"
    };

    std::vector<std::string> foundIndicators;
    for (const auto& indicator : definiteSpaIndicators) {
        if (html.find(indicator) != std::string::npos) {
            foundIndicators.push_back(indicator);
        }
    }

    if (!foundIndicators.empty()) {
        LOG_INFO("SPA detected by " + std::to_string(foundIndicators.size()) + " indicators in URL: " + url + " (" +
                 std::accumulate(foundIndicators.begin(), foundIndicators.end(), std::string(),
                     [](const std::string& a, const std::string& b) { return a + (a.empty() ? "" : ", ") + b; }) + ")");
        return true;
    }
    LOG_DEBUG("No SPA indicators found for URL: " + url);
    return false;
}

} // namespace sitewatch::crawler
