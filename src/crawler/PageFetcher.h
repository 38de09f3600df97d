#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <curl/curl.h>
#include "../../include/sitewatch/crawler/BrowserlessClient.h"
#include "../../include/sitewatch/crawler/HttpSession.h"

namespace sitewatch::crawler {

// libcurl transport. Redirects are followed by hand so that every hop picks
// up cookies set by the previous one and a POST can be downgraded to GET.
class PageFetcher : public HttpSession {
public:
    PageFetcher(const std::string& userAgent,
                std::chrono::milliseconds timeout,
                size_t maxRedirects = 5);
    ~PageFetcher() override;

    PageFetchResult get(const std::string& url,
                        auth::BrowsingContext& context,
                        const common::CancellationToken& cancel) override;

    PageFetchResult postForm(const std::string& url,
                             const FormFields& fields,
                             auth::BrowsingContext& context,
                             const common::CancellationToken& cancel) override;

    // Enable/disable SSL verification
    void setVerifySSL(bool verify);

    // Enable/disable SPA detection and rendering through browserless
    void setSpaRendering(bool enable,
                         const std::string& browserlessUrl,
                         std::chrono::milliseconds renderTimeout);

    // Check if a page is likely a SPA (Single Page Application)
    bool isSpaPage(const std::string& html, const std::string& url) const;

private:
    // One request without redirect handling. `location` receives the
    // absolute redirect target when the response carries one.
    PageFetchResult performOnce(const std::string& url,
                                const std::string* formBody,
                                bool sendCredentials,
                                auth::BrowsingContext& context,
                                const common::CancellationToken& cancel,
                                std::string& location);

    PageFetchResult request(const std::string& url,
                            const std::string* formBody,
                            auth::BrowsingContext& context,
                            const common::CancellationToken& cancel);

    void renderIfSpa(PageFetchResult& result, const std::string& url, const auth::BrowsingContext& context);

    static std::string encodeForm(const FormFields& fields);

    // Write callback for CURL
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

    // Collects Set-Cookie and Content-Type header lines
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);

    // Aborts the transfer once the run is cancelled
    static int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow);

    std::string userAgent;
    std::chrono::milliseconds timeout;
    size_t maxRedirects;
    bool verifySSL;

    bool spaRenderingEnabled;
    std::chrono::milliseconds spaRenderTimeout;
    std::unique_ptr<BrowserlessClient> browserlessClient;
};

} // namespace sitewatch::crawler
