#pragma once

#include "../auth/AuthConfig.h"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sitewatch::crawler {

struct BrowserlessRenderResult {
    bool success = false;
    std::string html;
    std::string error;
    int statusCode = 0;
    std::chrono::milliseconds renderTime{0};
};

// Client for a browserless /content endpoint, used to render pages whose
// content only appears after client-side scripts run.
class BrowserlessClient {
public:
    explicit BrowserlessClient(const std::string& browserlessUrl);
    ~BrowserlessClient();

    BrowserlessRenderResult renderUrl(const std::string& url,
                                      int timeoutMs,
                                      bool waitForNetworkIdle,
                                      const std::map<std::string, std::string>& headers,
                                      const std::vector<auth::CookieSpec>& cookies,
                                      const std::optional<auth::BasicAuth>& credentials);

    bool isAvailable();
    void setUserAgent(const std::string& userAgent);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace sitewatch::crawler
