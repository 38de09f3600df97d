#pragma once

#include "../auth/BrowsingContext.h"
#include "../common/CancellationToken.h"

#include <curl/curl.h>
#include <string>
#include <utility>
#include <vector>

namespace sitewatch::crawler {

struct PageFetchResult {
    bool success = false;
    int statusCode = 0;
    std::string contentType;
    std::string content;
    std::string errorMessage;
    std::string finalUrl;          // After redirects
    CURLcode curlCode = CURLE_OK;  // Transport error for retry classification
};

using FormFields = std::vector<std::pair<std::string, std::string>>;

// Transport used by the scraper and the form-login flow. Implementations send
// the context's headers and cookies, store Set-Cookie responses back into the
// context, follow redirects and abort promptly when `cancel` trips.
class HttpSession {
public:
    virtual ~HttpSession() = default;

    virtual PageFetchResult get(const std::string& url,
                                auth::BrowsingContext& context,
                                const common::CancellationToken& cancel) = 0;

    // application/x-www-form-urlencoded POST
    virtual PageFetchResult postForm(const std::string& url,
                                     const FormFields& fields,
                                     auth::BrowsingContext& context,
                                     const common::CancellationToken& cancel) = 0;
};

} // namespace sitewatch::crawler
