#include "../../include/sitewatch/crawler/PageScraper.h"
#include "../../include/sitewatch/auth/AuthenticationError.h"
#include "../../include/sitewatch/common/Logger.h"
#include "FailureClassifier.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace sitewatch::crawler {

PageScraper::PageScraper(std::shared_ptr<HttpSession> session,
                         auth::BrowsingContext context,
                         std::shared_ptr<const auth::AuthenticationAdapter> authentication,
                         CrawlOptions options)
    : session_(std::move(session)),
      context_(std::move(context)),
      authentication_(std::move(authentication)),
      options_(std::move(options)) {
    if (!session_ || !authentication_) {
        throw std::invalid_argument("PageScraper requires an HTTP session and an authentication adapter");
    }
}

bool PageScraper::isHtmlContent(const std::string& contentType) {
    if (contentType.empty()) {
        return true;
    }
    std::string lower = contentType;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("html") != std::string::npos || lower.find("text/plain") != std::string::npos;
}

PageFetchResult PageScraper::fetchWithRetry(const std::string& url, const common::CancellationToken& cancel) {
    int retryCount = 0;
    while (true) {
        PageFetchResult result = session_->get(url, context_, cancel);
        if (result.success || cancel.isCancelled()) {
            if (retryCount > 0 && result.success) {
                LOG_INFO("Successfully downloaded on retry attempt " + std::to_string(retryCount) + ": " + url);
            }
            return result;
        }

        FailureType failureType = FailureClassifier::classifyFailure(
            result.statusCode, result.curlCode, result.errorMessage, options_);
        if (!FailureClassifier::shouldRetry(failureType, retryCount, options_.maxRetries)) {
            return result;
        }

        auto retryDelay = FailureClassifier::calculateRetryDelay(retryCount + 1, options_, failureType);
        std::string retryReason = result.statusCode > 0
            ? "HTTP " + std::to_string(result.statusCode)
            : (result.errorMessage.empty() ? "Network Error" : result.errorMessage);
        LOG_INFO("Scheduled retry " + std::to_string(retryCount + 1) + "/" + std::to_string(options_.maxRetries) +
                 " for " + url + " in " + std::to_string(retryDelay.count()) + "ms - " + retryReason +
                 " [" + FailureClassifier::getFailureTypeDescription(failureType) + "]");

        if (!cancel.waitFor(retryDelay)) {
            result.errorMessage = "Request cancelled";
            result.curlCode = CURLE_ABORTED_BY_CALLBACK;
            return result;
        }
        ++retryCount;
    }
}

PageFetchResult PageScraper::passLoginWall(const std::string& url,
                                           PageFetchResult fetched,
                                           ScrapeOutcome& outcome,
                                           const common::CancellationToken& cancel) {
    const bool hasFormCredential = context_.formAuth().has_value();
    if (!options_.enableCredentialPrompting && !hasFormCredential) {
        return fetched;
    }

    auth::LoginDetection detection = authentication_->detectLoginPage(fetched.content, fetched.finalUrl);
    if (!detection.isLoginPage) {
        return fetched;
    }

    const std::string method = auth::loginMethodToString(detection.loginMethod);
    LOG_INFO("Login page detected at " + fetched.finalUrl + " (method: " + method + ")");

    if (!hasFormCredential) {
        std::string message = "Login page detected at " + fetched.finalUrl + ". ";
        message += detection.error ? *detection.error : "No form credential is configured for this site.";
        throw auth::AuthenticationError(message, method);
    }
    if (formLoginAttempted_) {
        throw auth::AuthenticationError(
            "Login page shown again after form authentication at " + fetched.finalUrl +
            ". The session was not accepted; please check credentials.", "form");
    }

    formLoginAttempted_ = true;
    outcome.formLoginAttempted = true;
    PageFetchResult loginResult = authentication_->performFormLogin(
        *session_, context_, fetched, *context_.formAuth(), cancel);
    if (cancel.isCancelled()) {
        return loginResult;
    }

    // The login usually redirects somewhere else; fetch the page that was asked for
    PageFetchResult after = fetchWithRetry(url, cancel);
    if (!after.success || cancel.isCancelled()) {
        return after;
    }
    if (authentication_->detectLoginPage(after.content, after.finalUrl).isLoginPage) {
        throw auth::AuthenticationError("Authentication failed - still on login page. Please check credentials.", "form");
    }
    return after;
}

ScrapeOutcome PageScraper::fetchAndExtract(const std::string& url,
                                           int depth,
                                           const std::string& parentUrl,
                                           const templates::WebsiteTemplate* webTemplate,
                                           const common::CancellationToken& cancel) {
    ScrapeOutcome outcome;
    LOG_INFO("Fetching page: " + url);

    PageFetchResult fetched = fetchWithRetry(url, cancel);
    if (cancel.isCancelled()) {
        outcome.errorMessage = "Request cancelled";
        outcome.failureType = FailureType::TEMPORARY;
        return outcome;
    }

    const int firstStatus = fetched.statusCode;
    try {
        if (fetched.success) {
            fetched = passLoginWall(url, std::move(fetched), outcome, cancel);
        }
    } catch (const auth::AuthenticationError& e) {
        LOG_WARNING("Authentication failed for " + url + ": " + e.what());
        outcome.errorMessage = e.what();
        outcome.statusCode = firstStatus;
        outcome.failureType = FailureType::AUTHENTICATION;
        outcome.loginMethod = e.loginMethod();
        return outcome;
    }
    if (cancel.isCancelled()) {
        outcome.errorMessage = "Request cancelled";
        outcome.failureType = FailureType::TEMPORARY;
        return outcome;
    }

    outcome.statusCode = fetched.statusCode;
    LOG_INFO("=== HTTP STATUS: " + std::to_string(fetched.statusCode) + " === for URL: " + url);

    if (!fetched.success) {
        outcome.failureType = FailureClassifier::classifyFailure(
            fetched.statusCode, fetched.curlCode, fetched.errorMessage, options_);
        outcome.errorMessage = fetched.errorMessage.empty()
            ? "HTTP " + std::to_string(fetched.statusCode)
            : fetched.errorMessage;
        LOG_WARNING("Page fetch failed: " + url + " - " + outcome.errorMessage +
                    " (Failure type: " + FailureClassifier::getFailureTypeDescription(outcome.failureType) + ")");
        return outcome;
    }

    if (!isHtmlContent(fetched.contentType)) {
        outcome.failureType = FailureType::PERMANENT;
        outcome.errorMessage = "Unsupported content type: " + fetched.contentType;
        LOG_INFO("Skipping non-HTML content at " + url + " (" + fetched.contentType + ")");
        return outcome;
    }

    const std::string finalUrl = fetched.finalUrl.empty() ? url : fetched.finalUrl;
    ScrapedPage page = extractor_.extract(fetched.content, finalUrl, depth, parentUrl, webTemplate,
                                          options_.extractImages);
    page.url = url;
    page.finalUrl = finalUrl;
    page.statusCode = fetched.statusCode;
    page.metadata.authMethod = context_.authMethod();
    switch (context_.authMethod()) {
        case AuthMethod::CREDENTIALS: page.metadata.contentType = "credential-based"; break;
        case AuthMethod::SSO: page.metadata.contentType = "internal"; break;
        default: page.metadata.contentType = "public"; break;
    }

    LOG_DEBUG("Extracted '" + page.title + "' from " + url + " (" + std::to_string(page.metadata.wordCount) +
              " words, " + std::to_string(page.metadata.links.size()) + " links)");

    outcome.success = true;
    outcome.page = std::move(page);
    return outcome;
}

std::optional<std::string> PageScraper::fetchRobotsTxt(const std::string& origin,
                                                       const common::CancellationToken& cancel) {
    const std::string robotsUrl = origin + "/robots.txt";
    PageFetchResult result = session_->get(robotsUrl, context_, cancel);
    if (!result.success || result.statusCode != 200) {
        LOG_DEBUG("No robots.txt at " + robotsUrl + " (status " + std::to_string(result.statusCode) + ")");
        return std::nullopt;
    }
    return result.content;
}

} // namespace sitewatch::crawler
