#include "FailureClassifier.h"
#include "../../include/sitewatch/common/Logger.h"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace sitewatch::crawler {

FailureType FailureClassifier::classifyFailure(int httpCode,
                                               CURLcode curlCode,
                                               const std::string& errorMessage,
                                               const CrawlOptions& options) {
    LOG_DEBUG("Classifying failure - HTTP: " + std::to_string(httpCode) +
              ", CURL: " + std::to_string(static_cast<int>(curlCode)) +
              ", Error: " + errorMessage);

    if (httpCode == 429) {
        LOG_DEBUG("Classified as RATE_LIMITED (HTTP 429)");
        return FailureType::RATE_LIMITED;
    }

    if (httpCode > 0) {
        if (isAuthenticationHttpError(httpCode)) {
            LOG_DEBUG("Classified as AUTHENTICATION (HTTP " + std::to_string(httpCode) + ")");
            return FailureType::AUTHENTICATION;
        }
        if (isPermanentHttpError(httpCode)) {
            LOG_DEBUG("Classified as PERMANENT (HTTP " + std::to_string(httpCode) + ")");
            return FailureType::PERMANENT;
        }
        if (options.retryableHttpCodes.count(httpCode) > 0) {
            LOG_DEBUG("Classified as TEMPORARY (retryable HTTP " + std::to_string(httpCode) + ")");
            return FailureType::TEMPORARY;
        }
        if (httpCode >= 500 && httpCode < 600) {
            LOG_DEBUG("Classified as TEMPORARY (5xx server error)");
            return FailureType::TEMPORARY;
        }
    }

    if (curlCode != CURLE_OK) {
        if (isPermanentCurlError(curlCode)) {
            LOG_DEBUG("Classified as PERMANENT (CURL error " + std::to_string(static_cast<int>(curlCode)) + ")");
            return FailureType::PERMANENT;
        }
        if (options.retryableCurlCodes.count(curlCode) > 0) {
            LOG_DEBUG("Classified as TEMPORARY (retryable CURL error " + std::to_string(static_cast<int>(curlCode)) + ")");
            return FailureType::TEMPORARY;
        }
    }

    std::string lowerError = errorMessage;
    std::transform(lowerError.begin(), lowerError.end(), lowerError.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowerError.find("authentication failed") != std::string::npos ||
        lowerError.find("login page") != std::string::npos ||
        lowerError.find("requires authentication") != std::string::npos) {
        LOG_DEBUG("Classified as AUTHENTICATION (login wall)");
        return FailureType::AUTHENTICATION;
    }

    if (lowerError.find("name or service not known") != std::string::npos ||
        lowerError.find("no such host is known") != std::string::npos ||
        lowerError.find("nodename nor servname provided") != std::string::npos) {
        LOG_DEBUG("Classified as PERMANENT (DNS resolution failed)");
        return FailureType::PERMANENT;
    }

    if (lowerError.find("timeout") != std::string::npos ||
        lowerError.find("timed out") != std::string::npos ||
        lowerError.find("connection") != std::string::npos ||
        lowerError.find("network") != std::string::npos) {
        LOG_DEBUG("Classified as TEMPORARY (network/timeout issue)");
        return FailureType::TEMPORARY;
    }

    LOG_DEBUG("Classified as UNKNOWN (unrecognized error pattern)");
    return FailureType::UNKNOWN;
}

bool FailureClassifier::shouldRetry(FailureType failureType, int retryCount, int maxRetries) {
    // Credentials do not fix themselves between attempts
    if (failureType == FailureType::PERMANENT || failureType == FailureType::AUTHENTICATION) {
        return false;
    }

    if (retryCount >= maxRetries) {
        return false;
    }

    if (failureType == FailureType::TEMPORARY || failureType == FailureType::RATE_LIMITED) {
        return true;
    }

    // Unknown failures get at most half the retry budget
    if (failureType == FailureType::UNKNOWN) {
        return retryCount < (maxRetries / 2);
    }

    return false;
}

std::chrono::milliseconds FailureClassifier::calculateRetryDelay(int retryCount,
                                                                 const CrawlOptions& options,
                                                                 FailureType failureType) {
    std::chrono::milliseconds baseDelay = options.baseRetryDelay;
    if (failureType == FailureType::RATE_LIMITED) {
        baseDelay = options.rateLimitDelay;
    }

    // base * (multiplier ^ (retryCount - 1))
    double multiplier = std::pow(options.backoffMultiplier, std::max(0, retryCount - 1));
    auto calculatedDelay = std::chrono::milliseconds(
        static_cast<long long>(static_cast<double>(baseDelay.count()) * multiplier));

    auto finalDelay = std::min(calculatedDelay, options.maxRetryDelay);

    LOG_DEBUG("Calculated retry delay for attempt " + std::to_string(retryCount) +
              ": " + std::to_string(finalDelay.count()) + "ms (type: " +
              getFailureTypeDescription(failureType) + ")");

    return finalDelay;
}

std::string FailureClassifier::getFailureTypeDescription(FailureType failureType) {
    switch (failureType) {
        case FailureType::TEMPORARY:
            return "TEMPORARY";
        case FailureType::RATE_LIMITED:
            return "RATE_LIMITED";
        case FailureType::PERMANENT:
            return "PERMANENT";
        case FailureType::AUTHENTICATION:
            return "AUTHENTICATION";
        case FailureType::UNKNOWN:
            return "UNKNOWN";
    }
    return "INVALID";
}

bool FailureClassifier::isAuthenticationHttpError(int httpCode) {
    return httpCode == 401 || httpCode == 403 || httpCode == 407;
}

bool FailureClassifier::isPermanentHttpError(int httpCode) {
    switch (httpCode) {
        case 400: // Bad Request
        case 404: // Not Found
        case 405: // Method Not Allowed
        case 406: // Not Acceptable
        case 409: // Conflict
        case 410: // Gone
        case 411: // Length Required
        case 412: // Precondition Failed
        case 413: // Payload Too Large
        case 414: // URI Too Long
        case 415: // Unsupported Media Type
        case 416: // Range Not Satisfiable
        case 417: // Expectation Failed
        case 421: // Misdirected Request
        case 422: // Unprocessable Entity
        case 423: // Locked
        case 424: // Failed Dependency
        case 426: // Upgrade Required
        case 428: // Precondition Required
        case 431: // Request Header Fields Too Large
        case 451: // Unavailable For Legal Reasons
            return true;
        default:
            return false;
    }
}

bool FailureClassifier::isPermanentCurlError(CURLcode curlCode) {
    switch (curlCode) {
        case CURLE_UNSUPPORTED_PROTOCOL:
        case CURLE_FAILED_INIT:
        case CURLE_URL_MALFORMAT:
        case CURLE_NOT_BUILT_IN:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_FUNCTION_NOT_FOUND:
        case CURLE_ABORTED_BY_CALLBACK:      // cancellation
        case CURLE_BAD_FUNCTION_ARGUMENT:
        case CURLE_INTERFACE_FAILED:
        case CURLE_TOO_MANY_REDIRECTS:
        case CURLE_UNKNOWN_OPTION:
        case CURLE_PEER_FAILED_VERIFICATION:
            return true;
        default:
            return false;
    }
}

} // namespace sitewatch::crawler
