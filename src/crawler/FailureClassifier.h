#pragma once

#include <chrono>
#include <string>
#include <curl/curl.h>
#include "../../include/sitewatch/crawler/models/CrawlOptions.h"
#include "../../include/sitewatch/crawler/models/FailureType.h"

namespace sitewatch::crawler {

class FailureClassifier {
public:
    /**
     * Classify a failure based on HTTP status code, CURL error, and error message
     * @param httpCode HTTP status code (0 if not HTTP-related)
     * @param curlCode CURL error code
     * @param errorMessage Error message string
     * @param options Crawl options with retry settings
     * @return FailureType indicating how to handle this failure
     */
    static FailureType classifyFailure(int httpCode,
                                       CURLcode curlCode,
                                       const std::string& errorMessage,
                                       const CrawlOptions& options);

    /**
     * Check if a failure should be retried based on its classification
     * @param failureType The type of failure
     * @param retryCount Number of retries already attempted
     * @param maxRetries Maximum allowed retries
     * @return true if should retry, false otherwise
     */
    static bool shouldRetry(FailureType failureType, int retryCount, int maxRetries);

    /**
     * Calculate the delay before next retry attempt using exponential backoff
     * @param retryCount Current retry attempt number (1-based)
     * @param options Crawl options with retry settings
     * @param failureType Type of failure (affects delay calculation)
     * @return Delay in milliseconds before next retry
     */
    static std::chrono::milliseconds calculateRetryDelay(int retryCount,
                                                         const CrawlOptions& options,
                                                         FailureType failureType);

    static std::string getFailureTypeDescription(FailureType failureType);

private:
    static bool isAuthenticationHttpError(int httpCode);
    static bool isPermanentHttpError(int httpCode);
    static bool isPermanentCurlError(CURLcode curlCode);
};

} // namespace sitewatch::crawler
