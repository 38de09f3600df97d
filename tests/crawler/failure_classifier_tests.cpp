#include <catch2/catch_test_macros.hpp>
#include "FailureClassifier.h"

using namespace sitewatch::crawler;

TEST_CASE("FailureClassifier - HTTP status codes", "[FailureClassifier]") {
    CrawlOptions options;

    REQUIRE(FailureClassifier::classifyFailure(429, CURLE_OK, "", options) == FailureType::RATE_LIMITED);
    REQUIRE(FailureClassifier::classifyFailure(401, CURLE_OK, "", options) == FailureType::AUTHENTICATION);
    REQUIRE(FailureClassifier::classifyFailure(403, CURLE_OK, "", options) == FailureType::AUTHENTICATION);
    REQUIRE(FailureClassifier::classifyFailure(407, CURLE_OK, "", options) == FailureType::AUTHENTICATION);
    REQUIRE(FailureClassifier::classifyFailure(404, CURLE_OK, "", options) == FailureType::PERMANENT);
    REQUIRE(FailureClassifier::classifyFailure(410, CURLE_OK, "", options) == FailureType::PERMANENT);
    REQUIRE(FailureClassifier::classifyFailure(503, CURLE_OK, "", options) == FailureType::TEMPORARY);
    REQUIRE(FailureClassifier::classifyFailure(599, CURLE_OK, "", options) == FailureType::TEMPORARY);
}

TEST_CASE("FailureClassifier - Transport errors and messages", "[FailureClassifier]") {
    CrawlOptions options;

    REQUIRE(FailureClassifier::classifyFailure(0, CURLE_OPERATION_TIMEDOUT, "", options) == FailureType::TEMPORARY);
    REQUIRE(FailureClassifier::classifyFailure(0, CURLE_COULDNT_RESOLVE_HOST, "", options) == FailureType::TEMPORARY);
    REQUIRE(FailureClassifier::classifyFailure(0, CURLE_URL_MALFORMAT, "", options) == FailureType::PERMANENT);
    REQUIRE(FailureClassifier::classifyFailure(0, CURLE_TOO_MANY_REDIRECTS, "", options) == FailureType::PERMANENT);

    REQUIRE(FailureClassifier::classifyFailure(0, CURLE_OK, "Authentication failed - still on login page", options) ==
            FailureType::AUTHENTICATION);
    REQUIRE(FailureClassifier::classifyFailure(0, CURLE_OK, "Name or service not known", options) ==
            FailureType::PERMANENT);
    REQUIRE(FailureClassifier::classifyFailure(0, CURLE_OK, "Connection reset by peer", options) ==
            FailureType::TEMPORARY);
    REQUIRE(FailureClassifier::classifyFailure(0, CURLE_OK, "something odd", options) == FailureType::UNKNOWN);
}

TEST_CASE("FailureClassifier - Retry decisions", "[FailureClassifier]") {
    SECTION("Permanent and authentication failures are never retried") {
        REQUIRE_FALSE(FailureClassifier::shouldRetry(FailureType::PERMANENT, 0, 3));
        REQUIRE_FALSE(FailureClassifier::shouldRetry(FailureType::AUTHENTICATION, 0, 3));
    }

    SECTION("Temporary failures use the whole budget") {
        REQUIRE(FailureClassifier::shouldRetry(FailureType::TEMPORARY, 0, 3));
        REQUIRE(FailureClassifier::shouldRetry(FailureType::TEMPORARY, 2, 3));
        REQUIRE_FALSE(FailureClassifier::shouldRetry(FailureType::TEMPORARY, 3, 3));
        REQUIRE(FailureClassifier::shouldRetry(FailureType::RATE_LIMITED, 1, 3));
    }

    SECTION("Unknown failures use half the budget") {
        REQUIRE(FailureClassifier::shouldRetry(FailureType::UNKNOWN, 0, 4));
        REQUIRE(FailureClassifier::shouldRetry(FailureType::UNKNOWN, 1, 4));
        REQUIRE_FALSE(FailureClassifier::shouldRetry(FailureType::UNKNOWN, 2, 4));
    }
}

TEST_CASE("FailureClassifier - Retry delay", "[FailureClassifier]") {
    CrawlOptions options;
    options.baseRetryDelay = std::chrono::milliseconds(1000);
    options.backoffMultiplier = 2.0f;
    options.maxRetryDelay = std::chrono::milliseconds(5000);
    options.rateLimitDelay = std::chrono::milliseconds(3000);

    REQUIRE(FailureClassifier::calculateRetryDelay(1, options, FailureType::TEMPORARY).count() == 1000);
    REQUIRE(FailureClassifier::calculateRetryDelay(2, options, FailureType::TEMPORARY).count() == 2000);
    REQUIRE(FailureClassifier::calculateRetryDelay(3, options, FailureType::TEMPORARY).count() == 4000);
    REQUIRE(FailureClassifier::calculateRetryDelay(4, options, FailureType::TEMPORARY).count() == 5000);
    REQUIRE(FailureClassifier::calculateRetryDelay(1, options, FailureType::RATE_LIMITED).count() == 3000);

    REQUIRE(FailureClassifier::getFailureTypeDescription(FailureType::RATE_LIMITED) == "RATE_LIMITED");
}
