#include <catch2/catch_test_macros.hpp>
#include "../../include/sitewatch/auth/AuthErrorAdvisor.h"

using namespace sitewatch;
using namespace sitewatch::auth;

TEST_CASE("AuthErrorAdvisor - Internal domains", "[AuthErrorAdvisor]") {
    AuthErrorAdvisor advisor({"corp.example.org", ".lab"});

    REQUIRE(advisor.isInternalDomain("https://acme.sharepoint.com/sites/team"));
    REQUIRE(advisor.isInternalDomain("https://acme.atlassian.net/wiki"));
    REQUIRE(advisor.isInternalDomain("https://wiki.internal/"));
    REQUIRE(advisor.isInternalDomain("https://portal.corp.acme.com/"));
    REQUIRE(advisor.isInternalDomain("https://docs.corp.example.org/"));
    REQUIRE(advisor.isInternalDomain("https://build.lab/"));
    REQUIRE_FALSE(advisor.isInternalDomain("https://example.com/"));
    REQUIRE_FALSE(advisor.isInternalDomain("https://notsharepoint.com/"));
    REQUIRE_FALSE(advisor.isInternalDomain("not a url"));

    REQUIRE(AuthErrorAdvisor::isExternalCredentialSite("https://me.sap.com/home"));
    REQUIRE_FALSE(AuthErrorAdvisor::isExternalCredentialSite("https://example.com/"));
}

TEST_CASE("AuthErrorAdvisor - Classifying messages", "[AuthErrorAdvisor]") {
    AuthErrorAdvisor advisor;

    REQUIRE(AuthErrorAdvisor::looksLikeAuthError("HTTP 401"));
    REQUIRE(AuthErrorAdvisor::looksLikeAuthError("Access is denied"));
    REQUIRE(AuthErrorAdvisor::looksLikeAuthError("Redirected to login"));
    REQUIRE_FALSE(AuthErrorAdvisor::looksLikeAuthError("HTTP 404"));
    REQUIRE_FALSE(AuthErrorAdvisor::looksLikeAuthError("HTTP 4010"));

    SECTION("Internal site suggests cookies") {
        AuthErrorAdvice advice = advisor.classifyError("https://acme.sharepoint.com/", "HTTP 403");
        REQUIRE(advice.isAuthError);
        REQUIRE(advice.needsCredentials);
        REQUIRE(advice.loginMethod == std::optional<std::string>("cookie"));
        REQUIRE(advice.suggestion.find("FedAuth") != std::string::npos);
    }

    SECTION("Vendor portal asks for credentials") {
        AuthErrorAdvice advice = advisor.classifyError("https://support.sap.com/x", "unauthorized");
        REQUIRE(advice.isAuthError);
        REQUIRE(advice.suggestion.find("Credentials Manager") != std::string::npos);
    }

    SECTION("Non-auth failures carry no advice") {
        AuthErrorAdvice advice = advisor.classifyError("https://example.com/", "HTTP 500");
        REQUIRE_FALSE(advice.isAuthError);
        REQUIRE(advice.suggestion.empty());
    }
}

TEST_CASE("AuthErrorAdvisor - Error entries", "[AuthErrorAdvisor]") {
    AuthErrorAdvisor advisor;

    SECTION("Plain failures are left as they are") {
        crawler::CrawlError error = advisor.analyzeError("https://example.com/x", "HTTP 500", true);
        REQUIRE(error.error == "HTTP 500");
        REQUIRE_FALSE(error.isAuthError);
    }

    SECTION("Known authentication failures are classified even without telling words") {
        crawler::CrawlError error = advisor.analyzeError("https://example.com/x", "HTTP 200 page", true, true);
        REQUIRE(error.isAuthError);
        REQUIRE(error.failureType == crawler::FailureType::AUTHENTICATION);
        REQUIRE(error.error.find("💡") != std::string::npos);
    }

    SECTION("Prompting adds a credential hint for vendor portals") {
        crawler::CrawlError error = advisor.analyzeError("https://me.sap.com/home", "HTTP 401", true);
        REQUIRE(error.loginMethod == std::optional<std::string>("form"));
        REQUIRE(error.error.find("🔑") != std::string::npos);

        crawler::CrawlError quiet = advisor.analyzeError("https://me.sap.com/home", "HTTP 401", false);
        REQUIRE(quiet.error.find("🔑") == std::string::npos);
    }

    SECTION("Internal domain without credentials") {
        crawler::CrawlError error = advisor.internalDomainError("https://acme.atlassian.net/wiki");
        REQUIRE(error.url == "https://acme.atlassian.net/wiki");
        REQUIRE(error.needsCredentials);
        REQUIRE(error.loginMethod == std::optional<std::string>("cookie"));
        REQUIRE(error.error.find("acme.atlassian.net") != std::string::npos);
        REQUIRE(error.error.find("Atlassian") != std::string::npos);
    }
}
