#include <catch2/catch_test_macros.hpp>
#include "../../include/sitewatch/auth/LoginDetector.h"

using namespace sitewatch::auth;

TEST_CASE("HeuristicLoginDetector - Form login pages", "[LoginDetector]") {
    HeuristicLoginDetector detector;

    const std::string html = R"(<html><head><title>Sign in to Docs</title></head><body>
        <form id="login-form" action="/session">
          <input name="username" type="text">
          <input name="password" type="password">
          <button type="submit">Sign in</button>
        </form></body></html>)";

    LoginDetection detection = detector.detect(html, "https://docs.example.com/login");
    REQUIRE(detection.isLoginPage);
    REQUIRE(detection.loginMethod == LoginMethod::FORM);
    REQUIRE_FALSE(detection.error.has_value());
    REQUIRE(detection.suggestedFields.usernameSelector == "[name=\"username\"]");
    REQUIRE(detection.suggestedFields.passwordSelector == "[name=\"password\"]");
    REQUIRE(detection.suggestedFields.formSelector == "#login-form");
}

TEST_CASE("HeuristicLoginDetector - Federated login pages", "[LoginDetector]") {
    HeuristicLoginDetector detector;

    SECTION("SAML") {
        const std::string html = R"(<html><head><title>Sign in</title></head><body>
            <p>Continue with Single Sign On through your identity provider.</p>
            <a href="/saml/start">Continue</a></body></html>)";
        LoginDetection detection = detector.detect(html, "https://intranet.example.com/");
        REQUIRE(detection.isLoginPage);
        REQUIRE(detection.loginMethod == LoginMethod::SAML);
        REQUIRE(detection.error.has_value());
    }

    SECTION("OAuth") {
        const std::string html = R"(<html><head><title>Log in</title></head><body>
            <a href="https://accounts.google.com/o/oauth2/auth?client_id=1">Continue with Google</a>
            </body></html>)";
        LoginDetection detection = detector.detect(html, "https://app.example.com/welcome");
        REQUIRE(detection.isLoginPage);
        REQUIRE(detection.loginMethod == LoginMethod::OAUTH);
        REQUIRE(detection.error.has_value());
    }
}

TEST_CASE("HeuristicLoginDetector - Ordinary pages", "[LoginDetector]") {
    HeuristicLoginDetector detector;

    SECTION("Login words without a password field or federation evidence") {
        const std::string html = R"(<html><head><title>Release notes</title></head><body>
            <p>Log in to leave a comment.</p></body></html>)";
        REQUIRE_FALSE(detector.detect(html, "https://example.com/blog/post").isLoginPage);
    }

    SECTION("No login vocabulary at all") {
        REQUIRE_FALSE(detector.detect("<html><body><p>Hello</p></body></html>", "https://example.com/").isLoginPage);
    }
}

TEST_CASE("credentialPromptFor - Method specific hints", "[LoginDetector]") {
    REQUIRE(credentialPromptFor("example.com", LoginMethod::FORM).find("username and password") != std::string::npos);
    REQUIRE(credentialPromptFor("example.com", LoginMethod::SAML).find("cookie credentials") != std::string::npos);
    REQUIRE(credentialPromptFor("example.com", LoginMethod::OAUTH).find("OAuth") != std::string::npos);
    REQUIRE(loginMethodToString(LoginMethod::UNKNOWN) == "unknown");
}
