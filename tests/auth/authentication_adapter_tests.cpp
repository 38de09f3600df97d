#include <catch2/catch_test_macros.hpp>
#include "../support/FakeHttpSession.h"
#include "../support/FakeLoginDetector.h"
#include "../../include/sitewatch/auth/AuthenticationAdapter.h"
#include "../../include/sitewatch/auth/AuthenticationError.h"

#include <algorithm>

using namespace sitewatch;
using namespace sitewatch::auth;
using sitewatch::testing::FakeHttpSession;
using sitewatch::testing::FakeLoginDetector;
using sitewatch::testing::FakeResponse;

namespace {

AuthenticationAdapter makeAdapter() {
    return AuthenticationAdapter(std::make_shared<const FakeLoginDetector>());
}

crawler::PageFetchResult loginPage(const std::string& url, const std::string& html) {
    crawler::PageFetchResult page;
    page.success = true;
    page.statusCode = 200;
    page.contentType = "text/html";
    page.content = html;
    page.finalUrl = url;
    return page;
}

bool hasField(const crawler::FormFields& fields, const std::string& name, const std::string& value) {
    return std::find(fields.begin(), fields.end(), std::make_pair(name, value)) != fields.end();
}

const char* kPlainLoginForm = R"(<html><body>
<form action="/auth/submit" method="post">
  <input name="email" type="email">
  <input name="pwd" type="password">
  <input type="checkbox" name="remember" checked>
  <input type="checkbox" name="newsletter">
  <select name="region"><option value="eu">EU</option><option value="us" selected>US</option></select>
  <input type="submit" name="go" value="Log in">
</form></body></html>)";

} // namespace

TEST_CASE("AuthenticationAdapter - Preparing a context", "[AuthenticationAdapter]") {
    AuthenticationAdapter adapter = makeAdapter();

    SECTION("No credential leaves the context anonymous") {
        BrowsingContext context = adapter.prepare(std::nullopt, "https://example.com/");
        REQUIRE(context.authMethod() == crawler::AuthMethod::NONE);
        REQUIRE(context.requestHeadersFor("https://example.com/").empty());
    }

    SECTION("Cookie credential is sent on matching requests") {
        CookieAuth cookies;
        cookies.cookies.push_back(CookieSpec{"sid", "abc", "", ""});
        BrowsingContext context = adapter.prepare(AuthConfig(cookies), "https://example.com/start");

        REQUIRE(context.hasCredentials());
        REQUIRE(context.cookies()[0].domain == "example.com");
        REQUIRE(context.cookies()[0].path == "/");
        REQUIRE(context.cookieHeaderFor("https://example.com/any/page") == "sid=abc");
        REQUIRE(context.cookieHeaderFor("https://other.org/") == "");
    }

    SECTION("Basic credential") {
        BrowsingContext context = adapter.prepare(AuthConfig(BasicAuth{"bob", "pw"}), "https://example.com/");
        REQUIRE(context.basicAuth().has_value());
        REQUIRE(context.basicAuth()->username == "bob");
        REQUIRE(context.hasCredentials());
    }

    SECTION("Header credential") {
        HeaderAuth headers;
        headers.headers["Authorization"] = "Bearer t0k";
        BrowsingContext context = adapter.prepare(AuthConfig(headers), "https://example.com/");
        REQUIRE(context.credentialDomain() == "example.com");
        REQUIRE(context.headersFor("https://example.com/docs").at("Authorization") == "Bearer t0k");
        REQUIRE(context.headersFor("https://cdn.other.net/app.js").empty());
    }

    SECTION("Form credential is kept for a later login") {
        FormAuth form;
        form.username = "alice";
        form.password = "s3cret";
        BrowsingContext context = adapter.prepare(AuthConfig(form), "https://example.com/");
        REQUIRE(context.formAuth().has_value());
        REQUIRE(context.requestHeadersFor("https://example.com/").empty());
    }

    SECTION("SSO sends nothing and asks for a manual credential") {
        BrowsingContext context = adapter.prepare(AuthConfig(SsoAuth{"Okta", "intranet.example.com"}),
                                                  "https://intranet.example.com/");
        REQUIRE(context.authMethod() == crawler::AuthMethod::SSO);
        REQUIRE(context.requiresManualCredential());
        REQUIRE(context.unsupportedReason()->find("cookie credentials") != std::string::npos);
        REQUIRE(context.cookies().empty());
        REQUIRE_FALSE(context.hasHeaders());
        REQUIRE_FALSE(context.basicAuth().has_value());
    }
}

TEST_CASE("AuthenticationAdapter - Form login", "[AuthenticationAdapter]") {
    AuthenticationAdapter adapter = makeAdapter();
    FakeHttpSession session;
    BrowsingContext context;

    FormAuth credential;
    credential.username = "alice@example.com";
    credential.password = "s3cret";

    FakeResponse accepted;
    accepted.body = "<html><body>Dashboard</body></html>";
    accepted.finalUrl = "https://example.com/dashboard";
    accepted.setCookies = {"sid=abc; Path=/"};

    SECTION("Fields are located and the form is posted to its action") {
        session.setPostResponse("https://example.com/auth/submit", accepted);
        auto result = adapter.performFormLogin(session, context,
                                               loginPage("https://example.com/account", kPlainLoginForm),
                                               credential, common::CancellationToken());

        REQUIRE(result.success);
        REQUIRE(result.finalUrl == "https://example.com/dashboard");
        REQUIRE(context.cookieHeaderFor("https://example.com/") == "sid=abc");

        const auto& fields = session.requests().back().fields;
        REQUIRE(hasField(fields, "email", "alice@example.com"));
        REQUIRE(hasField(fields, "pwd", "s3cret"));
        REQUIRE(hasField(fields, "remember", "on"));
        REQUIRE(hasField(fields, "region", "us"));
        REQUIRE(hasField(fields, "go", "Log in"));
        REQUIRE(std::none_of(fields.begin(), fields.end(),
                             [](const auto& f) { return f.first == "newsletter"; }));
    }

    SECTION("Configured selectors and loginUrl are used") {
        session.setHtml("https://example.com/signon", R"(<html><body>
            <form id="main"><input id="u" name="user_id"><input id="p" name="secret" type="password"></form>
            </body></html>)");
        session.setPostResponse("https://example.com/signon", accepted);
        credential.loginUrl = "https://example.com/signon";
        credential.usernameSelector = "#u";
        credential.passwordSelector = "#p";
        credential.formSelector = "#main";

        auto result = adapter.performFormLogin(session, context, loginPage("https://example.com/", "<html></html>"),
                                               credential, common::CancellationToken());
        REQUIRE(result.success);
        REQUIRE(session.countRequests("GET", "https://example.com/signon") == 1);
        REQUIRE(session.countRequests("POST", "https://example.com/signon") == 1);
        REQUIRE(hasField(session.requests().back().fields, "user_id", "alice@example.com"));
    }

    SECTION("Landing on a login URL again is a login loop") {
        accepted.finalUrl = "https://example.com/login?error=1";
        session.setPostResponse("https://example.com/auth/submit", accepted);
        try {
            adapter.performFormLogin(session, context, loginPage("https://example.com/account", kPlainLoginForm),
                                     credential, common::CancellationToken());
            FAIL("Expected AuthenticationError");
        } catch (const AuthenticationError& e) {
            REQUIRE(std::string(e.what()) == "Authentication failed - still on login page. Please check credentials.");
            REQUIRE(e.loginMethod() == "form");
        }
    }

    SECTION("Missing fields fail before anything is posted") {
        REQUIRE_THROWS_AS(adapter.performFormLogin(session, context,
                                                   loginPage("https://example.com/account",
                                                             "<html><body><form><input name=\"q\"></form></body></html>"),
                                                   credential, common::CancellationToken()),
                          AuthenticationError);
        REQUIRE(session.requests().empty());
    }

    SECTION("Rejected submission is an authentication error") {
        FakeResponse rejected;
        rejected.statusCode = 500;
        session.setPostResponse("https://example.com/auth/submit", rejected);
        REQUIRE_THROWS_AS(adapter.performFormLogin(session, context,
                                                   loginPage("https://example.com/account", kPlainLoginForm),
                                                   credential, common::CancellationToken()),
                          AuthenticationError);
    }
}

TEST_CASE("AuthenticationAdapter - Login URLs", "[AuthenticationAdapter]") {
    REQUIRE(AuthenticationAdapter::isLoginUrl("https://example.com/login"));
    REQUIRE(AuthenticationAdapter::isLoginUrl("https://example.com/users/SignIn?next=/"));
    REQUIRE_FALSE(AuthenticationAdapter::isLoginUrl("https://example.com/dashboard"));
    REQUIRE_THROWS_AS(AuthenticationAdapter(nullptr), std::invalid_argument);
}
