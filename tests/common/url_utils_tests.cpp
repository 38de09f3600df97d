#include <catch2/catch_test_macros.hpp>
#include "../../include/sitewatch/common/UrlUtils.h"

using namespace sitewatch::common;

TEST_CASE("UrlUtils - parseUrl splits the components", "[UrlUtils]") {
    auto parsed = parseUrl("HTTPS://Docs.Example.com:8443/guide/intro?lang=en#setup");
    REQUIRE(parsed);
    REQUIRE(parsed->scheme == "https");
    REQUIRE(parsed->host == "docs.example.com");
    REQUIRE(parsed->port == "8443");
    REQUIRE(parsed->path == "/guide/intro");
    REQUIRE(parsed->query == "lang=en");
    REQUIRE(parsed->fragment == "setup");
    REQUIRE(parsed->origin() == "https://docs.example.com:8443");

    SECTION("Relative and schemeless input is rejected") {
        REQUIRE_FALSE(parseUrl("/relative/path"));
        REQUIRE_FALSE(parseUrl("not a url"));
    }
}

TEST_CASE("UrlUtils - normalizeUrl gives one key per page", "[UrlUtils]") {
    REQUIRE(normalizeUrl("https://Example.com:443/a/#top") == "https://example.com/a");
    REQUIRE(normalizeUrl("https://example.com/a") == "https://example.com/a");
    REQUIRE(normalizeUrl("http://example.com:80") == "http://example.com/");
    REQUIRE(normalizeUrl("https://example.com/a?x=1") != normalizeUrl("https://example.com/a?x=2"));
}

TEST_CASE("UrlUtils - resolveUrl follows reference resolution", "[UrlUtils]") {
    SECTION("Relative paths and dot segments") {
        REQUIRE(resolveUrl("https://example.com/docs/a/b", "../c") == std::optional<std::string>("https://example.com/docs/c"));
        REQUIRE(resolveUrl("https://example.com/docs/a", "b") == std::optional<std::string>("https://example.com/docs/b"));
    }

    SECTION("Absolute paths and full URLs") {
        REQUIRE(resolveUrl("https://example.com/docs/a", "/root") == std::optional<std::string>("https://example.com/root"));
        REQUIRE(resolveUrl("https://example.com/docs/a", "https://other.org/x") == std::optional<std::string>("https://other.org/x"));
        REQUIRE(resolveUrl("https://example.com/docs/a", "//cdn.example.com/lib.js") ==
                std::optional<std::string>("https://cdn.example.com/lib.js"));
    }
}

TEST_CASE("UrlUtils - host helpers", "[UrlUtils]") {
    REQUIRE(extractHost("https://Sub.Example.com/page") == "sub.example.com");
    REQUIRE(extractHost("garbage").empty());
    REQUIRE(isSameHost("https://example.com/a", "http://EXAMPLE.com/b"));
    REQUIRE_FALSE(isSameHost("https://example.com/a", "https://sub.example.com/a"));
    REQUIRE(isHttpUrl("http://example.com"));
    REQUIRE_FALSE(isHttpUrl("ftp://example.com/file"));
    REQUIRE_FALSE(isHttpUrl("javascript:void(0)"));
}

TEST_CASE("UrlUtils - sanitizeUrl strips invisible characters", "[UrlUtils]") {
    std::string pasted = "  https://example.com/\xE2\x80\x8Bpage\xEF\xBB\xBF\n";
    REQUIRE(sanitizeUrl(pasted) == "https://example.com/page");
    REQUIRE(stripFragment("https://example.com/a#b") == "https://example.com/a");
}
