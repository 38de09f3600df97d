#pragma once

#include <optional>
#include <string>

namespace sitewatch::common {

// Remove invisible/formatting Unicode codepoints commonly found in copy/pasted URLs
// and strip ASCII control characters and surrounding ASCII whitespace.
// Specifically removes: U+200B, U+200C, U+200D, U+2060, U+FEFF, bidi marks and bytes < 0x20 or 0x7F.
std::string sanitizeUrl(const std::string& input);

// Produce a compact hex dump of the given string for logging/debugging.
std::string hexDump(const std::string& input);

struct ParsedUrl {
    std::string scheme;    // lower-cased
    std::string userInfo;
    std::string host;      // lower-cased
    std::string port;      // empty when absent
    std::string path;      // always starts with '/'
    std::string query;     // without '?'
    std::string fragment;  // without '#'

    std::string origin() const;
    std::string toString(bool withFragment = true) const;
};

// Parses an absolute URL with an authority component ("scheme://host...").
std::optional<ParsedUrl> parseUrl(const std::string& url);

// Resolves `href` against `baseUrl` (RFC 3986 reference resolution, including
// dot-segment removal). Returns std::nullopt for references that cannot be resolved.
std::optional<std::string> resolveUrl(const std::string& baseUrl, const std::string& href);

// Canonical form used for de-duplication: lower-case scheme and host, default
// port dropped, fragment dropped, empty path -> "/", trailing slash removed
// from non-root paths. Unparseable input is returned sanitized but otherwise unchanged.
std::string normalizeUrl(const std::string& url);

std::string stripFragment(const std::string& url);

// Lower-cased host, or empty string when the URL cannot be parsed.
std::string extractHost(const std::string& url);

bool isHttpUrl(const std::string& url);

bool isSameHost(const std::string& a, const std::string& b);

} // namespace sitewatch::common
