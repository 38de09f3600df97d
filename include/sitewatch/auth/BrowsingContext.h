#pragma once

#include "AuthConfig.h"
#include "../crawler/models/ScrapedPage.h"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sitewatch::auth {

// Per-run request state: extra headers, a cookie jar and HTTP credentials.
// Owned by a single crawl run; not thread-safe.
class BrowsingContext {
public:
    BrowsingContext() = default;

    // Host the configured headers and basic credentials belong to. They are
    // only sent to this host and its subdomains; with no domain set they are
    // never sent.
    void setCredentialDomain(std::string domain) { credentialDomain_ = std::move(domain); }
    const std::string& credentialDomain() const { return credentialDomain_; }

    void setHeader(const std::string& name, const std::string& value);
    bool hasHeaders() const { return !headers_.empty(); }
    // Configured headers when `url` is on the credential domain, else empty.
    std::map<std::string, std::string> headersFor(const std::string& url) const;

    // Replaces an existing cookie with the same name, domain and path.
    void addCookie(CookieSpec cookie);
    void removeCookie(const std::string& name, const std::string& domain, const std::string& path);
    const std::vector<CookieSpec>& cookies() const { return cookies_; }

    void setBasicAuth(BasicAuth credentials) { basicAuth_ = std::move(credentials); }
    const std::optional<BasicAuth>& basicAuth() const { return basicAuth_; }
    std::optional<BasicAuth> basicAuthFor(const std::string& url) const;

    void setFormAuth(FormAuth credentials) { formAuth_ = std::move(credentials); }
    const std::optional<FormAuth>& formAuth() const { return formAuth_; }

    // "name=value; name2=value2" for cookies whose domain and path match `url`;
    // empty when none match.
    std::string cookieHeaderFor(const std::string& url) const;

    // Headers for `url` plus its Cookie header.
    std::vector<std::pair<std::string, std::string>> requestHeadersFor(const std::string& url) const;

    // Applies one Set-Cookie response header received for `requestUrl`.
    void storeSetCookie(const std::string& requestUrl, const std::string& headerValue);

    // Marks the context as unable to authenticate (e.g. SSO without a session).
    void markUnsupported(std::string reason);
    bool requiresManualCredential() const { return unsupportedReason_.has_value(); }
    const std::optional<std::string>& unsupportedReason() const { return unsupportedReason_; }

    void setAuthMethod(crawler::AuthMethod method) { authMethod_ = method; }
    crawler::AuthMethod authMethod() const { return authMethod_; }

    bool hasCredentials() const { return authMethod_ == crawler::AuthMethod::CREDENTIALS; }

private:
    std::string credentialDomain_;
    std::map<std::string, std::string> headers_;
    std::vector<CookieSpec> cookies_;
    std::optional<BasicAuth> basicAuth_;
    std::optional<FormAuth> formAuth_;
    std::optional<std::string> unsupportedReason_;
    crawler::AuthMethod authMethod_ = crawler::AuthMethod::NONE;
};

// RFC 6265 domain-match of a request host against a cookie domain (leading '.' ignored).
bool cookieDomainMatches(const std::string& host, const std::string& cookieDomain);

// RFC 6265 path-match of a request path against a cookie path.
bool cookiePathMatches(const std::string& requestPath, const std::string& cookiePath);

} // namespace sitewatch::auth
