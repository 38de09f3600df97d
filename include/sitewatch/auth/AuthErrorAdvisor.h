#pragma once

#include "../crawler/models/CrawlResult.h"

#include <optional>
#include <string>
#include <vector>

namespace sitewatch::auth {

struct AuthErrorAdvice {
    bool isAuthError = false;
    bool needsCredentials = false;
    std::string suggestion;
    std::optional<std::string> loginMethod;
};

// Classifies page failures as authentication problems and says what the
// operator should configure, based on which kind of domain the URL is on.
class AuthErrorAdvisor {
public:
    // `internalSuffixes` extend the built-in internal-domain list
    // (e.g. "corp.example.com" or ".example.internal").
    explicit AuthErrorAdvisor(std::vector<std::string> internalSuffixes = {});

    // Hosts that normally sit behind company SSO.
    bool isInternalDomain(const std::string& url) const;

    // Vendor portals known to require their own account login.
    static bool isExternalCredentialSite(const std::string& url);

    // True when the message reads like a login wall, 401/403 or denied access.
    static bool looksLikeAuthError(const std::string& message);

    AuthErrorAdvice classifyError(const std::string& url, const std::string& message) const;

    // Per-platform instructions for exporting browser session cookies.
    static std::string internalAuthGuide(const std::string& host);

    // Error for an internal site crawled without any credential.
    crawler::CrawlError internalDomainError(const std::string& url) const;

    // Builds the per-URL error entry, appending the remediation hint.
    // `forceAuth` marks failures already known to be authentication related
    // (AUTHENTICATION failure type) even when the message does not say so.
    crawler::CrawlError analyzeError(const std::string& url,
                                     const std::string& message,
                                     bool enableCredentialPrompting,
                                     bool forceAuth = false) const;

private:
    std::vector<std::string> internalSuffixes_;
};

} // namespace sitewatch::auth
