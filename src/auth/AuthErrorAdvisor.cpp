#include "../../include/sitewatch/auth/AuthErrorAdvisor.h"
#include "../../include/sitewatch/auth/LoginDetector.h"
#include "../../include/sitewatch/common/UrlUtils.h"

#include <algorithm>
#include <cctype>
#include <regex>

namespace sitewatch::auth {

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool hostIsOrUnder(const std::string& host, const std::string& domain) {
    return host == domain || endsWith(host, "." + domain);
}

std::string lowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Subdomains of these sit behind company SSO
const std::vector<std::string>& internalParentDomains() {
    static const std::vector<std::string> domains = {
        "company.com", "sharepoint.com", "onmicrosoft.com", "teams.microsoft.com",
        "office.com", "outlook.com", "atlassian.net", "atlassian.com",
        "google.com", "gsuite.com"
    };
    return domains;
}

// Private top-level labels
const std::vector<std::string>& internalTopLevels() {
    static const std::vector<std::string> labels = {".internal", ".intranet", ".local"};
    return labels;
}

const std::vector<std::string>& externalCredentialDomains() {
    static const std::vector<std::string> domains = {
        "launchpad.support.sap.com", "support.sap.com", "me.sap.com", "salesforce.com",
        "oracle.com", "aws.amazon.com", "azure.microsoft.com", "servicenow.com",
        "zendesk.com", "freshdesk.com"
    };
    return domains;
}

const std::vector<std::regex>& authErrorPatterns() {
    static const std::vector<std::regex> patterns = [] {
        std::vector<std::regex> out;
        for (const char* source : {"login", "signin", "authenticat", "unauthorized", "access.*denied",
                                   "permission.*denied", "\\b401\\b", "\\b403\\b", "redirected.*login"}) {
            out.emplace_back(source, std::regex::ECMAScript | std::regex::icase);
        }
        return out;
    }();
    return patterns;
}

} // namespace

AuthErrorAdvisor::AuthErrorAdvisor(std::vector<std::string> internalSuffixes) {
    for (auto& suffix : internalSuffixes) {
        std::string cleaned = lowerCopy(suffix);
        while (!cleaned.empty() && cleaned.front() == '.') cleaned.erase(cleaned.begin());
        if (!cleaned.empty()) {
            internalSuffixes_.push_back(std::move(cleaned));
        }
    }
}

bool AuthErrorAdvisor::isInternalDomain(const std::string& url) const {
    const std::string host = common::extractHost(url);
    if (host.empty()) return false;

    for (const auto& domain : internalParentDomains()) {
        if (hostIsOrUnder(host, domain)) return true;
    }
    for (const auto& label : internalTopLevels()) {
        if (endsWith(host, label)) return true;
    }
    if (host.find(".corp.") != std::string::npos) return true;
    for (const auto& suffix : internalSuffixes_) {
        if (hostIsOrUnder(host, suffix)) return true;
    }
    return false;
}

bool AuthErrorAdvisor::isExternalCredentialSite(const std::string& url) {
    const std::string host = common::extractHost(url);
    if (host.empty()) return false;
    for (const auto& domain : externalCredentialDomains()) {
        if (hostIsOrUnder(host, domain)) return true;
    }
    return false;
}

bool AuthErrorAdvisor::looksLikeAuthError(const std::string& message) {
    for (const auto& pattern : authErrorPatterns()) {
        if (std::regex_search(message, pattern)) return true;
    }
    return false;
}

std::string AuthErrorAdvisor::internalAuthGuide(const std::string& host) {
    if (host.find("atlassian") != std::string::npos) {
        return "For Atlassian sites: Use Cookie authentication with session cookies from your browser (F12 → Application → Cookies)";
    }
    if (host.find("sharepoint") != std::string::npos || host.find("office") != std::string::npos ||
        host.find("microsoft") != std::string::npos) {
        return "For SharePoint/Office 365: Use Cookie authentication with FedAuth cookies from your browser";
    }
    if (host.find("google") != std::string::npos) {
        return "For Google sites: Use Cookie authentication with SAPISID/APISID cookies from your browser";
    }
    return "For internal sites: Use Cookie authentication with session cookies from your browser (F12 → Developer Tools)";
}

AuthErrorAdvice AuthErrorAdvisor::classifyError(const std::string& url, const std::string& message) const {
    AuthErrorAdvice advice;
    if (!looksLikeAuthError(message)) {
        return advice;
    }
    advice.isAuthError = true;
    advice.needsCredentials = true;

    std::string host = common::extractHost(url);
    if (isInternalDomain(url)) {
        advice.suggestion = "This appears to be an internal " + host + " website that requires authentication. "
                            "Automatic SSO cannot be performed from the server. " + internalAuthGuide(host) + ".";
        advice.loginMethod = "cookie";
    } else if (isExternalCredentialSite(url)) {
        advice.suggestion = "This external website (" + host + ") requires authentication. "
                            "Please provide credentials in the Credentials Manager for automatic login.";
    } else {
        advice.suggestion = "This website requires authentication. If this is an internal company website, "
                            "you may need to configure cookie credentials in the Credentials Manager.";
    }
    return advice;
}

crawler::CrawlError AuthErrorAdvisor::internalDomainError(const std::string& url) const {
    const std::string host = common::extractHost(url);
    crawler::CrawlError error;
    error.url = url;
    error.error = "Internal domain detected: " + host + ". Authentication required but no credentials configured."
                  "\n\n💡 " + internalAuthGuide(host) + ".\n\nPlease configure credentials in the Credentials Manager.";
    error.failureType = crawler::FailureType::AUTHENTICATION;
    error.isAuthError = true;
    error.needsCredentials = true;
    error.loginMethod = "cookie";
    return error;
}

crawler::CrawlError AuthErrorAdvisor::analyzeError(const std::string& url,
                                                   const std::string& message,
                                                   bool enableCredentialPrompting,
                                                   bool forceAuth) const {
    crawler::CrawlError error;
    error.url = url;
    error.error = message;

    AuthErrorAdvice advice = classifyError(url, message);
    if (!advice.isAuthError && forceAuth) {
        // Classify as if the message had named the status
        advice = classifyError(url, "unauthorized");
    }
    if (!advice.isAuthError) {
        return error;
    }

    error.isAuthError = true;
    error.failureType = crawler::FailureType::AUTHENTICATION;
    error.needsCredentials = advice.needsCredentials;
    error.loginMethod = advice.loginMethod;
    error.error += "\n\n💡 " + advice.suggestion;

    if (advice.needsCredentials && enableCredentialPrompting && isExternalCredentialSite(url)) {
        error.error += "\n\n🔑 " + credentialPromptFor(common::extractHost(url), LoginMethod::FORM);
        error.loginMethod = "form";
    }
    return error;
}

} // namespace sitewatch::auth
