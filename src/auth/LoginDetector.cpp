#include "../../include/sitewatch/auth/LoginDetector.h"
#include "../../include/sitewatch/common/Logger.h"
#include "../../include/sitewatch/common/UrlUtils.h"
#include "../../include/sitewatch/crawler/html/HtmlDocument.h"
#include "../../include/sitewatch/crawler/html/Selector.h"
#include "LoginFormLocator.h"

#include <initializer_list>
#include <regex>

namespace sitewatch::auth {

namespace html = crawler::html;

namespace {

// Regex matching is bounded to this much body text
constexpr size_t kMaxScannedText = 20000;

bool anyMatch(const std::vector<std::regex>& patterns, const std::string& text) {
    for (const auto& pattern : patterns) {
        if (std::regex_search(text, pattern)) return true;
    }
    return false;
}

std::vector<std::regex> compile(std::initializer_list<const char*> sources) {
    std::vector<std::regex> out;
    for (const char* source : sources) {
        out.emplace_back(source, std::regex::ECMAScript | std::regex::icase);
    }
    return out;
}

const std::vector<std::regex>& vocabularyPatterns() {
    static const auto patterns = compile({
        R"(\bsign\s*in\b)",
        R"(\blog\s*in\b)",
        R"(\bauthentication\b)",
        R"(\bcredentials\b)"
    });
    return patterns;
}

const std::vector<std::regex>& urlPatterns() {
    static const auto patterns = compile({
        R"(/(login|signin|sign-in|auth|authentication|sso)\b)"
    });
    return patterns;
}

const std::vector<std::regex>& samlPatterns() {
    static const auto patterns = compile({
        R"(\bsaml\b)",
        R"(\bsingle\W+sign\W+on\b)",
        R"(\bsso\b)",
        R"(\bidentity\s+provider\b)",
        R"(\bfederation\b)"
    });
    return patterns;
}

const std::vector<std::regex>& oauthTextPatterns() {
    static const auto patterns = compile({
        R"(\boauth)",
        R"(\b(google|microsoft|github)\b[^.]{0,40}\bsign\s*in\b)",
        R"(\bsign\s*in\s+with\s+(google|microsoft|github)\b)"
    });
    return patterns;
}

const std::vector<std::regex>& oauthLinkPatterns() {
    static const auto patterns = compile({
        R"(oauth)",
        R"(accounts\.google\.com)",
        R"(login\.microsoftonline\.com)",
        R"(github\.com/login)"
    });
    return patterns;
}

bool hasSamlEvidence(const std::string& bodyText) {
    return anyMatch(samlPatterns(), bodyText);
}

bool hasOAuthEvidence(const html::HtmlDocument& doc, const std::string& bodyText) {
    if (anyMatch(oauthTextPatterns(), bodyText)) return true;
    for (const GumboNode* link : doc.select("a[href]")) {
        if (anyMatch(oauthLinkPatterns(), html::attribute(link, "href").value_or(""))) return true;
    }
    return false;
}

bool hasCredentialForm(const html::HtmlDocument& doc) {
    static const auto password = html::Selector::parse("[type=\"password\" i]");
    static const auto username = html::Selector::parse(
        "[type=\"email\" i], [name*=\"username\" i], [name*=\"email\" i], [name*=\"user\" i]");
    for (const GumboNode* form : doc.select("form")) {
        if (password->selectFirst(form) && username->selectFirst(form)) return true;
    }
    return false;
}

} // namespace

std::string loginMethodToString(LoginMethod method) {
    switch (method) {
        case LoginMethod::FORM: return "form";
        case LoginMethod::SAML: return "saml";
        case LoginMethod::OAUTH: return "oauth";
        default: return "unknown";
    }
}

LoginDetection HeuristicLoginDetector::detect(const std::string& htmlText, const std::string& pageUrl) const {
    LoginDetection detection;
    html::HtmlDocument doc(htmlText);
    if (!doc.root()) return detection;

    const GumboNode* titleNode = doc.findFirst(GUMBO_TAG_TITLE);
    const std::string title = titleNode ? html::collapseWhitespace(html::textContent(titleNode)) : "";
    const GumboNode* body = doc.findFirst(GUMBO_TAG_BODY);
    std::string bodyText = html::collapseWhitespace(html::textContent(body ? body : doc.root()));
    if (bodyText.size() > kMaxScannedText) bodyText.resize(kMaxScannedText);

    auto parsed = common::parseUrl(pageUrl);
    const std::string path = parsed ? parsed->path : pageUrl;

    const bool titleHit = anyMatch(vocabularyPatterns(), title);
    const bool urlHit = anyMatch(urlPatterns(), path);
    const bool bodyHit = anyMatch(vocabularyPatterns(), bodyText);
    if (!titleHit && !urlHit && !bodyHit) {
        return detection;
    }

    const bool hasPassword = doc.selectFirst("input[type=\"password\" i]") != nullptr;
    const bool saml = hasSamlEvidence(bodyText);
    const bool oauth = !saml && hasOAuthEvidence(doc, bodyText);

    detection.isLoginPage = hasPassword || ((titleHit || urlHit) && (saml || oauth));
    if (!detection.isLoginPage) {
        return detection;
    }

    if (saml) {
        detection.loginMethod = LoginMethod::SAML;
    } else if (oauth) {
        detection.loginMethod = LoginMethod::OAUTH;
    } else if (hasCredentialForm(doc)) {
        detection.loginMethod = LoginMethod::FORM;
    }

    const std::string host = parsed ? parsed->host : "";
    LOG_INFO("Login page detected for " + host + ", method: " + loginMethodToString(detection.loginMethod));

    if (detection.loginMethod != LoginMethod::FORM) {
        detection.error = "Login method \"" + loginMethodToString(detection.loginMethod) +
                          "\" is not supported for automated authentication.";
        return detection;
    }

    detection.suggestedFields = locateLoginFields(doc, host);
    if (detection.suggestedFields.usernameSelector.empty() || detection.suggestedFields.passwordSelector.empty()) {
        detection.error = "Could not locate username or password fields on the login form.";
    }
    return detection;
}

std::string credentialPromptFor(const std::string& domain, LoginMethod method) {
    const std::string base = "Authentication required for " + domain + ".";
    switch (method) {
        case LoginMethod::SAML:
            return base + " This site uses SAML/SSO authentication, which cannot be automated. "
                          "Please configure cookie credentials from a signed-in browser session in the Credentials Manager.";
        case LoginMethod::OAUTH:
            return base + " This site uses OAuth authentication. Please configure OAuth credentials in the Credentials Manager.";
        case LoginMethod::FORM:
            return base + " Please provide username and password credentials in the Credentials Manager.";
        default:
            return base + " Please configure appropriate credentials in the Credentials Manager.";
    }
}

} // namespace sitewatch::auth
