#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sitewatch::auth {

enum class LoginMethod {
    FORM,
    SAML,
    OAUTH,
    UNKNOWN
};

std::string loginMethodToString(LoginMethod method);

struct FormFieldSelectors {
    std::string usernameSelector;
    std::string passwordSelector;
    std::string submitSelector;
    std::string formSelector;
};

struct LoginDetection {
    bool isLoginPage = false;
    LoginMethod loginMethod = LoginMethod::UNKNOWN;
    FormFieldSelectors suggestedFields;
    // Why automated login cannot proceed (unsupported method, fields not found)
    std::optional<std::string> error;
};

// Decides whether a fetched page is a login wall. Injected into the scraper
// so tests can script the answer.
class LoginDetector {
public:
    virtual ~LoginDetector() = default;

    virtual LoginDetection detect(const std::string& html, const std::string& pageUrl) const = 0;
};

// Vocabulary and DOM heuristics over the page HTML.
//
// A page counts as a login page when a login word appears in its title, URL
// or body AND the page either has a password input, or shows SAML/OAuth
// evidence with the login word in the title or URL. The method is then
// SAML, OAuth, form or unknown, checked in that order.
class HeuristicLoginDetector : public LoginDetector {
public:
    LoginDetection detect(const std::string& html, const std::string& pageUrl) const override;
};

// Operator-facing hint for configuring the credential a login method needs.
std::string credentialPromptFor(const std::string& domain, LoginMethod method);

} // namespace sitewatch::auth
