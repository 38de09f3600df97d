#include "../../include/sitewatch/auth/AuthenticationAdapter.h"
#include "../../include/sitewatch/auth/AuthenticationError.h"
#include "../../include/sitewatch/common/Logger.h"
#include "../../include/sitewatch/common/UrlUtils.h"
#include "../../include/sitewatch/crawler/html/HtmlDocument.h"
#include "../../include/sitewatch/crawler/html/Selector.h"
#include "LoginFormLocator.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace sitewatch::auth {

namespace html = crawler::html;

namespace {

std::string lowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const GumboNode* findWithin(const GumboNode* scope, const std::string& selector) {
    if (selector.empty()) return nullptr;
    auto parsed = html::Selector::parse(selector);
    if (!parsed) {
        LOG_WARNING("Unsupported login form selector: " + selector);
        return nullptr;
    }
    return parsed->selectFirst(scope);
}

std::string selectValue(const GumboNode* select) {
    const GumboNode* first = nullptr;
    const GumboNode* selected = nullptr;
    html::forEachElement(select, [&](const GumboNode* node) {
        if (node->v.element.tag != GUMBO_TAG_OPTION) return;
        if (!first) first = node;
        if (!selected && html::attribute(node, "selected")) selected = node;
    });
    const GumboNode* option = selected ? selected : first;
    if (!option) return "";
    auto value = html::attribute(option, "value");
    return value ? *value : html::collapseWhitespace(html::textContent(option));
}

} // namespace

AuthenticationAdapter::AuthenticationAdapter(std::shared_ptr<const LoginDetector> detector)
    : detector_(std::move(detector)) {
    if (!detector_) {
        throw std::invalid_argument("AuthenticationAdapter requires a login detector");
    }
}

BrowsingContext AuthenticationAdapter::prepare(const std::optional<AuthConfig>& config,
                                               const std::string& targetUrl) const {
    BrowsingContext context;
    if (!config) {
        return context;
    }

    const std::string host = common::extractHost(targetUrl);
    context.setCredentialDomain(host);
    std::visit(detail::Overloaded{
        [&](const BasicAuth& basic) {
            context.setBasicAuth(basic);
            context.setAuthMethod(crawler::AuthMethod::CREDENTIALS);
            LOG_INFO("Prepared basic authentication for " + host);
        },
        [&](const HeaderAuth& headers) {
            for (const auto& [name, value] : headers.headers) {
                context.setHeader(name, value);
                LOG_DEBUG("Injected header " + name + ": " + common::redactSecret(value));
            }
            context.setAuthMethod(crawler::AuthMethod::CREDENTIALS);
            LOG_INFO("Prepared header authentication for " + host + " (" + std::to_string(headers.headers.size()) + " headers)");
        },
        [&](const CookieAuth& cookies) {
            for (CookieSpec cookie : cookies.cookies) {
                if (cookie.domain.empty()) cookie.domain = host;
                if (cookie.path.empty()) cookie.path = "/";
                LOG_DEBUG("Injected cookie " + cookie.name + " for " + cookie.domain + cookie.path);
                context.addCookie(std::move(cookie));
            }
            context.setAuthMethod(crawler::AuthMethod::CREDENTIALS);
            LOG_INFO("Prepared cookie authentication for " + host + " (" + std::to_string(cookies.cookies.size()) + " cookies)");
        },
        [&](const FormAuth& form) {
            context.setFormAuth(form);
            context.setAuthMethod(crawler::AuthMethod::CREDENTIALS);
            LOG_INFO("Prepared form authentication for " + host + "; login runs when a login page is met");
        },
        [&](const SsoAuth& sso) {
            std::string provider = sso.provider.empty() ? "SSO" : sso.provider + " SSO";
            context.setAuthMethod(crawler::AuthMethod::SSO);
            context.markUnsupported(
                "Cannot perform " + provider + " authentication for " + host +
                " from the server: no real session token is available. "
                "Please configure cookie credentials copied from a signed-in browser session instead.");
            LOG_WARNING("SSO credential for " + host + " needs a manual credential; no authentication will be sent");
        }
    }, *config);
    return context;
}

crawler::PageFetchResult AuthenticationAdapter::performFormLogin(crawler::HttpSession& session,
                                                                 BrowsingContext& context,
                                                                 const crawler::PageFetchResult& loginPage,
                                                                 const FormAuth& credential,
                                                                 const common::CancellationToken& cancel) const {
    crawler::PageFetchResult page = loginPage;
    if (!credential.loginUrl.empty()) {
        page = session.get(credential.loginUrl, context, cancel);
        if (!page.success) {
            throw AuthenticationError("Form authentication failed: could not load login page " +
                                      credential.loginUrl + " (" + page.errorMessage + ")", "form");
        }
    }
    const std::string pageUrl = page.finalUrl;
    const std::string host = common::extractHost(pageUrl);

    html::HtmlDocument doc(page.content);
    if (!doc.root()) {
        throw AuthenticationError("Form authentication failed: login page could not be parsed", "form");
    }

    const GumboNode* form = nullptr;
    if (!credential.formSelector.empty()) {
        form = findWithin(doc.root(), credential.formSelector);
        if (!form) {
            throw AuthenticationError("Form authentication failed: login form '" + credential.formSelector +
                                      "' not found on " + pageUrl, "form");
        }
    }

    std::string usernameSelector = credential.usernameSelector;
    std::string passwordSelector = credential.passwordSelector;
    std::string submitSelector = credential.submitSelector;
    if (usernameSelector.empty() || passwordSelector.empty() || submitSelector.empty()) {
        FormFieldSelectors located = locateLoginFields(doc, host);
        if (usernameSelector.empty()) usernameSelector = located.usernameSelector;
        if (passwordSelector.empty()) passwordSelector = located.passwordSelector;
        if (submitSelector.empty()) submitSelector = located.submitSelector;
    }

    const GumboNode* scope = form ? form : doc.root();
    const GumboNode* usernameField = findWithin(scope, usernameSelector);
    const GumboNode* passwordField = findWithin(scope, passwordSelector);
    if (!usernameField || !passwordField) {
        throw AuthenticationError("Could not locate username or password fields on the login form.", "form");
    }
    if (!form) {
        form = html::closest(passwordField, GUMBO_TAG_FORM);
        if (!form) {
            throw AuthenticationError("Form authentication failed: password field is not inside a form", "form");
        }
    }

    auto usernameName = html::attribute(usernameField, "name");
    auto passwordName = html::attribute(passwordField, "name");
    if (!usernameName || !passwordName) {
        throw AuthenticationError("Form authentication failed: login fields have no name attribute", "form");
    }

    // Every successful control of the form, in document order, with the
    // credentials substituted
    crawler::FormFields fields;
    bool usernameSent = false;
    bool passwordSent = false;
    html::forEachElement(form, [&](const GumboNode* node) {
        const std::string tag = html::tagName(node);
        auto name = html::attribute(node, "name");
        if (!name || name->empty()) return;

        if (node == usernameField) {
            fields.emplace_back(*name, credential.username);
            usernameSent = true;
        } else if (node == passwordField) {
            fields.emplace_back(*name, credential.password);
            passwordSent = true;
        } else if (tag == "input") {
            const std::string type = lowerCopy(html::attribute(node, "type").value_or("text"));
            if (type == "submit" || type == "button" || type == "image" || type == "reset" || type == "file") {
                return;
            }
            if ((type == "checkbox" || type == "radio") && !html::attribute(node, "checked")) {
                return;
            }
            std::string value = html::attribute(node, "value").value_or(type == "checkbox" ? "on" : "");
            fields.emplace_back(*name, value);
        } else if (tag == "textarea") {
            fields.emplace_back(*name, html::textContent(node));
        } else if (tag == "select") {
            fields.emplace_back(*name, selectValue(node));
        }
    });
    // Fields associated with the form from outside its subtree
    if (!usernameSent) fields.emplace_back(*usernameName, credential.username);
    if (!passwordSent) fields.emplace_back(*passwordName, credential.password);

    // Clicking a named submit button sends its name/value; without one the
    // form is submitted as if Enter was pressed in the password field
    if (!submitSelector.empty()) {
        const GumboNode* submit = findWithin(form, submitSelector);
        if (submit) {
            if (auto name = html::attribute(submit, "name"); name && !name->empty()) {
                fields.emplace_back(*name, html::attribute(submit, "value").value_or(""));
            }
        } else if (!credential.submitSelector.empty()) {
            LOG_WARNING("Submit button '" + credential.submitSelector + "' not found; submitting form directly");
        }
    }

    std::string action = pageUrl;
    if (auto rawAction = html::attribute(form, "action"); rawAction && !rawAction->empty()) {
        auto resolved = common::resolveUrl(pageUrl, *rawAction);
        if (!resolved || !common::isHttpUrl(*resolved)) {
            throw AuthenticationError("Form authentication failed: unusable form action '" + *rawAction + "'", "form");
        }
        action = *resolved;
    }
    if (lowerCopy(html::attribute(form, "method").value_or("post")) == "get") {
        LOG_DEBUG("Login form declares method=get; submitting as POST");
    }

    LOG_INFO("Submitting login form for " + host + " to " + action + " (" + std::to_string(fields.size()) + " fields)");
    crawler::PageFetchResult result = session.postForm(action, fields, context, cancel);
    if (cancel.isCancelled()) {
        return result;
    }
    if (!result.success) {
        std::string reason = result.errorMessage.empty() ? "HTTP " + std::to_string(result.statusCode) : result.errorMessage;
        throw AuthenticationError("Form authentication failed: " + reason, "form");
    }

    if (isLoginUrl(result.finalUrl)) {
        LOG_WARNING("Still on login page after authentication attempt: " + result.finalUrl);
        throw AuthenticationError("Authentication failed - still on login page. Please check credentials.", "form");
    }

    LOG_INFO("Form authentication completed for " + result.finalUrl);
    return result;
}

LoginDetection AuthenticationAdapter::detectLoginPage(const std::string& html, const std::string& pageUrl) const {
    return detector_->detect(html, pageUrl);
}

bool AuthenticationAdapter::isLoginUrl(const std::string& url) {
    const std::string lower = lowerCopy(url);
    return lower.find("/login") != std::string::npos || lower.find("/signin") != std::string::npos;
}

} // namespace sitewatch::auth
