#include "LoginFormLocator.h"

#include <sstream>

namespace sitewatch::auth {

namespace html = crawler::html;

namespace {

struct SiteSelectors {
    const char* domain;
    std::vector<std::string> username;
    std::vector<std::string> password;
    std::vector<std::string> submit;
    std::string form;
};

const std::vector<SiteSelectors>& knownSites() {
    static const std::vector<SiteSelectors> sites = {
        {"launchpad.support.sap.com",
         {"#j_username", "[name=\"j_username\"]", "[name=\"username\"]"},
         {"#j_password", "[name=\"j_password\"]", "[name=\"password\"]"},
         {"#logOnFormSubmit", "[type=\"submit\"]"},
         "#logonForm"},
        {"support.sap.com",
         {"#j_username", "[name=\"j_username\"]", "[name=\"username\"]", "#username"},
         {"#j_password", "[name=\"j_password\"]", "[name=\"password\"]", "#password"},
         {"#logOnFormSubmit", "[type=\"submit\"]", "button[type=\"submit\"]"},
         "#logonForm"},
        {"me.sap.com",
         {"#j_username", "[name=\"username\"]", "#username"},
         {"#j_password", "[name=\"password\"]", "#password"},
         {"[type=\"submit\"]", "button[type=\"submit\"]"},
         ""},
        {"salesforce.com",
         {"#username", "[name=\"username\"]"},
         {"#password", "[name=\"password\"]"},
         {"#Login", "[name=\"Login\"]", "[type=\"submit\"]"},
         ""},
        {"servicenow.com",
         {"#user_name", "[name=\"user_name\"]", "[name=\"username\"]"},
         {"#user_password", "[name=\"user_password\"]", "[name=\"password\"]"},
         {"#sysverb_login", "[type=\"submit\"]"},
         ""},
    };
    return sites;
}

std::string firstPresent(const html::HtmlDocument& doc, const std::vector<std::string>& selectors) {
    for (const auto& selector : selectors) {
        if (doc.selectFirst(selector)) return selector;
    }
    return "";
}

} // namespace

const std::vector<std::string>& genericUsernameSelectors() {
    static const std::vector<std::string> selectors = {
        "[name=\"username\"]", "[name=\"email\"]", "[name=\"user\"]", "[name=\"login\"]",
        "[type=\"email\"]", "#username", "#email", "#user", "#login", ".username", ".email",
        "[placeholder*=\"username\" i]", "[placeholder*=\"email\" i]",
        "[aria-label*=\"username\" i]", "[aria-label*=\"email\" i]"
    };
    return selectors;
}

const std::vector<std::string>& genericPasswordSelectors() {
    static const std::vector<std::string> selectors = {
        "[name=\"password\"]", "[name=\"passwd\"]", "[name=\"pass\"]", "[type=\"password\"]",
        "#password", "#passwd", "#pass", ".password",
        "[placeholder*=\"password\" i]", "[aria-label*=\"password\" i]"
    };
    return selectors;
}

const std::vector<std::string>& genericSubmitSelectors() {
    static const std::vector<std::string> selectors = {
        "[type=\"submit\"]", "button[type=\"submit\"]", "input[type=\"submit\"]",
        "button:has-text(\"Sign In\")", "button:has-text(\"Log In\")",
        "button:has-text(\"Login\")", "button:has-text(\"Submit\")",
        ".login-button", ".signin-button", ".submit-button"
    };
    return selectors;
}

std::string selectorForForm(const GumboNode* form) {
    if (auto id = html::attribute(form, "id"); id && !id->empty()) {
        return "#" + *id;
    }
    if (auto cls = html::attribute(form, "class")) {
        std::istringstream words(*cls);
        std::string first;
        if (words >> first) return "." + first;
    }
    return "form";
}

FormFieldSelectors locateLoginFields(const html::HtmlDocument& doc, const std::string& host) {
    FormFieldSelectors fields;

    const SiteSelectors* site = nullptr;
    for (const auto& candidate : knownSites()) {
        if (host.find(candidate.domain) != std::string::npos) {
            site = &candidate;
            break;
        }
    }

    if (site) {
        fields.usernameSelector = firstPresent(doc, site->username);
        fields.passwordSelector = firstPresent(doc, site->password);
        fields.submitSelector = firstPresent(doc, site->submit);
        if (!site->form.empty() && doc.selectFirst(site->form)) {
            fields.formSelector = site->form;
        }
    }
    if (fields.usernameSelector.empty()) {
        fields.usernameSelector = firstPresent(doc, genericUsernameSelectors());
    }
    if (fields.passwordSelector.empty()) {
        fields.passwordSelector = firstPresent(doc, genericPasswordSelectors());
    }
    if (fields.submitSelector.empty()) {
        fields.submitSelector = firstPresent(doc, genericSubmitSelectors());
    }

    if (fields.formSelector.empty() && !fields.usernameSelector.empty()) {
        const GumboNode* form = html::closest(doc.selectFirst(fields.usernameSelector), GUMBO_TAG_FORM);
        if (form) {
            fields.formSelector = selectorForForm(form);
        }
    }
    return fields;
}

} // namespace sitewatch::auth
