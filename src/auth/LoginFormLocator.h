#pragma once

#include "../../include/sitewatch/auth/LoginDetector.h"
#include "../../include/sitewatch/crawler/html/HtmlDocument.h"

#include <string>
#include <vector>

namespace sitewatch::auth {

// Resolves username/password/submit/form selectors on a login page: the
// known-site table first (matched by host substring), then generic name, id,
// type, placeholder and aria-label patterns. Unresolved fields stay empty.
FormFieldSelectors locateLoginFields(const crawler::html::HtmlDocument& doc, const std::string& host);

// Selector that identifies the form element, preferring #id, then the first
// class, then plain "form".
std::string selectorForForm(const GumboNode* form);

const std::vector<std::string>& genericUsernameSelectors();
const std::vector<std::string>& genericPasswordSelectors();
const std::vector<std::string>& genericSubmitSelectors();

} // namespace sitewatch::auth
