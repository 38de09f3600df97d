#pragma once

#include "AuthConfig.h"
#include "BrowsingContext.h"
#include "LoginDetector.h"
#include "../common/CancellationToken.h"
#include "../crawler/HttpSession.h"

#include <memory>
#include <optional>
#include <string>

namespace sitewatch::auth {

// Prepares per-run browsing contexts from credentials and drives form logins.
class AuthenticationAdapter {
public:
    explicit AuthenticationAdapter(std::shared_ptr<const LoginDetector> detector);

    // Basic sets HTTP credentials, Header injects headers, Cookie fills the
    // jar, Form is kept for performFormLogin. SSO produces no credential
    // material at all: the context is marked as needing a manual credential.
    BrowsingContext prepare(const std::optional<AuthConfig>& config, const std::string& targetUrl) const;

    // Submits the login form and returns the response of the submission.
    // When the credential names a loginUrl the form is fetched from there,
    // otherwise `loginPage` (the page that showed the login wall) is used.
    // Throws AuthenticationError when the form or its fields cannot be found,
    // the submission fails, or the result is still a login page.
    crawler::PageFetchResult performFormLogin(crawler::HttpSession& session,
                                              BrowsingContext& context,
                                              const crawler::PageFetchResult& loginPage,
                                              const FormAuth& credential,
                                              const common::CancellationToken& cancel) const;

    LoginDetection detectLoginPage(const std::string& html, const std::string& pageUrl) const;

    // Login-loop check on a post-submit URL.
    static bool isLoginUrl(const std::string& url);

private:
    std::shared_ptr<const LoginDetector> detector_;
};

} // namespace sitewatch::auth
