#pragma once

#include <stdexcept>
#include <string>

namespace sitewatch::auth {

// Raised when a page sits behind a login the run cannot get past: a login
// page with no matching credential, or a form login that loops back to the
// login page.
class AuthenticationError : public std::runtime_error {
public:
    AuthenticationError(const std::string& message, std::string loginMethod)
        : std::runtime_error(message), loginMethod_(std::move(loginMethod)) {}

    // "form", "saml", "oauth", "cookie" or "unknown"
    const std::string& loginMethod() const { return loginMethod_; }

private:
    std::string loginMethod_;
};

} // namespace sitewatch::auth
