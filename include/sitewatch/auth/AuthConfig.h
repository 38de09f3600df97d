#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace sitewatch::auth {

enum class AuthKind {
    BASIC,
    FORM,
    COOKIE,
    HEADER,
    SSO
};

std::string authKindToString(AuthKind kind);
std::optional<AuthKind> authKindFromString(const std::string& name);

struct BasicAuth {
    std::string username;
    std::string password;
};

struct HeaderAuth {
    std::map<std::string, std::string> headers;
};

struct CookieSpec {
    std::string name;
    std::string value;
    std::string domain;     // leading '.' allowed; empty never survives parsing
    std::string path = "/";
};

struct CookieAuth {
    std::vector<CookieSpec> cookies;
};

struct FormAuth {
    std::string username;
    std::string password;
    std::string loginUrl;          // optional; empty means "the page that showed the login form"
    std::string usernameSelector;
    std::string passwordSelector;
    std::string submitSelector;    // empty submits the form as if Enter was pressed
    std::string formSelector;
};

// Carried so the operator sees which provider was configured; never produces credentials.
struct SsoAuth {
    std::string provider;
    std::string domain;
};

using AuthConfig = std::variant<BasicAuth, HeaderAuth, CookieAuth, FormAuth, SsoAuth>;

namespace detail {

// Visitor built from one lambda per AuthConfig alternative
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace detail

AuthKind kindOf(const AuthConfig& config);

// Builds the typed config for `kind` from a decrypted credential payload.
// Cookies without a domain are scoped to `targetDomain`. Throws
// std::invalid_argument when a field the kind requires is missing or mistyped.
AuthConfig parseAuthConfig(AuthKind kind, const nlohmann::json& payload, const std::string& targetDomain);

// Inverse of parseAuthConfig, used when an operator stores a credential.
nlohmann::json authConfigToJson(const AuthConfig& config);

} // namespace sitewatch::auth
