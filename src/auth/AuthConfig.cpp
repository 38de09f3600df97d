#include "../../include/sitewatch/auth/AuthConfig.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace sitewatch::auth {

namespace {

std::string requireString(const nlohmann::json& payload, const char* key, const char* kind) {
    if (!payload.contains(key) || !payload[key].is_string() || payload[key].get<std::string>().empty()) {
        throw std::invalid_argument(std::string(kind) + " credential requires a non-empty '" + key + "'");
    }
    return payload[key].get<std::string>();
}

std::string optionalString(const nlohmann::json& payload, const char* key) {
    if (payload.contains(key) && payload[key].is_string()) {
        return payload[key].get<std::string>();
    }
    return "";
}

} // namespace

std::string authKindToString(AuthKind kind) {
    switch (kind) {
        case AuthKind::BASIC: return "basic";
        case AuthKind::FORM: return "form";
        case AuthKind::COOKIE: return "cookie";
        case AuthKind::HEADER: return "header";
        case AuthKind::SSO: return "sso";
    }
    return "basic";
}

std::optional<AuthKind> authKindFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "basic") return AuthKind::BASIC;
    if (lower == "form") return AuthKind::FORM;
    if (lower == "cookie") return AuthKind::COOKIE;
    if (lower == "header") return AuthKind::HEADER;
    if (lower == "sso") return AuthKind::SSO;
    return std::nullopt;
}

AuthKind kindOf(const AuthConfig& config) {
    return std::visit(detail::Overloaded{
        [](const BasicAuth&) { return AuthKind::BASIC; },
        [](const HeaderAuth&) { return AuthKind::HEADER; },
        [](const CookieAuth&) { return AuthKind::COOKIE; },
        [](const FormAuth&) { return AuthKind::FORM; },
        [](const SsoAuth&) { return AuthKind::SSO; }
    }, config);
}

AuthConfig parseAuthConfig(AuthKind kind, const nlohmann::json& payload, const std::string& targetDomain) {
    if (!payload.is_object()) {
        throw std::invalid_argument("Credential payload must be a JSON object");
    }

    switch (kind) {
        case AuthKind::BASIC: {
            BasicAuth basic;
            basic.username = requireString(payload, "username", "basic");
            basic.password = requireString(payload, "password", "basic");
            return basic;
        }
        case AuthKind::HEADER: {
            if (!payload.contains("headers") || !payload["headers"].is_object() || payload["headers"].empty()) {
                throw std::invalid_argument("header credential requires a non-empty 'headers' object");
            }
            HeaderAuth header;
            for (const auto& [name, value] : payload["headers"].items()) {
                if (!value.is_string()) {
                    throw std::invalid_argument("header credential value for '" + name + "' must be a string");
                }
                header.headers[name] = value.get<std::string>();
            }
            return header;
        }
        case AuthKind::COOKIE: {
            if (!payload.contains("cookies") || !payload["cookies"].is_array() || payload["cookies"].empty()) {
                throw std::invalid_argument("cookie credential requires a non-empty 'cookies' array");
            }
            CookieAuth cookie;
            for (const auto& entry : payload["cookies"]) {
                if (!entry.is_object()) {
                    throw std::invalid_argument("cookie credential entries must be objects");
                }
                CookieSpec spec;
                spec.name = requireString(entry, "name", "cookie");
                if (!entry.contains("value") || !entry["value"].is_string()) {
                    throw std::invalid_argument("cookie credential requires a string 'value' for '" + spec.name + "'");
                }
                spec.value = entry["value"].get<std::string>();
                spec.domain = optionalString(entry, "domain");
                if (spec.domain.empty()) spec.domain = targetDomain;
                spec.path = optionalString(entry, "path");
                if (spec.path.empty()) spec.path = "/";
                cookie.cookies.push_back(std::move(spec));
            }
            return cookie;
        }
        case AuthKind::FORM: {
            FormAuth form;
            form.username = requireString(payload, "username", "form");
            form.password = requireString(payload, "password", "form");
            form.loginUrl = optionalString(payload, "loginUrl");
            form.usernameSelector = optionalString(payload, "usernameField");
            form.passwordSelector = optionalString(payload, "passwordField");
            form.submitSelector = optionalString(payload, "submitButton");
            form.formSelector = optionalString(payload, "formSelector");
            return form;
        }
        case AuthKind::SSO: {
            SsoAuth sso;
            sso.provider = optionalString(payload, "ssoProvider");
            sso.domain = targetDomain;
            return sso;
        }
    }
    throw std::invalid_argument("Unknown credential kind");
}

nlohmann::json authConfigToJson(const AuthConfig& config) {
    return std::visit(detail::Overloaded{
        [](const BasicAuth& basic) {
            return nlohmann::json{{"username", basic.username}, {"password", basic.password}};
        },
        [](const HeaderAuth& header) {
            return nlohmann::json{{"headers", header.headers}};
        },
        [](const CookieAuth& cookie) {
            nlohmann::json cookies = nlohmann::json::array();
            for (const auto& c : cookie.cookies) {
                cookies.push_back({{"name", c.name}, {"value", c.value}, {"domain", c.domain}, {"path", c.path}});
            }
            return nlohmann::json{{"cookies", cookies}};
        },
        [](const FormAuth& form) {
            return nlohmann::json{
                {"username", form.username},
                {"password", form.password},
                {"loginUrl", form.loginUrl},
                {"usernameField", form.usernameSelector},
                {"passwordField", form.passwordSelector},
                {"submitButton", form.submitSelector},
                {"formSelector", form.formSelector}
            };
        },
        [](const SsoAuth& sso) {
            return nlohmann::json{{"ssoProvider", sso.provider}};
        }
    }, config);
}

} // namespace sitewatch::auth
