#include "../../include/sitewatch/auth/BrowsingContext.h"
#include "../../include/sitewatch/common/Logger.h"
#include "../../include/sitewatch/common/UrlUtils.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace sitewatch::auth {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Default-path algorithm from RFC 6265 section 5.1.4
std::string defaultCookiePath(const std::string& requestPath) {
    if (requestPath.empty() || requestPath[0] != '/') return "/";
    size_t lastSlash = requestPath.rfind('/');
    if (lastSlash == 0) return "/";
    return requestPath.substr(0, lastSlash);
}

} // namespace

bool cookieDomainMatches(const std::string& host, const std::string& cookieDomain) {
    std::string domain = toLower(cookieDomain);
    if (!domain.empty() && domain[0] == '.') domain.erase(0, 1);
    if (domain.empty()) return false;
    std::string h = toLower(host);
    if (h == domain) return true;
    return h.size() > domain.size() &&
           h.compare(h.size() - domain.size(), domain.size(), domain) == 0 &&
           h[h.size() - domain.size() - 1] == '.';
}

bool cookiePathMatches(const std::string& requestPath, const std::string& cookiePath) {
    const std::string path = requestPath.empty() ? "/" : requestPath;
    if (cookiePath.empty() || cookiePath == "/") return true;
    if (path == cookiePath) return true;
    if (path.compare(0, cookiePath.size(), cookiePath) != 0) return false;
    return cookiePath.back() == '/' || (path.size() > cookiePath.size() && path[cookiePath.size()] == '/');
}

void BrowsingContext::setHeader(const std::string& name, const std::string& value) {
    headers_[name] = value;
}

void BrowsingContext::addCookie(CookieSpec cookie) {
    if (cookie.path.empty()) cookie.path = "/";
    auto it = std::find_if(cookies_.begin(), cookies_.end(), [&cookie](const CookieSpec& existing) {
        return existing.name == cookie.name && existing.domain == cookie.domain && existing.path == cookie.path;
    });
    if (it != cookies_.end()) {
        *it = std::move(cookie);
    } else {
        cookies_.push_back(std::move(cookie));
    }
}

void BrowsingContext::removeCookie(const std::string& name, const std::string& domain, const std::string& path) {
    cookies_.erase(std::remove_if(cookies_.begin(), cookies_.end(), [&](const CookieSpec& c) {
        return c.name == name && c.domain == domain && c.path == path;
    }), cookies_.end());
}

std::string BrowsingContext::cookieHeaderFor(const std::string& url) const {
    auto parsed = common::parseUrl(url);
    if (!parsed) return "";

    std::string header;
    for (const auto& cookie : cookies_) {
        if (!cookieDomainMatches(parsed->host, cookie.domain)) continue;
        if (!cookiePathMatches(parsed->path, cookie.path)) continue;
        if (!header.empty()) header += "; ";
        header += cookie.name + "=" + cookie.value;
    }
    return header;
}

std::map<std::string, std::string> BrowsingContext::headersFor(const std::string& url) const {
    if (headers_.empty() || !cookieDomainMatches(common::extractHost(url), credentialDomain_)) {
        return {};
    }
    return headers_;
}

std::optional<BasicAuth> BrowsingContext::basicAuthFor(const std::string& url) const {
    if (!basicAuth_ || !cookieDomainMatches(common::extractHost(url), credentialDomain_)) {
        return std::nullopt;
    }
    return basicAuth_;
}

std::vector<std::pair<std::string, std::string>> BrowsingContext::requestHeadersFor(const std::string& url) const {
    auto scoped = headersFor(url);
    std::vector<std::pair<std::string, std::string>> out(scoped.begin(), scoped.end());
    std::string cookieHeader = cookieHeaderFor(url);
    if (!cookieHeader.empty()) {
        out.emplace_back("Cookie", cookieHeader);
    }
    return out;
}

void BrowsingContext::storeSetCookie(const std::string& requestUrl, const std::string& headerValue) {
    auto parsed = common::parseUrl(requestUrl);
    if (!parsed) return;

    std::stringstream stream(headerValue);
    std::string part;
    if (!std::getline(stream, part, ';')) return;

    size_t eq = part.find('=');
    if (eq == std::string::npos) return;
    CookieSpec cookie;
    cookie.name = trim(part.substr(0, eq));
    cookie.value = trim(part.substr(eq + 1));
    if (cookie.name.empty()) return;
    cookie.domain = parsed->host;
    cookie.path = defaultCookiePath(parsed->path);

    bool expired = false;
    while (std::getline(stream, part, ';')) {
        size_t attrEq = part.find('=');
        std::string key = toLower(trim(part.substr(0, attrEq)));
        std::string val = attrEq == std::string::npos ? "" : trim(part.substr(attrEq + 1));
        if (key == "domain" && !val.empty()) {
            // A server may only scope a cookie to its own host or a parent domain
            if (!cookieDomainMatches(parsed->host, val)) {
                LOG_DEBUG("Ignoring cookie " + cookie.name + " for foreign domain " + val);
                return;
            }
            cookie.domain = toLower(val[0] == '.' ? val.substr(1) : val);
        } else if (key == "path" && !val.empty() && val[0] == '/') {
            cookie.path = val;
        } else if (key == "max-age") {
            try {
                expired = std::stol(val) <= 0;
            } catch (const std::exception&) {
                LOG_DEBUG("Ignoring malformed Max-Age on cookie " + cookie.name);
            }
        }
    }

    if (expired) {
        removeCookie(cookie.name, cookie.domain, cookie.path);
        return;
    }
    LOG_TRACE("Stored cookie " + cookie.name + " for " + cookie.domain + cookie.path);
    addCookie(std::move(cookie));
}

void BrowsingContext::markUnsupported(std::string reason) {
    unsupportedReason_ = std::move(reason);
}

} // namespace sitewatch::auth
