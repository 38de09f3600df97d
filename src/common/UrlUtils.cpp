#include "../../include/sitewatch/common/UrlUtils.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

namespace sitewatch::common {

namespace {

inline bool isAsciiSpace(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool hasScheme(const std::string& ref) {
    if (ref.empty() || !std::isalpha(static_cast<unsigned char>(ref[0]))) return false;
    for (size_t i = 1; i < ref.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(ref[i]);
        if (c == ':') return true;
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return false;
    }
    return false;
}

std::string removeDotSegments(const std::string& path) {
    std::vector<std::string> segments;
    std::vector<std::string> out;
    size_t start = path.empty() || path[0] != '/' ? 0 : 1;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            segments.push_back(path.substr(start));
            break;
        }
        segments.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }

    bool trailingSlash = false;
    for (size_t i = 0; i < segments.size(); ++i) {
        const bool last = i + 1 == segments.size();
        const std::string& seg = segments[i];
        if (seg == ".") {
            trailingSlash = last;
            continue;
        }
        if (seg == "..") {
            if (!out.empty()) out.pop_back();
            trailingSlash = last;
            continue;
        }
        out.push_back(seg);
        trailingSlash = false;
    }

    std::string result = "/";
    for (size_t i = 0; i < out.size(); ++i) {
        if (i) result += '/';
        result += out[i];
    }
    if (trailingSlash && result.back() != '/') {
        result += '/';
    }
    return result;
}

// Splits a relative reference into path, query and fragment.
void splitReference(const std::string& ref, std::string& path, std::string& query, std::string& fragment,
                    bool& hasQuery) {
    size_t hash = ref.find('#');
    std::string beforeHash = hash == std::string::npos ? ref : ref.substr(0, hash);
    fragment = hash == std::string::npos ? "" : ref.substr(hash + 1);
    size_t q = beforeHash.find('?');
    hasQuery = q != std::string::npos;
    path = hasQuery ? beforeHash.substr(0, q) : beforeHash;
    query = hasQuery ? beforeHash.substr(q + 1) : "";
}

} // namespace

std::string sanitizeUrl(const std::string& input) {
    if (input.empty()) return input;

    size_t start = 0;
    size_t end = input.size();
    while (start < end && isAsciiSpace(static_cast<unsigned char>(input[start]))) start++;
    while (end > start && isAsciiSpace(static_cast<unsigned char>(input[end - 1]))) end--;

    std::string s = input.substr(start, end - start);

    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c & 0x80) == 0) {
            if (c < 0x20 || c == 0x7F) { i++; continue; }
            out.push_back(static_cast<char>(c));
            i++;
            continue;
        }

        uint32_t cp = 0;
        size_t adv = 1;
        if ((c & 0xE0) == 0xC0 && i + 1 < s.size()) {
            cp = ((c & 0x1F) << 6) | (static_cast<unsigned char>(s[i + 1]) & 0x3F);
            adv = 2;
        } else if ((c & 0xF0) == 0xE0 && i + 2 < s.size()) {
            cp = ((c & 0x0F) << 12) |
                 ((static_cast<unsigned char>(s[i + 1]) & 0x3F) << 6) |
                 (static_cast<unsigned char>(s[i + 2]) & 0x3F);
            adv = 3;
        } else if ((c & 0xF8) == 0xF0 && i + 3 < s.size()) {
            cp = ((c & 0x07) << 18) |
                 ((static_cast<unsigned char>(s[i + 1]) & 0x3F) << 12) |
                 ((static_cast<unsigned char>(s[i + 2]) & 0x3F) << 6) |
                 (static_cast<unsigned char>(s[i + 3]) & 0x3F);
            adv = 4;
        } else {
            i++;
            continue;
        }

        if (cp == 0x200B || cp == 0x200C || cp == 0x200D || cp == 0x2060 || cp == 0xFEFF ||
            cp == 0x200E || cp == 0x200F ||
            cp == 0x202A || cp == 0x202B || cp == 0x202C || cp == 0x202D || cp == 0x202E ||
            cp == 0x2066 || cp == 0x2067 || cp == 0x2068 || cp == 0x2069) {
            i += adv;
            continue;
        }

        for (size_t k = 0; k < adv; ++k) {
            out.push_back(s[i + k]);
        }
        i += adv;
    }

    return out;
}

std::string hexDump(const std::string& input) {
    std::ostringstream oss;
    oss.setf(std::ios::hex, std::ios::basefield);
    for (size_t i = 0; i < input.size(); ++i) {
        unsigned int v = static_cast<unsigned char>(input[i]);
        if (i) oss << ' ';
        if (v < 0x10) oss << '0';
        oss << v;
    }
    return oss.str();
}

std::string ParsedUrl::origin() const {
    std::string out = scheme + "://" + host;
    if (!port.empty()) out += ":" + port;
    return out;
}

std::string ParsedUrl::toString(bool withFragment) const {
    std::string out = scheme + "://";
    if (!userInfo.empty()) out += userInfo + "@";
    out += host;
    if (!port.empty()) out += ":" + port;
    out += path.empty() ? "/" : path;
    if (!query.empty()) out += "?" + query;
    if (withFragment && !fragment.empty()) out += "#" + fragment;
    return out;
}

std::optional<ParsedUrl> parseUrl(const std::string& rawUrl) {
    const std::string url = sanitizeUrl(rawUrl);
    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0 || !hasScheme(url.substr(0, schemeEnd + 1))) {
        return std::nullopt;
    }

    ParsedUrl parsed;
    parsed.scheme = toLower(url.substr(0, schemeEnd));

    size_t authorityStart = schemeEnd + 3;
    size_t authorityEnd = url.find_first_of("/?#", authorityStart);
    std::string authority = url.substr(authorityStart,
        authorityEnd == std::string::npos ? std::string::npos : authorityEnd - authorityStart);

    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        parsed.userInfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
    }

    std::string hostPart = authority;
    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        hostPart = authority.substr(0, close + 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') return std::nullopt;
            parsed.port = authority.substr(close + 2);
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            hostPart = authority.substr(0, colon);
            parsed.port = authority.substr(colon + 1);
        }
    }
    if (!std::all_of(parsed.port.begin(), parsed.port.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    parsed.host = toLower(hostPart);
    if (parsed.host.empty()) {
        return std::nullopt;
    }
    for (unsigned char c : parsed.host) {
        if (std::isspace(c) || c == '<' || c == '>' || c == '"' || c == '\\') return std::nullopt;
    }

    if (authorityEnd != std::string::npos) {
        bool hasQuery = false;
        splitReference(url.substr(authorityEnd), parsed.path, parsed.query, parsed.fragment, hasQuery);
    }
    if (parsed.path.empty()) {
        parsed.path = "/";
    }
    return parsed;
}

std::optional<std::string> resolveUrl(const std::string& baseUrl, const std::string& rawHref) {
    const std::string href = sanitizeUrl(rawHref);
    auto base = parseUrl(baseUrl);
    if (!base) {
        return std::nullopt;
    }
    if (href.empty()) {
        return base->toString(false);
    }

    if (hasScheme(href)) {
        const std::string scheme = toLower(href.substr(0, href.find(':')));
        if (scheme != "http" && scheme != "https") {
            return href;
        }
        auto absolute = parseUrl(href);
        if (!absolute) return std::nullopt;
        absolute->path = removeDotSegments(absolute->path);
        return absolute->toString();
    }

    if (href.rfind("//", 0) == 0) {
        auto absolute = parseUrl(base->scheme + ":" + href);
        if (!absolute) return std::nullopt;
        absolute->path = removeDotSegments(absolute->path);
        return absolute->toString();
    }

    ParsedUrl target = *base;
    std::string path;
    std::string query;
    std::string fragment;
    bool hasQuery = false;
    splitReference(href, path, query, fragment, hasQuery);
    target.fragment = fragment;

    if (path.empty()) {
        if (hasQuery) target.query = query;
        return target.toString();
    }

    if (path[0] == '/') {
        target.path = removeDotSegments(path);
    } else {
        std::string directory = base->path.substr(0, base->path.rfind('/') + 1);
        target.path = removeDotSegments(directory + path);
    }
    target.query = query;
    return target.toString();
}

std::string normalizeUrl(const std::string& url) {
    auto parsed = parseUrl(url);
    if (!parsed) {
        return sanitizeUrl(url);
    }
    if ((parsed->scheme == "http" && parsed->port == "80") ||
        (parsed->scheme == "https" && parsed->port == "443")) {
        parsed->port.clear();
    }
    parsed->path = removeDotSegments(parsed->path);
    if (parsed->path.size() > 1 && parsed->path.back() == '/') {
        parsed->path.pop_back();
    }
    return parsed->toString(false);
}

std::string stripFragment(const std::string& url) {
    size_t hash = url.find('#');
    return hash == std::string::npos ? url : url.substr(0, hash);
}

std::string extractHost(const std::string& url) {
    auto parsed = parseUrl(url);
    return parsed ? parsed->host : std::string();
}

bool isHttpUrl(const std::string& url) {
    auto parsed = parseUrl(url);
    return parsed && (parsed->scheme == "http" || parsed->scheme == "https");
}

bool isSameHost(const std::string& a, const std::string& b) {
    const std::string hostA = extractHost(a);
    return !hostA.empty() && hostA == extractHost(b);
}

} // namespace sitewatch::common
