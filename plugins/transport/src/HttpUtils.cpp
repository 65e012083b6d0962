#include "IHttpClient.h"
#include <stdexcept>
#include <cctype>

namespace CipherLink {
namespace Transport {

Url Url::parse(const std::string& url) {
    Url result;
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("URL has no scheme: " + url);
    }
    result.scheme = url.substr(0, schemeEnd);
    for (auto& c : result.scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (result.scheme != "http" && result.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + result.scheme);
    }

    auto authorityStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?", authorityStart);
    std::string authority = url.substr(authorityStart,
        pathStart == std::string::npos ? std::string::npos : pathStart - authorityStart);
    if (authority.empty()) {
        throw std::invalid_argument("URL has no host: " + url);
    }

    // [v6addr]:port or host:port
    std::string::size_type colon = std::string::npos;
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("Malformed IPv6 host: " + url);
        }
        result.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            colon = close + 1;
        }
    } else {
        colon = authority.rfind(':');
        result.host = authority.substr(0, colon);
    }

    if (colon != std::string::npos) {
        result.port = authority.substr(colon + 1);
    }
    if (result.port.empty()) {
        result.port = result.isTls() ? "443" : "80";
    }

    if (pathStart == std::string::npos) {
        result.target = "/";
    } else {
        result.target = url.substr(pathStart);
        if (result.target.front() == '?') {
            result.target = "/" + result.target;
        }
    }
    return result;
}

std::string percentEncode(const std::string& value) {
    static const char* HEX = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0F]);
        }
    }
    return out;
}

std::string buildUrl(const std::string& baseUrl,
                     const std::string& path,
                     const std::vector<std::pair<std::string, std::string>>& query) {
    std::string url = baseUrl;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    url += path;

    char separator = '?';
    for (const auto& [key, value] : query) {
        url += separator;
        url += percentEncode(key) + "=" + percentEncode(value);
        separator = '&';
    }
    return url;
}

} // namespace Transport
} // namespace CipherLink
