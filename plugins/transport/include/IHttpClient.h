#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <cstdint>

namespace CipherLink {
namespace Transport {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;
    std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
    int status = 0;
    std::vector<uint8_t> body;
    std::map<std::string, std::string> headers;

    std::string bodyText() const { return std::string(body.begin(), body.end()); }
};

/**
 * @brief Blocking HTTP/1.1 client
 *
 * Returns every response that reached the client, whatever its status.
 * Network failures throw TransportError (Connection or Timeout).
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

/**
 * @brief Parsed absolute http(s) URL
 */
struct Url {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;   // path plus query, always starts with '/'

    bool isTls() const { return scheme == "https"; }

    /**
     * @throws std::invalid_argument for anything but http:// and https:// URLs
     */
    static Url parse(const std::string& url);
};

std::string percentEncode(const std::string& value);

/**
 * @brief Append path and percent-encoded query parameters to a base URL
 */
std::string buildUrl(const std::string& baseUrl,
                     const std::string& path,
                     const std::vector<std::pair<std::string, std::string>>& query = {});

} // namespace Transport
} // namespace CipherLink
