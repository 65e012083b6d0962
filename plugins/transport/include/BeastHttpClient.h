#pragma once

#include "IHttpClient.h"
#include <cstddef>

namespace CipherLink {
namespace Transport {

/**
 * @brief IHttpClient on Boost.Beast
 *
 * One connection per request. https:// URLs use TLS with peer and host
 * name verification against the system trust store and SNI.
 * Each network step (connect, handshake, write, read) is bounded by the
 * request timeout.
 */
class BeastHttpClient : public IHttpClient {
public:
    BeastHttpClient() = default;

    HttpResponse send(const HttpRequest& request) override;

    void setMaxBodySize(std::size_t bytes) { maxBodySize_ = bytes; }

private:
    std::size_t maxBodySize_ = 64 * 1024 * 1024;
};

} // namespace Transport
} // namespace CipherLink
