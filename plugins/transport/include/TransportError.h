#pragma once

#include "Errors.h"
#include <string>

namespace CipherLink {
namespace Transport {

/**
 * @brief Failure of a transport call
 *
 * Http carries the response status. Timeout and Connection come from the
 * network stack. Unavailable means the transport cannot serve any further
 * calls and the fallback path must take over.
 */
class TransportError : public CipherLinkError {
public:
    enum class Kind {
        Http,
        Timeout,
        Connection,
        Unavailable,
        Protocol
    };

    TransportError(Kind kind, const std::string& message, int statusCode = 0)
        : CipherLinkError(codeFor(kind, statusCode), message)
        , kind_(kind)
        , statusCode_(statusCode) {}

    static TransportError http(int statusCode, const std::string& operation) {
        return TransportError(Kind::Http,
            operation + " failed: HTTP " + std::to_string(statusCode), statusCode);
    }

    static TransportError unavailable(const std::string& reason) {
        return TransportError(Kind::Unavailable, reason);
    }

    Kind kind() const { return kind_; }
    int statusCode() const { return statusCode_; }

    /**
     * @brief >=500, 408, 429, timeouts and connection errors are retryable
     */
    bool isTransient() const { return isTransient(kind_, statusCode_); }

    bool isUnavailable() const { return kind_ == Kind::Unavailable; }

    static bool isTransient(Kind kind, int statusCode) {
        switch (kind) {
            case Kind::Timeout:
            case Kind::Connection:
                return true;
            case Kind::Http:
                return statusCode >= 500 || statusCode == 408 || statusCode == 429;
            default:
                return false;
        }
    }

private:
    static Core::ErrorCode codeFor(Kind kind, int statusCode) {
        switch (kind) {
            case Kind::Timeout:     return Core::ErrorCode::TRANSPORT_TIMEOUT;
            case Kind::Connection:  return Core::ErrorCode::CONNECTION_FAILED;
            case Kind::Unavailable: return Core::ErrorCode::TRANSPORT_UNAVAILABLE;
            case Kind::Protocol:    return Core::ErrorCode::MALFORMED_PAYLOAD;
            case Kind::Http:
                return isTransient(kind, statusCode)
                    ? Core::ErrorCode::HTTP_TRANSIENT
                    : Core::ErrorCode::HTTP_PERMANENT;
        }
        return Core::ErrorCode::INTERNAL_ERROR;
    }

    Kind kind_;
    int statusCode_;
};

} // namespace Transport
} // namespace CipherLink
