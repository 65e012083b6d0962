#pragma once

#include "ErrorCodes.h"
#include "Result.h"
#include <stdexcept>
#include <string>

namespace CipherLink {

/**
 * @brief Base of every exception thrown by CipherLink code.
 */
class CipherLinkError : public std::runtime_error {
public:
    CipherLinkError(Core::ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    Core::ErrorCode code() const { return code_; }

    Error toError(const std::string& component) const {
        return Error(what(), static_cast<int>(code_), component);
    }

private:
    Core::ErrorCode code_;
};

/**
 * @brief AEAD tag verification failed (tampering or wrong key). Never retried.
 */
class AuthenticationFailedError : public CipherLinkError {
public:
    explicit AuthenticationFailedError(const std::string& message)
        : CipherLinkError(Core::ErrorCode::AUTHENTICATION_FAILED, message) {}
};

/**
 * @brief Missing transfer id, malformed payload or byte-count mismatch.
 */
class ProtocolError : public CipherLinkError {
public:
    ProtocolError(Core::ErrorCode code, const std::string& message)
        : CipherLinkError(code, message) {}
};

/**
 * @brief The platform secure store cannot be reached.
 */
class SecureStoreUnavailableError : public CipherLinkError {
public:
    explicit SecureStoreUnavailableError(const std::string& message)
        : CipherLinkError(Core::ErrorCode::SECURE_STORAGE_UNAVAILABLE, message) {}
};

/**
 * @brief Non-secure persistence failure (SQLite, filesystem).
 */
class StorageError : public CipherLinkError {
public:
    StorageError(Core::ErrorCode code, const std::string& message)
        : CipherLinkError(code, message) {}
};

inline Error makeError(Core::ErrorCode code, const std::string& details, const std::string& component) {
    std::string message = Core::ErrorRegistry::getMessage(code);
    if (!details.empty()) {
        message += ": " + details;
    }
    return Error(message, static_cast<int>(code), component);
}

} // namespace CipherLink
