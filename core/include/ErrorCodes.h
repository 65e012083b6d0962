#pragma once

#include <string>
#include <unordered_map>

namespace CipherLink {
namespace Core {

enum class ErrorCode : int {
    // Transport Errors (1000-1999)
    CONNECTION_FAILED = 1000,
    TRANSPORT_TIMEOUT = 1001,
    HTTP_TRANSIENT = 1002,
    HTTP_PERMANENT = 1003,
    TRANSPORT_UNAVAILABLE = 1004,
    PEER_CHANNEL_FAILED = 1005,

    // Security Errors (2000-2999)
    KEY_AGREEMENT_FAILED = 2000,
    ENCRYPTION_FAILED = 2001,
    AUTHENTICATION_FAILED = 2002,
    INVALID_KEY = 2003,

    // Transfer / protocol Errors (3000-3999)
    TRANSFER_PAUSED = 3000,
    TRANSFER_CANCELLED = 3001,
    MISSING_TRANSFER_ID = 3002,
    BYTE_COUNT_MISMATCH = 3003,
    MALFORMED_PAYLOAD = 3004,
    TRANSFER_NOT_FOUND = 3005,
    INVALID_MANIFEST = 3006,

    // Storage / resource Errors (4000-4999)
    SECURE_STORAGE_UNAVAILABLE = 4000,
    STATE_STORE_FAILED = 4001,
    FILE_NOT_FOUND = 4002,
    FILE_IO_FAILED = 4003,

    // System Errors (5000-5999)
    INTERNAL_ERROR = 5000,
    INVALID_CONFIGURATION = 5001,

    SUCCESS = 0
};

class ErrorRegistry {
public:
    static std::string getMessage(ErrorCode code);
    static std::string getCodeName(ErrorCode code);

private:
    static const std::unordered_map<ErrorCode, std::string>& messages();
};

} // namespace Core
} // namespace CipherLink
