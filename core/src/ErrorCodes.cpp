#include "ErrorCodes.h"

namespace CipherLink {
namespace Core {

const std::unordered_map<ErrorCode, std::string>& ErrorRegistry::messages() {
    static const std::unordered_map<ErrorCode, std::string> table = {
        {ErrorCode::CONNECTION_FAILED, "Failed to reach the relay or peer"},
        {ErrorCode::TRANSPORT_TIMEOUT, "Transport call timed out"},
        {ErrorCode::HTTP_TRANSIENT, "Relay reported a transient failure"},
        {ErrorCode::HTTP_PERMANENT, "Relay rejected the request"},
        {ErrorCode::TRANSPORT_UNAVAILABLE, "Transport is not available on this device"},
        {ErrorCode::PEER_CHANNEL_FAILED, "Peer-to-peer data channel failed"},

        {ErrorCode::KEY_AGREEMENT_FAILED, "Key agreement failed"},
        {ErrorCode::ENCRYPTION_FAILED, "Encryption operation failed"},
        {ErrorCode::AUTHENTICATION_FAILED, "Authentication failed"},
        {ErrorCode::INVALID_KEY, "Invalid key material"},

        {ErrorCode::TRANSFER_PAUSED, "Transfer paused"},
        {ErrorCode::TRANSFER_CANCELLED, "Transfer cancelled"},
        {ErrorCode::MISSING_TRANSFER_ID, "Relay response did not include a transfer id"},
        {ErrorCode::BYTE_COUNT_MISMATCH, "Received byte count does not match the manifest"},
        {ErrorCode::MALFORMED_PAYLOAD, "Malformed payload"},
        {ErrorCode::TRANSFER_NOT_FOUND, "Transfer not found"},
        {ErrorCode::INVALID_MANIFEST, "Invalid transfer manifest"},

        {ErrorCode::SECURE_STORAGE_UNAVAILABLE, "Secure storage is unavailable"},
        {ErrorCode::STATE_STORE_FAILED, "Failed to persist transfer state"},
        {ErrorCode::FILE_NOT_FOUND, "File not found"},
        {ErrorCode::FILE_IO_FAILED, "File I/O failed"},

        {ErrorCode::INTERNAL_ERROR, "Internal error"},
        {ErrorCode::INVALID_CONFIGURATION, "Invalid configuration"},

        {ErrorCode::SUCCESS, "Operation successful"}
    };
    return table;
}

std::string ErrorRegistry::getMessage(ErrorCode code) {
    const auto& table = messages();
    auto it = table.find(code);
    if (it != table.end()) {
        return it->second;
    }
    return "Unknown error";
}

std::string ErrorRegistry::getCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::CONNECTION_FAILED: return "CONNECTION_FAILED";
        case ErrorCode::TRANSPORT_TIMEOUT: return "TRANSPORT_TIMEOUT";
        case ErrorCode::HTTP_TRANSIENT: return "HTTP_TRANSIENT";
        case ErrorCode::HTTP_PERMANENT: return "HTTP_PERMANENT";
        case ErrorCode::TRANSPORT_UNAVAILABLE: return "TRANSPORT_UNAVAILABLE";
        case ErrorCode::PEER_CHANNEL_FAILED: return "PEER_CHANNEL_FAILED";

        case ErrorCode::KEY_AGREEMENT_FAILED: return "KEY_AGREEMENT_FAILED";
        case ErrorCode::ENCRYPTION_FAILED: return "ENCRYPTION_FAILED";
        case ErrorCode::AUTHENTICATION_FAILED: return "AUTHENTICATION_FAILED";
        case ErrorCode::INVALID_KEY: return "INVALID_KEY";

        case ErrorCode::TRANSFER_PAUSED: return "TRANSFER_PAUSED";
        case ErrorCode::TRANSFER_CANCELLED: return "TRANSFER_CANCELLED";
        case ErrorCode::MISSING_TRANSFER_ID: return "MISSING_TRANSFER_ID";
        case ErrorCode::BYTE_COUNT_MISMATCH: return "BYTE_COUNT_MISMATCH";
        case ErrorCode::MALFORMED_PAYLOAD: return "MALFORMED_PAYLOAD";
        case ErrorCode::TRANSFER_NOT_FOUND: return "TRANSFER_NOT_FOUND";
        case ErrorCode::INVALID_MANIFEST: return "INVALID_MANIFEST";

        case ErrorCode::SECURE_STORAGE_UNAVAILABLE: return "SECURE_STORAGE_UNAVAILABLE";
        case ErrorCode::STATE_STORE_FAILED: return "STATE_STORE_FAILED";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_FAILED: return "FILE_IO_FAILED";

        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";

        case ErrorCode::SUCCESS: return "SUCCESS";
        default: return "UNKNOWN";
    }
}

} // namespace Core
} // namespace CipherLink
