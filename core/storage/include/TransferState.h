#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <json/json.h>

namespace CipherLink {

enum class TransferDirection {
    Upload,
    Download
};

enum class TransferStatus {
    Queued,
    Uploading,
    Downloading,
    Paused,
    Completed,
    Failed
};

std::string toString(TransferDirection direction);
std::string toString(TransferStatus status);
std::optional<TransferDirection> parseDirection(const std::string& value);
std::optional<TransferStatus> parseStatus(const std::string& value);

/**
 * @brief Persisted progress of one upload or download.
 *
 * nextOffset counts bytes of the encrypted stream already transported and
 * always equals the sum of encrypted chunk sizes for [0, nextChunkIndex).
 */
struct TransferState {
    std::string transferId;
    std::string sessionId;
    std::string transferToken;
    TransferDirection direction = TransferDirection::Upload;
    TransferStatus status = TransferStatus::Queued;
    uint64_t totalBytes = 0;
    uint32_t chunkSize = 0;
    uint64_t nextOffset = 0;
    uint64_t nextChunkIndex = 0;
    std::string peerPublicKeyB64;
    std::string payloadPath;
    bool scanRequired = false;

    std::string claimId;
    std::string destination;
    std::string manifestPath;
    int64_t updatedAtMs = 0;
    int attempt = 0;
    std::string errorMessage;

    bool isTerminal() const {
        return status == TransferStatus::Completed || status == TransferStatus::Failed;
    }

    bool isActive() const {
        return status == TransferStatus::Uploading || status == TransferStatus::Downloading;
    }

    bool needsResume() const { return !isTerminal(); }

    Json::Value toJson() const;

    /**
     * @throws ProtocolError(MALFORMED_PAYLOAD) on missing id or unknown enum values
     */
    static TransferState fromJson(const Json::Value& value);
};

int64_t currentTimeMs();

} // namespace CipherLink
