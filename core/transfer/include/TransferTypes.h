#pragma once

#include "Crypto.h"
#include "P2PTypes.h"
#include "TransferManifest.h"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace CipherLink {

/**
 * @brief One payload to upload
 *
 * Either bytes holds the payload, or payloadPath names a file read chunk
 * by chunk. Only path-backed payloads can resume after a restart.
 */
struct TransferFile {
    std::string id;
    std::string name;
    std::vector<uint8_t> bytes;
    std::string payloadPath;
    std::string payloadKind = PayloadKind::FILE;
    std::string mimeType = "application/octet-stream";
    std::string packagingMode = PackagingMode::ORIGINALS;
    std::optional<std::string> textTitle;
};

struct UploadJob {
    std::string sessionId;
    std::string transferToken;
    std::vector<uint8_t> peerPublicKey;
    X25519KeyPair localKeyPair;
    TransferFile file;
    bool scanRequired = false;

    // Set when the job continues a persisted transfer
    std::optional<std::string> transferId;
    // Fixed chunk size; 0 lets the coordinator pick from recent throughput
    uint32_t chunkSize = 0;

    // Try the WebRTC path first when present
    std::optional<Transport::P2PContext> p2p;
};

struct DownloadRequest {
    std::string sessionId;
    std::string transferToken;
    std::string transferId;
    std::vector<uint8_t> peerPublicKey;
    X25519KeyPair localKeyPair;
    bool sendReceipt = false;
    std::optional<Transport::P2PContext> p2p;
};

struct DownloadResult {
    std::string transferId;
    TransferManifest manifest;
    std::string payloadPath;
    std::string destination;
};

} // namespace CipherLink
