#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <json/json.h>

namespace CipherLink {

namespace PayloadKind {
    constexpr const char* FILE = "file";
    constexpr const char* ZIP = "zip";
    constexpr const char* ALBUM = "album";
    constexpr const char* TEXT = "text";
}

namespace PackagingMode {
    constexpr const char* ORIGINALS = "originals";
    constexpr const char* ZIP = "zip";
    constexpr const char* ALBUM = "album";
}

namespace MediaType {
    constexpr const char* IMAGE = "image";
    constexpr const char* VIDEO = "video";
    constexpr const char* OTHER = "other";
}

constexpr const char* TEXT_MIME_PLAIN = "text/plain; charset=utf-8";

/**
 * @brief image/* -> image, video/* -> video, anything else -> other
 */
std::string mediaTypeFromMime(const std::string& mime);

struct ManifestFile {
    std::string relativePath;
    std::string mediaType = MediaType::OTHER;
    uint64_t sizeBytes = 0;
    std::optional<std::string> originalFilename;
    std::optional<std::string> mime;

    Json::Value toJson() const;
    // Accepts the legacy "name"/"bytes" keys
    static ManifestFile fromJson(const Json::Value& value);
};

/**
 * @brief Describes one transfer; encrypted and sent before any chunk
 *
 * Kind-specific fields are only serialized for their kind:
 * output_filename for zip, album_* for album, text_* for text.
 */
struct TransferManifest {
    std::string transferId;
    std::string payloadKind = PayloadKind::FILE;
    std::string packagingMode = PackagingMode::ORIGINALS;
    std::optional<std::string> packageTitle;
    uint64_t totalBytes = 0;
    uint32_t chunkSize = 0;
    std::vector<ManifestFile> files;
    std::optional<std::string> outputFilename;
    std::optional<std::string> albumTitle;
    std::optional<uint64_t> albumItemCount;
    std::optional<std::string> textTitle;
    std::optional<std::string> textMime;
    std::optional<uint64_t> textLength;

    bool isText() const { return payloadKind == PayloadKind::TEXT; }

    Json::Value toJson() const;
    std::string serialize() const;

    static TransferManifest fromJson(const Json::Value& value);

    /**
     * @throws ProtocolError(INVALID_MANIFEST) if text is not a JSON object
     */
    static TransferManifest parse(const std::string& text);
};

} // namespace CipherLink
