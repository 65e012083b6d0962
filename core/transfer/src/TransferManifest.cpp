#include "TransferManifest.h"
#include "Errors.h"
#include <sstream>

namespace CipherLink {

namespace {

std::optional<std::string> optionalString(const Json::Value& root, const char* key) {
    const Json::Value& value = root[key];
    if (value.isNull()) {
        return std::nullopt;
    }
    if (!value.isString()) {
        throw ProtocolError(Core::ErrorCode::INVALID_MANIFEST,
                            std::string("Manifest field '") + key + "' is not a string");
    }
    return value.asString();
}

std::string stringOr(const Json::Value& root, const char* key, const std::string& fallback) {
    return optionalString(root, key).value_or(fallback);
}

// Integers may arrive as numbers or numeric strings
std::optional<uint64_t> optionalCount(const Json::Value& root, const char* key) {
    const Json::Value& value = root[key];
    if (value.isUInt64()) {
        return value.asUInt64();
    }
    if (value.isString()) {
        try {
            return static_cast<uint64_t>(std::stoull(value.asString()));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

} // namespace

std::string mediaTypeFromMime(const std::string& mime) {
    if (mime.rfind("image/", 0) == 0) {
        return MediaType::IMAGE;
    }
    if (mime.rfind("video/", 0) == 0) {
        return MediaType::VIDEO;
    }
    return MediaType::OTHER;
}

Json::Value ManifestFile::toJson() const {
    Json::Value root;
    root["relative_path"] = relativePath;
    root["media_type"] = mediaType;
    root["size_bytes"] = Json::UInt64(sizeBytes);
    if (originalFilename) {
        root["original_filename"] = *originalFilename;
    }
    if (mime) {
        root["mime"] = *mime;
    }
    return root;
}

ManifestFile ManifestFile::fromJson(const Json::Value& value) {
    ManifestFile file;
    file.relativePath = value.isMember("relative_path")
        ? stringOr(value, "relative_path", "")
        : stringOr(value, "name", "");
    file.sizeBytes = optionalCount(value, "size_bytes").value_or(optionalCount(value, "bytes").value_or(0));
    file.mime = optionalString(value, "mime");
    file.originalFilename = optionalString(value, "original_filename");
    file.mediaType = value.isMember("media_type")
        ? stringOr(value, "media_type", "")
        : mediaTypeFromMime(file.mime.value_or(""));
    return file;
}

Json::Value TransferManifest::toJson() const {
    Json::Value root;
    root["transfer_id"] = transferId;
    root["payload_kind"] = payloadKind;
    root["packaging_mode"] = packagingMode;
    if (packageTitle) {
        root["package_title"] = *packageTitle;
    }
    root["total_bytes"] = Json::UInt64(totalBytes);
    root["chunk_size"] = Json::UInt(chunkSize);

    if (!files.empty()) {
        Json::Value list(Json::arrayValue);
        for (const auto& file : files) {
            list.append(file.toJson());
        }
        root["files"] = list;
    }

    if (payloadKind == PayloadKind::ZIP && outputFilename) {
        root["output_filename"] = *outputFilename;
    }
    if (payloadKind == PayloadKind::ALBUM) {
        if (albumTitle) {
            root["album_title"] = *albumTitle;
        }
        if (albumItemCount) {
            root["album_item_count"] = Json::UInt64(*albumItemCount);
        }
    }
    if (payloadKind == PayloadKind::TEXT) {
        root["text_title"] = textTitle ? Json::Value(*textTitle) : Json::Value();
        root["text_mime"] = textMime.value_or(TEXT_MIME_PLAIN);
        root["text_length"] = Json::UInt64(textLength.value_or(totalBytes));
    }
    return root;
}

std::string TransferManifest::serialize() const {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, toJson());
}

TransferManifest TransferManifest::fromJson(const Json::Value& value) {
    TransferManifest manifest;
    manifest.transferId = stringOr(value, "transfer_id", "");
    manifest.payloadKind = stringOr(value, "payload_kind", PayloadKind::FILE);
    manifest.packagingMode = stringOr(value, "packaging_mode", PackagingMode::ORIGINALS);
    manifest.packageTitle = optionalString(value, "package_title");
    manifest.totalBytes = optionalCount(value, "total_bytes").value_or(0);
    manifest.chunkSize = static_cast<uint32_t>(optionalCount(value, "chunk_size").value_or(0));

    const Json::Value& files = value["files"];
    if (files.isArray()) {
        for (const auto& entry : files) {
            if (entry.isObject()) {
                manifest.files.push_back(ManifestFile::fromJson(entry));
            }
        }
    }

    manifest.outputFilename = optionalString(value, "output_filename");
    manifest.albumTitle = optionalString(value, "album_title");
    manifest.albumItemCount = optionalCount(value, "album_item_count");
    manifest.textTitle = optionalString(value, "text_title");
    manifest.textMime = optionalString(value, "text_mime");
    manifest.textLength = optionalCount(value, "text_length");
    return manifest;
}

TransferManifest TransferManifest::parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream stream(text);
    if (!Json::parseFromStream(builder, stream, &root, &errors) || !root.isObject()) {
        throw ProtocolError(Core::ErrorCode::INVALID_MANIFEST, "Manifest is not a JSON object: " + errors);
    }
    return fromJson(root);
}

} // namespace CipherLink
