/**
 * @file test_manifest.cpp
 * @brief Manifest JSON layout and lenient parsing
 */

#include <gtest/gtest.h>

#include "Errors.h"
#include "TransferManifest.h"

using namespace CipherLink;

class ManifestTest : public ::testing::Test {
protected:
    static Json::Value reparse(const TransferManifest& manifest) {
        Json::CharReaderBuilder builder;
        Json::Value root;
        std::string errors;
        std::string text = manifest.serialize();
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        EXPECT_TRUE(reader->parse(text.data(), text.data() + text.size(), &root, &errors)) << errors;
        return root;
    }
};

TEST_F(ManifestTest, FileManifestCarriesOnlyCommonFields) {
    TransferManifest manifest;
    manifest.transferId = "t1";
    manifest.totalBytes = 11;
    manifest.chunkSize = 4;
    ManifestFile file;
    file.relativePath = "photo.jpg";
    file.mime = "image/jpeg";
    file.mediaType = mediaTypeFromMime(*file.mime);
    file.sizeBytes = 11;
    manifest.files.push_back(file);
    manifest.outputFilename = "ignored.zip";

    auto root = reparse(manifest);
    EXPECT_EQ(root["transfer_id"].asString(), "t1");
    EXPECT_EQ(root["payload_kind"].asString(), "file");
    EXPECT_EQ(root["packaging_mode"].asString(), "originals");
    EXPECT_EQ(root["total_bytes"].asUInt64(), 11u);
    EXPECT_EQ(root["chunk_size"].asUInt(), 4u);
    EXPECT_EQ(root["files"][0]["media_type"].asString(), "image");
    EXPECT_FALSE(root.isMember("output_filename"));
    EXPECT_FALSE(root.isMember("text_mime"));
    EXPECT_FALSE(root.isMember("album_title"));
}

TEST_F(ManifestTest, TextManifestDefaultsMimeAndLength) {
    TransferManifest manifest;
    manifest.transferId = "t2";
    manifest.payloadKind = PayloadKind::TEXT;
    manifest.totalBytes = 5;

    auto root = reparse(manifest);
    EXPECT_EQ(root["text_mime"].asString(), TEXT_MIME_PLAIN);
    EXPECT_EQ(root["text_length"].asUInt64(), 5u);
    EXPECT_TRUE(root.isMember("text_title"));
    EXPECT_TRUE(root["text_title"].isNull());

    auto parsed = TransferManifest::parse(manifest.serialize());
    EXPECT_TRUE(parsed.isText());
    EXPECT_FALSE(parsed.textTitle.has_value());
    EXPECT_EQ(parsed.textLength.value_or(0), 5u);
}

TEST_F(ManifestTest, ZipAndAlbumFieldsRoundTrip) {
    TransferManifest zip;
    zip.transferId = "z";
    zip.payloadKind = PayloadKind::ZIP;
    zip.packagingMode = PackagingMode::ZIP;
    zip.outputFilename = "bundle.zip";
    auto parsedZip = TransferManifest::parse(zip.serialize());
    EXPECT_EQ(parsedZip.outputFilename.value_or(""), "bundle.zip");

    TransferManifest album;
    album.transferId = "a";
    album.payloadKind = PayloadKind::ALBUM;
    album.packagingMode = PackagingMode::ALBUM;
    album.albumTitle = "Trip";
    album.albumItemCount = 3;
    auto parsedAlbum = TransferManifest::parse(album.serialize());
    EXPECT_EQ(parsedAlbum.albumTitle.value_or(""), "Trip");
    EXPECT_EQ(parsedAlbum.albumItemCount.value_or(0), 3u);
}

TEST_F(ManifestTest, ParsesLegacyKeysAndStringNumbers) {
    auto manifest = TransferManifest::parse(
        R"({"transfer_id":"old","total_bytes":"42","chunk_size":"8",)"
        R"("files":[{"name":"clip.mp4","bytes":"42","mime":"video/mp4"}, 7]})");

    EXPECT_EQ(manifest.transferId, "old");
    EXPECT_EQ(manifest.payloadKind, "file");
    EXPECT_EQ(manifest.totalBytes, 42u);
    EXPECT_EQ(manifest.chunkSize, 8u);
    ASSERT_EQ(manifest.files.size(), 1u);
    EXPECT_EQ(manifest.files[0].relativePath, "clip.mp4");
    EXPECT_EQ(manifest.files[0].sizeBytes, 42u);
    EXPECT_EQ(manifest.files[0].mediaType, "video");
}

TEST_F(ManifestTest, RejectsNonObjects) {
    EXPECT_THROW(TransferManifest::parse("not json"), ProtocolError);
    EXPECT_THROW(TransferManifest::parse("[1,2,3]"), ProtocolError);

    try {
        TransferManifest::parse("42");
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.code(), Core::ErrorCode::INVALID_MANIFEST);
    }
}

TEST_F(ManifestTest, RejectsMistypedStringFields) {
    EXPECT_THROW(TransferManifest::parse(R"({"transfer_id":{"id":"t1"}})"), ProtocolError);
    EXPECT_THROW(TransferManifest::parse(R"({"transfer_id":"t1","payload_kind":["file"]})"), ProtocolError);
    EXPECT_THROW(TransferManifest::parse(R"({"transfer_id":"t1","files":[{"relative_path":[1]}]})"),
                 ProtocolError);
    EXPECT_THROW(TransferManifest::parse(R"({"transfer_id":"t1","text_title":{}})"), ProtocolError);
}

TEST_F(ManifestTest, MediaTypeFromMime) {
    EXPECT_EQ(mediaTypeFromMime("image/png"), "image");
    EXPECT_EQ(mediaTypeFromMime("video/quicktime"), "video");
    EXPECT_EQ(mediaTypeFromMime("application/pdf"), "other");
    EXPECT_EQ(mediaTypeFromMime(""), "other");
}
