/**
 * @file test_state_stores.cpp
 * @brief Transfer-state stores, secure stores and the key pair store
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sys/stat.h>
#include <unistd.h>

#include "Errors.h"
#include "ISecureStore.h"
#include "InMemoryTransferStateStore.h"
#include "KeyPairStore.h"
#include "SQLiteTransferStateStore.h"
#include "SecureTransferStateStore.h"

using namespace CipherLink;
namespace fs = std::filesystem;

class StateStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("cipherlink_store_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    static TransferState makeState(const std::string& id, TransferDirection direction,
                                   TransferStatus status, int64_t updatedAt) {
        TransferState state;
        state.transferId = id;
        state.sessionId = "s1";
        state.transferToken = "token";
        state.direction = direction;
        state.status = status;
        state.totalBytes = 11;
        state.chunkSize = 4;
        state.nextChunkIndex = 2;
        state.nextOffset = 2 * (4 + 28);
        state.peerPublicKeyB64 = "cGVlcg==";
        state.payloadPath = "/tmp/payload.bin";
        state.scanRequired = true;
        state.claimId = "claim-1";
        state.updatedAtMs = updatedAt;
        state.attempt = 1;
        state.errorMessage = "HTTP 503";
        return state;
    }

    // Shared contract every ITransferStateStore must honour
    static void exerciseContract(ITransferStateStore& store) {
        EXPECT_FALSE(store.load("missing").has_value());

        store.save(makeState("b", TransferDirection::Upload, TransferStatus::Paused, 200));
        store.save(makeState("a", TransferDirection::Upload, TransferStatus::Uploading, 100));
        store.save(makeState("c", TransferDirection::Download, TransferStatus::Downloading, 300));
        store.save(makeState("done", TransferDirection::Upload, TransferStatus::Completed, 50));
        store.save(makeState("dead", TransferDirection::Download, TransferStatus::Failed, 60));

        auto loaded = store.load("a");
        ASSERT_TRUE(loaded.has_value());
        EXPECT_EQ(loaded->sessionId, "s1");
        EXPECT_EQ(loaded->status, TransferStatus::Uploading);
        EXPECT_EQ(loaded->nextChunkIndex, 2u);
        EXPECT_EQ(loaded->nextOffset, 64u);
        EXPECT_EQ(loaded->chunkSize, 4u);
        EXPECT_TRUE(loaded->scanRequired);
        EXPECT_EQ(loaded->claimId, "claim-1");
        EXPECT_EQ(loaded->errorMessage, "HTTP 503");

        auto pending = store.listPending();
        ASSERT_EQ(pending.size(), 3u);
        EXPECT_EQ(pending[0].transferId, "a");
        EXPECT_EQ(pending[1].transferId, "b");
        EXPECT_EQ(pending[2].transferId, "c");

        auto uploads = store.listPending(TransferDirection::Upload);
        ASSERT_EQ(uploads.size(), 2u);
        auto downloads = store.listPending(TransferDirection::Download);
        ASSERT_EQ(downloads.size(), 1u);
        EXPECT_EQ(downloads[0].transferId, "c");

        auto updated = makeState("a", TransferDirection::Upload, TransferStatus::Completed, 400);
        store.save(updated);
        EXPECT_EQ(store.load("a")->status, TransferStatus::Completed);
        EXPECT_EQ(store.listPending(TransferDirection::Upload).size(), 1u);

        store.remove("b");
        EXPECT_FALSE(store.load("b").has_value());
        store.remove("never-existed");
        EXPECT_EQ(store.listPending().size(), 1u);
    }

    fs::path dir_;
};

TEST_F(StateStoreTest, InMemoryStoreContract) {
    InMemoryTransferStateStore store;
    exerciseContract(store);
    EXPECT_EQ(store.size(), 4u);
}

TEST_F(StateStoreTest, SQLiteStoreContract) {
    SQLiteTransferStateStore store((dir_ / "states.db").string());
    EXPECT_EQ(store.schemaVersion(), 2);
    exerciseContract(store);
}

TEST_F(StateStoreTest, SQLiteStoreSurvivesReopen) {
    auto path = (dir_ / "states.db").string();
    {
        SQLiteTransferStateStore store(path);
        store.save(makeState("persisted", TransferDirection::Upload, TransferStatus::Paused, 10));
    }
    SQLiteTransferStateStore reopened(path);
    auto state = reopened.load("persisted");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->status, TransferStatus::Paused);
    EXPECT_EQ(state->payloadPath, "/tmp/payload.bin");
}

TEST_F(StateStoreTest, SQLiteStoreRejectsUnopenablePath) {
    auto path = (dir_ / "no_such_dir" / "nested" / "states.db").string();
    try {
        SQLiteTransferStateStore store(path);
        FAIL() << "expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_EQ(e.code(), Core::ErrorCode::STATE_STORE_FAILED);
    }
}

TEST_F(StateStoreTest, SecureStoreContract) {
    auto secure = std::make_shared<InMemorySecureStore>();
    SecureTransferStateStore store(secure);
    exerciseContract(store);

    auto index = secure->read(SecureTransferStateStore::INDEX_KEY);
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(index->find("\"b\""), std::string::npos);
}

TEST_F(StateStoreTest, SecureStoreUnavailablePropagates) {
    auto secure = std::make_shared<InMemorySecureStore>();
    SecureTransferStateStore store(secure);
    store.save(makeState("a", TransferDirection::Upload, TransferStatus::Queued, 1));

    secure->setAvailable(false);
    EXPECT_THROW(store.save(makeState("b", TransferDirection::Upload, TransferStatus::Queued, 2)),
                 SecureStoreUnavailableError);
    EXPECT_THROW(store.load("a"), SecureStoreUnavailableError);
    EXPECT_THROW(store.listPending(), SecureStoreUnavailableError);

    secure->setAvailable(true);
    EXPECT_TRUE(store.load("a").has_value());
}

TEST_F(StateStoreTest, SecureStoreSkipsCorruptRecords) {
    auto secure = std::make_shared<InMemorySecureStore>();
    SecureTransferStateStore store(secure);
    store.save(makeState("good", TransferDirection::Upload, TransferStatus::Paused, 1));
    store.save(makeState("bad", TransferDirection::Upload, TransferStatus::Paused, 2));
    secure->write(std::string(SecureTransferStateStore::KEY_PREFIX) + "bad", R"({"transfer_id":"bad","status":"weird"})");

    auto pending = store.listPending();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].transferId, "good");
}

TEST_F(StateStoreTest, StateJsonRejectsMissingId) {
    Json::Value root(Json::objectValue);
    root["direction"] = "upload";
    root["status"] = "queued";
    EXPECT_THROW(TransferState::fromJson(root), ProtocolError);

    root["transfer_id"] = "x";
    auto state = TransferState::fromJson(root);
    EXPECT_EQ(state.transferId, "x");
    EXPECT_EQ(state.nextChunkIndex, 0u);
}

TEST_F(StateStoreTest, StateJsonRejectsMistypedFields) {
    Json::Value root(Json::objectValue);
    root["transfer_id"] = "x";
    root["direction"] = Json::Value(Json::arrayValue);
    root["status"] = "queued";
    EXPECT_THROW(TransferState::fromJson(root), ProtocolError);

    root["direction"] = "upload";
    root["session_id"] = Json::Value(Json::objectValue);
    EXPECT_THROW(TransferState::fromJson(root), ProtocolError);
}

TEST_F(StateStoreTest, FileSecureStorePersistsOwnerOnly) {
    auto path = (dir_ / "keys.json").string();
    {
        FileSecureStore store(path);
        EXPECT_FALSE(store.read("k").has_value());
        store.write("k", "v1");
        store.write("other", "v2");
        store.remove("other");
    }

    FileSecureStore reopened(path);
    EXPECT_EQ(reopened.read("k").value_or(""), "v1");
    EXPECT_FALSE(reopened.read("other").has_value());

    struct stat info {};
    ASSERT_EQ(::stat(path.c_str(), &info), 0);
    EXPECT_EQ(info.st_mode & 0777, 0600u);
}

TEST_F(StateStoreTest, FileSecureStoreReportsCorruptFileAsUnavailable) {
    auto path = dir_ / "keys.json";
    std::ofstream(path) << "{ not json";
    FileSecureStore store(path.string());
    EXPECT_THROW(store.read("k"), SecureStoreUnavailableError);
}

TEST_F(StateStoreTest, FileSecureStoreUnwritableDirectory) {
    std::ofstream(dir_ / "blocker") << "plain file";
    FileSecureStore store((dir_ / "blocker" / "keys.json").string());
    EXPECT_THROW(store.write("k", "v"), SecureStoreUnavailableError);
}

TEST_F(StateStoreTest, KeyPairStoreRecomputesPublicKey) {
    auto secure = std::make_shared<InMemorySecureStore>();
    KeyPairStore keys(secure);

    EXPECT_FALSE(keys.load("sender", "s1").has_value());
    auto created = keys.loadOrCreate("sender", "s1");
    auto again = keys.loadOrCreate("sender", "s1");
    EXPECT_EQ(created.privateKey, again.privateKey);
    EXPECT_EQ(created.publicKey, again.publicKey);

    auto raw = secure->read(KeyPairStore::keyFor("sender", "s1"));
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(Crypto::fromBase64(*raw), created.privateKey);

    auto receiver = keys.loadOrCreate("receiver", "s1");
    EXPECT_NE(receiver.publicKey, created.publicKey);

    keys.remove("sender", "s1");
    EXPECT_FALSE(keys.load("sender", "s1").has_value());
}

TEST_F(StateStoreTest, KeyPairStoreIgnoresGarbage) {
    auto secure = std::make_shared<InMemorySecureStore>();
    KeyPairStore keys(secure);
    secure->write(KeyPairStore::keyFor("sender", "s1"), "%%%");
    EXPECT_FALSE(keys.load("sender", "s1").has_value());

    secure->write(KeyPairStore::keyFor("sender", "s2"), Crypto::toBase64({1, 2, 3}));
    EXPECT_FALSE(keys.load("sender", "s2").has_value());
}

TEST_F(StateStoreTest, KeyPairStoreSurfacesLockedKeychain) {
    auto secure = std::make_shared<InMemorySecureStore>();
    KeyPairStore keys(secure);
    secure->setAvailable(false);
    EXPECT_THROW(keys.loadOrCreate("sender", "s1"), SecureStoreUnavailableError);
}
