/**
 * @file test_coordinator.cpp
 * @brief Upload queue, resume, failure classification and downloads
 */

#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <thread>
#include <unistd.h>

#include "EncryptedPayload.h"
#include "FallbackTransport.h"
#include "ISecureStore.h"
#include "InMemoryTransferStateStore.h"
#include "HttpTransport.h"
#include "KeyDerivation.h"
#include "MockHttpClient.h"
#include "MockBackground.h"
#include "MockTransport.h"
#include "SecureTransferStateStore.h"
#include "TransferCoordinator.h"
#include "TransportError.h"

using namespace CipherLink;
using CipherLink::Testing::InMemoryRelay;
using CipherLink::Transport::TransportError;

namespace fs = std::filesystem;

namespace {

const std::string PAYLOAD = "ABCDEFGHIJK";
constexpr uint32_t CHUNK = 4;
constexpr uint64_t WIRE_CHUNK = CHUNK + EncryptedPayload::OVERHEAD;

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

class CoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("cipherlink_coord_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);

        sender_ = Crypto::generateX25519KeyPair();
        receiver_ = Crypto::generateX25519KeyPair();
        relay_ = std::make_shared<InMemoryRelay>();
        store_ = std::make_shared<InMemoryTransferStateStore>();
        coordinator_ = makeCoordinator(store_);
    }

    void TearDown() override {
        coordinator_.reset();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    CoordinatorOptions options(std::chrono::milliseconds stallTimeout = std::chrono::milliseconds(0)) {
        CoordinatorOptions opts;
        opts.stallTimeout = stallTimeout;
        opts.downloadDir = (dir_ / "downloads").string();
        opts.retry.setSleeper([](std::chrono::milliseconds) {});
        return opts;
    }

    std::unique_ptr<TransferCoordinator> makeCoordinator(std::shared_ptr<ITransferStateStore> store,
                                                         CoordinatorOptions opts) {
        return std::make_unique<TransferCoordinator>(relay_, std::move(store), std::move(opts));
    }

    std::unique_ptr<TransferCoordinator> makeCoordinator(std::shared_ptr<ITransferStateStore> store) {
        return makeCoordinator(std::move(store), options());
    }

    UploadJob job(const std::string& id, const std::string& text = PAYLOAD) {
        UploadJob upload;
        upload.sessionId = "s1";
        upload.transferToken = "tok";
        upload.peerPublicKey = receiver_.publicKey;
        upload.localKeyPair = sender_;
        upload.file.id = id;
        upload.file.name = id + ".txt";
        upload.file.mimeType = "text/plain";
        upload.file.bytes = Crypto::toBytes(text);
        upload.chunkSize = CHUNK;
        return upload;
    }

    DownloadRequest download(const std::string& id, bool receipt = false) {
        DownloadRequest request;
        request.sessionId = "s1";
        request.transferToken = "tok";
        request.transferId = id;
        request.peerPublicKey = sender_.publicKey;
        request.localKeyPair = receiver_;
        request.sendReceipt = receipt;
        return request;
    }

    // Decrypts what the relay holds the way a receiver would
    std::string relayPlaintext(const std::string& id) {
        auto sessionKey = KeyDerivation::deriveSessionKey(receiver_, sender_.publicKey, "s1");
        TransferCipher cipher(sessionKey, "s1", id);
        auto stream = relay_->encryptedStream(id);
        std::string plaintext;
        uint64_t index = 0;
        for (uint64_t offset = 0; offset < stream.size(); offset += WIRE_CHUNK, ++index) {
            uint64_t end = std::min<uint64_t>(stream.size(), offset + WIRE_CHUNK);
            std::vector<uint8_t> wire(stream.begin() + static_cast<std::ptrdiff_t>(offset),
                                      stream.begin() + static_cast<std::ptrdiff_t>(end));
            auto chunk = cipher.decryptChunk(index, EncryptedPayload::parse(wire));
            plaintext.append(chunk.begin(), chunk.end());
        }
        return plaintext;
    }

    fs::path dir_;
    X25519KeyPair sender_;
    X25519KeyPair receiver_;
    std::shared_ptr<InMemoryRelay> relay_;
    std::shared_ptr<InMemoryTransferStateStore> store_;
    std::unique_ptr<TransferCoordinator> coordinator_;
};

TEST_F(CoordinatorTest, UploadsEncryptedChunksInOrder) {
    std::vector<TransferState> states;
    coordinator_->setStateCallback([&states](const TransferState& state) { states.push_back(state); });

    EXPECT_EQ(coordinator_->enqueue(job("t1")), "t1");
    ASSERT_TRUE(coordinator_->runQueue().isOk());

    ASSERT_TRUE(relay_->hasTransfer("t1"));
    auto stored = relay_->transfer("t1");
    EXPECT_TRUE(stored.finalized);
    EXPECT_EQ(stored.totalBytes, PAYLOAD.size());
    EXPECT_EQ(relay_->sentOffsets(), std::vector<uint64_t>({0, WIRE_CHUNK, 2 * WIRE_CHUNK}));
    EXPECT_EQ(relay_->encryptedStream("t1").size(), PAYLOAD.size() + 3 * EncryptedPayload::OVERHEAD);
    EXPECT_EQ(relayPlaintext("t1"), PAYLOAD);

    auto state = store_->load("t1");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->status, TransferStatus::Completed);
    EXPECT_EQ(state->nextChunkIndex, 3u);
    EXPECT_EQ(state->nextOffset, relay_->encryptedStream("t1").size());

    ASSERT_FALSE(states.empty());
    EXPECT_EQ(states.front().status, TransferStatus::Uploading);
    EXPECT_EQ(states.back().status, TransferStatus::Completed);
    EXPECT_EQ(coordinator_->queueSize(), 0u);
}

TEST_F(CoordinatorTest, QueueDrainsFifo) {
    std::vector<std::string> started;
    coordinator_->setStateCallback([&started](const TransferState& state) {
        if (state.status == TransferStatus::Uploading && state.nextChunkIndex == 0) {
            started.push_back(state.transferId);
        }
    });

    coordinator_->enqueue(job("first"));
    coordinator_->enqueue(job("second", "second payload"));
    coordinator_->enqueue(job("third", "x"));
    ASSERT_TRUE(coordinator_->runQueue().isOk());

    EXPECT_EQ(started, std::vector<std::string>({"first", "second", "third"}));
    EXPECT_EQ(relayPlaintext("first"), PAYLOAD);
    EXPECT_EQ(relayPlaintext("second"), "second payload");
    EXPECT_EQ(relayPlaintext("third"), "x");
}

TEST_F(CoordinatorTest, TransientFailurePausesAndResumeContinuesFromLastChunk) {
    relay_->setHook([](const std::string& operation, uint64_t offset) {
        if (operation == "sendChunk" && offset == 2 * WIRE_CHUNK) {
            throw TransportError::http(503, "sendChunk");
        }
    });

    coordinator_->enqueue(job("t1"));
    ASSERT_TRUE(coordinator_->runQueue().isOk());

    auto paused = store_->load("t1");
    ASSERT_TRUE(paused.has_value());
    EXPECT_EQ(paused->status, TransferStatus::Paused);
    EXPECT_EQ(paused->nextChunkIndex, 2u);
    EXPECT_EQ(paused->nextOffset, 2 * WIRE_CHUNK);
    EXPECT_FALSE(paused->errorMessage.empty());
    EXPECT_EQ(relay_->callCount("sendChunk"), 2 + 5);
    EXPECT_EQ(coordinator_->queueSize(), 1u);

    relay_->setHook(nullptr);
    ASSERT_TRUE(coordinator_->resume().isOk());

    EXPECT_EQ(relay_->callCount("initTransfer"), 1);
    EXPECT_EQ(relay_->sentOffsets(), std::vector<uint64_t>({0, WIRE_CHUNK, 2 * WIRE_CHUNK}));
    EXPECT_EQ(relayPlaintext("t1"), PAYLOAD);
    EXPECT_EQ(store_->load("t1")->status, TransferStatus::Completed);
}

TEST_F(CoordinatorTest, TransientInitFailureKeepsJobQueued) {
    relay_->setHook([](const std::string& operation, uint64_t) {
        if (operation == "initTransfer") {
            throw TransportError(TransportError::Kind::Connection, "refused");
        }
    });

    coordinator_->enqueue(job("t1"));
    coordinator_->enqueue(job("t2"));
    ASSERT_TRUE(coordinator_->runQueue().isOk());

    EXPECT_EQ(relay_->callCount("initTransfer"), 4);
    EXPECT_EQ(store_->load("t1")->status, TransferStatus::Queued);
    EXPECT_FALSE(store_->load("t2").has_value());
    EXPECT_EQ(coordinator_->queueSize(), 2u);
}

TEST_F(CoordinatorTest, PermanentFailureFailsJobAndQueueContinues) {
    relay_->setHook([](const std::string& operation, uint64_t offset) {
        if (operation == "sendChunk" && offset == WIRE_CHUNK) {
            throw TransportError::http(404, "sendChunk");
        }
    });

    coordinator_->enqueue(job("t1"));
    coordinator_->enqueue(job("t2", "ok"));
    ASSERT_TRUE(coordinator_->runQueue().isOk());

    auto failed = store_->load("t1");
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->status, TransferStatus::Failed);
    EXPECT_EQ(failed->nextChunkIndex, 1u);
    EXPECT_FALSE(relay_->transfer("t1").finalized);

    EXPECT_EQ(store_->load("t2")->status, TransferStatus::Completed);
    EXPECT_EQ(coordinator_->queueSize(), 0u);
}

TEST_F(CoordinatorTest, ConflictOnInitIsNotRetried) {
    relay_->initTransfer("s1", "tok", {}, 0, std::string("t1"));

    coordinator_->enqueue(job("t1"));
    ASSERT_TRUE(coordinator_->runQueue().isOk());

    EXPECT_EQ(relay_->callCount("initTransfer"), 2);
    EXPECT_EQ(store_->load("t1")->status, TransferStatus::Failed);
}

TEST_F(CoordinatorTest, RelayAssigningAnotherIdFailsJob) {
    relay_->setAssignIds(true);
    coordinator_->enqueue(job("t1"));
    ASSERT_TRUE(coordinator_->runQueue().isOk());

    auto state = store_->load("t1");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->status, TransferStatus::Failed);
    EXPECT_EQ(relay_->callCount("sendChunk"), 0);
}

TEST_F(CoordinatorTest, PauseStopsAtChunkBoundary) {
    coordinator_->setStateCallback([this](const TransferState& state) {
        if (state.status == TransferStatus::Uploading && state.nextChunkIndex == 1) {
            coordinator_->pause();
        }
    });

    coordinator_->enqueue(job("t1"));
    ASSERT_TRUE(coordinator_->runQueue().isOk());
    EXPECT_TRUE(coordinator_->isPaused());
    EXPECT_EQ(store_->load("t1")->status, TransferStatus::Paused);
    EXPECT_EQ(store_->load("t1")->nextChunkIndex, 1u);
    EXPECT_EQ(relay_->callCount("sendChunk"), 1);

    coordinator_->setStateCallback(nullptr);
    ASSERT_TRUE(coordinator_->resume().isOk());
    EXPECT_FALSE(coordinator_->isPaused());
    EXPECT_EQ(relayPlaintext("t1"), PAYLOAD);
}

TEST_F(CoordinatorTest, CancelRunningJobDropsState) {
    coordinator_->setStateCallback([this](const TransferState& state) {
        if (state.transferId == "t1" && state.nextChunkIndex == 1) {
            EXPECT_TRUE(coordinator_->cancel(state.transferId).isOk());
        }
    });

    coordinator_->enqueue(job("t1"));
    coordinator_->enqueue(job("t2", "kept"));
    ASSERT_TRUE(coordinator_->runQueue().isOk());

    EXPECT_FALSE(store_->load("t1").has_value());
    EXPECT_FALSE(relay_->transfer("t1").finalized);
    EXPECT_EQ(relay_->callCount("finalizeTransfer"), 1);
    EXPECT_EQ(coordinator_->queueSize(), 0u);
}

TEST_F(CoordinatorTest, BackgroundHooksSeeEveryPersistAndRemoval) {
    auto hooks = std::make_shared<Testing::RecordingHooks>();
    auto opts = options();
    opts.backgroundHooks = hooks;
    coordinator_ = makeCoordinator(store_, std::move(opts));
    coordinator_->setStateCallback([this](const TransferState& state) {
        if (state.transferId == "t2" && state.nextChunkIndex == 1) {
            EXPECT_TRUE(coordinator_->cancel(state.transferId).isOk());
        }
    });

    coordinator_->enqueue(job("t1"));
    coordinator_->enqueue(job("t2"));
    ASSERT_TRUE(coordinator_->runQueue().isOk());

    ASSERT_FALSE(hooks->updates.empty());
    EXPECT_EQ(hooks->updates.front().transferId, "t1");
    bool sawCompleted = false;
    for (const auto& update : hooks->updates) {
        if (update.transferId == "t1" && update.status == TransferStatus::Completed) {
            sawCompleted = true;
        }
    }
    EXPECT_TRUE(sawCompleted);
    EXPECT_EQ(hooks->removed, std::vector<std::string>({"t2"}));
}

TEST_F(CoordinatorTest, MistypedRelayReplyFailsJobAndQueueContinues) {
    auto client = std::make_shared<Testing::ScriptedHttpClient>();
    client->enqueueJson(200, R"({"transfer_id":{}})");
    client->enqueueJson(200, R"({"transfer_id":"t2"})");
    auto http = std::make_shared<Transport::HttpTransport>("http://relay", client, std::chrono::milliseconds(1000));
    coordinator_ = std::make_unique<TransferCoordinator>(http, store_, options());

    coordinator_->enqueue(job("t1"));
    coordinator_->enqueue(job("t2"));
    ASSERT_TRUE(coordinator_->runQueue().isOk());

    auto failed = store_->load("t1");
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->status, TransferStatus::Failed);
    auto completed = store_->load("t2");
    ASSERT_TRUE(completed.has_value());
    EXPECT_EQ(completed->status, TransferStatus::Completed);
    EXPECT_EQ(coordinator_->queueSize(), 0u);
    EXPECT_TRUE(coordinator_->runQueue().isOk());
}

TEST_F(CoordinatorTest, CancelFromPreviousJobCallbackSticks) {
    coordinator_->setStateCallback([this](const TransferState& state) {
        if (state.transferId == "t1" && state.status == TransferStatus::Completed) {
            EXPECT_TRUE(coordinator_->cancel("t2").isOk());
        }
    });

    coordinator_->enqueue(job("t1"));
    coordinator_->enqueue(job("t2"));
    coordinator_->enqueue(job("t3"));
    ASSERT_TRUE(coordinator_->runQueue().isOk());

    EXPECT_TRUE(relay_->transfer("t1").finalized);
    EXPECT_FALSE(relay_->hasTransfer("t2"));
    EXPECT_FALSE(store_->load("t2").has_value());
    EXPECT_TRUE(relay_->transfer("t3").finalized);
    EXPECT_EQ(coordinator_->queueSize(), 0u);
}

TEST_F(CoordinatorTest, CancelQueuedJob) {
    coordinator_->enqueue(job("t1"));
    coordinator_->enqueue(job("t2"));
    ASSERT_TRUE(coordinator_->cancel("t1").isOk());
    EXPECT_EQ(coordinator_->queueSize(), 1u);

    ASSERT_TRUE(coordinator_->runQueue().isOk());
    EXPECT_FALSE(relay_->hasTransfer("t1"));
    EXPECT_TRUE(relay_->hasTransfer("t2"));
}

TEST_F(CoordinatorTest, ScanRelayReceivesScanKeyCopies) {
    std::vector<std::pair<std::string, std::string>> statuses;
    coordinator_->setScanStatusCallback([&statuses](const std::string& id, const std::string& status) {
        statuses.emplace_back(id, status);
    });
    relay_->setScanStatus("infected");

    auto upload = job("t1");
    upload.scanRequired = true;
    coordinator_->enqueue(std::move(upload));
    ASSERT_TRUE(coordinator_->runQueue().isOk());

    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_EQ(statuses[0].first, "t1");
    EXPECT_EQ(statuses[0].second, "infected");

    auto scan = relay_->scan("scan-t1");
    ASSERT_EQ(scan.chunks.size(), 3u);
    std::string plaintext;
    for (const auto& [index, sealed] : scan.chunks) {
        auto chunk = KeyDerivation::decryptScanChunk(relay_->scanKey(), index, sealed);
        plaintext.append(chunk.begin(), chunk.end());
    }
    EXPECT_EQ(plaintext, PAYLOAD);
}

TEST_F(CoordinatorTest, ScanFailureDoesNotFailUpload) {
    std::string reported;
    coordinator_->setScanStatusCallback([&reported](const std::string&, const std::string& status) {
        reported = status;
    });
    relay_->setHook([](const std::string& operation, uint64_t) {
        if (operation == "scanInit") {
            throw TransportError::http(400, "scanInit");
        }
    });

    auto upload = job("t1");
    upload.scanRequired = true;
    coordinator_->enqueue(std::move(upload));
    ASSERT_TRUE(coordinator_->runQueue().isOk());

    EXPECT_EQ(reported, "failed");
    EXPECT_EQ(store_->load("t1")->status, TransferStatus::Completed);
}

TEST_F(CoordinatorTest, DownloadReassemblesPayloadAndSendsReceipt) {
    coordinator_->enqueue(job("t1"));
    ASSERT_TRUE(coordinator_->runQueue().isOk());

    auto result = coordinator_->downloadTransfer(download("t1", true));
    ASSERT_TRUE(result.isOk()) << result.error().toString();

    EXPECT_EQ(result.value().transferId, "t1");
    EXPECT_EQ(result.value().manifest.totalBytes, PAYLOAD.size());
    EXPECT_EQ(result.value().manifest.chunkSize, CHUNK);
    ASSERT_EQ(result.value().manifest.files.size(), 1u);
    EXPECT_EQ(result.value().manifest.files[0].originalFilename, "t1.txt");
    EXPECT_EQ(readFile(result.value().payloadPath), PAYLOAD);
    EXPECT_EQ(result.value().destination, result.value().payloadPath);

    EXPECT_TRUE(relay_->transfer("t1").receipted);
    // Upload and download share an id, the receipt clears it
    EXPECT_FALSE(store_->load("t1").has_value());
}

TEST_F(CoordinatorTest, DownloadUsesDestinationResolver) {
    class MoveResolver : public IDestinationResolver {
    public:
        explicit MoveResolver(fs::path target) : target_(std::move(target)) {}
        std::string resolve(const TransferManifest& manifest, const std::string& payloadPath) override {
            fs::create_directories(target_);
            auto destination = target_ / manifest.files.at(0).originalFilename.value();
            fs::copy_file(payloadPath, destination, fs::copy_options::overwrite_existing);
            return destination.string();
        }
    private:
        fs::path target_;
    };

    coordinator_->enqueue(job("t1"));
    ASSERT_TRUE(coordinator_->runQueue().isOk());

    coordinator_->setDestinationResolver(std::make_shared<MoveResolver>(dir_ / "inbox"));
    auto result = coordinator_->downloadTransfer(download("t1"));
    ASSERT_TRUE(result.isOk()) << result.error().toString();
    EXPECT_EQ(result.value().destination, (dir_ / "inbox" / "t1.txt").string());
    EXPECT_EQ(readFile(result.value().destination), PAYLOAD);

    auto state = store_->load("t1");
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->direction, TransferDirection::Download);
    EXPECT_EQ(state->status, TransferStatus::Completed);
    EXPECT_EQ(state->destination, result.value().destination);
}

TEST_F(CoordinatorTest, DownloadResumesFromPersistedChunk) {
    coordinator_->enqueue(job("t1"));
    ASSERT_TRUE(coordinator_->runQueue().isOk());

    relay_->setHook([](const std::string& operation, uint64_t offset) {
        if (operation == "fetchRange" && offset == WIRE_CHUNK) {
            throw TransportError::http(503, "fetchRange");
        }
    });

    auto first = coordinator_->downloadTransfer(download("t1"));
    ASSERT_TRUE(first.isError());
    EXPECT_EQ(first.error().code, static_cast<int>(Core::ErrorCode::HTTP_TRANSIENT));

    auto paused = store_->load("t1");
    ASSERT_TRUE(paused.has_value());
    EXPECT_EQ(paused->direction, TransferDirection::Download);
    EXPECT_EQ(paused->status, TransferStatus::Paused);
    EXPECT_EQ(paused->nextChunkIndex, 1u);
    EXPECT_EQ(fs::file_size(paused->payloadPath), CHUNK);

    relay_->setHook(nullptr);
    auto second = coordinator_->downloadTransfer(download("t1"));
    ASSERT_TRUE(second.isOk()) << second.error().toString();
    EXPECT_EQ(readFile(second.value().payloadPath), PAYLOAD);
    EXPECT_EQ(relay_->fetchedOffsets(), std::vector<uint64_t>({0, WIRE_CHUNK, 2 * WIRE_CHUNK}));
}

TEST_F(CoordinatorTest, DownloadWithWrongKeysFails) {
    coordinator_->enqueue(job("t1"));
    ASSERT_TRUE(coordinator_->runQueue().isOk());

    auto request = download("t1");
    request.localKeyPair = Crypto::generateX25519KeyPair();
    auto result = coordinator_->downloadTransfer(request);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, static_cast<int>(Core::ErrorCode::AUTHENTICATION_FAILED));
    EXPECT_EQ(store_->load("t1")->status, TransferStatus::Failed);
}

TEST_F(CoordinatorTest, DownloadWithoutTransferIdIsRejected) {
    auto result = coordinator_->downloadTransfer(download(""));
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, static_cast<int>(Core::ErrorCode::MISSING_TRANSFER_ID));
}

TEST_F(CoordinatorTest, AsyncQueueAndDownload) {
    coordinator_->enqueue(job("t1"));
    auto queued = coordinator_->runQueueAsync();
    ASSERT_TRUE(queued.get().isOk());

    auto downloaded = coordinator_->downloadTransferAsync(download("t1"));
    auto result = downloaded.get();
    ASSERT_TRUE(result.isOk()) << result.error().toString();
    EXPECT_EQ(readFile(result.value().payloadPath), PAYLOAD);
}

TEST_F(CoordinatorTest, PeerUnavailableFallsBackToRelay) {
    auto peer = std::make_shared<InMemoryRelay>();
    peer->setHook([](const std::string&, uint64_t) {
        throw TransportError::unavailable("data channel never opened");
    });
    std::vector<std::string> contexts;
    coordinator_->setP2PTransportFactory([&](const Transport::P2PContext& context) -> Transport::TransportPtr {
        contexts.push_back(context.claimId);
        return std::make_shared<Transport::FallbackTransport>(peer, relay_);
    });

    auto upload = job("t1");
    upload.p2p = Transport::P2PContext{"s1", "claim-1", "sig", true, Transport::IceMode::Direct};
    coordinator_->enqueue(std::move(upload));
    ASSERT_TRUE(coordinator_->runQueue().isOk());

    EXPECT_EQ(contexts, std::vector<std::string>({"claim-1"}));
    EXPECT_EQ(relayPlaintext("t1"), PAYLOAD);
    EXPECT_EQ(peer->callCount("sendChunk"), 0);
    EXPECT_EQ(store_->load("t1")->claimId, "claim-1");
}

TEST_F(CoordinatorTest, StallForcesTransportFallback) {
    coordinator_ = makeCoordinator(store_, options(std::chrono::milliseconds(30)));
    std::atomic<bool> slowed{false};
    relay_->setHook([&slowed](const std::string& operation, uint64_t) {
        if (operation == "sendChunk" && !slowed.exchange(true)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });

    coordinator_->enqueue(job("t1"));
    ASSERT_TRUE(coordinator_->runQueue().isOk());
    EXPECT_EQ(relay_->forcedFallbacks(), 1);
    EXPECT_EQ(relayPlaintext("t1"), PAYLOAD);
}

TEST_F(CoordinatorTest, UnavailableSecureStoreReturnsError) {
    auto secure = std::make_shared<InMemorySecureStore>();
    secure->setAvailable(false);
    coordinator_ = makeCoordinator(std::make_shared<SecureTransferStateStore>(secure));

    coordinator_->enqueue(job("t1"));
    auto result = coordinator_->runQueue();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, static_cast<int>(Core::ErrorCode::SECURE_STORAGE_UNAVAILABLE));
    EXPECT_EQ(coordinator_->queueSize(), 1u);
    EXPECT_FALSE(coordinator_->isRunning());

    auto pending = coordinator_->pendingTransfers();
    EXPECT_TRUE(pending.isError());

    secure->setAvailable(true);
    ASSERT_TRUE(coordinator_->runQueue().isOk());
    EXPECT_EQ(relayPlaintext("t1"), PAYLOAD);
}

TEST_F(CoordinatorTest, RestartResumesPendingUploads) {
    relay_->setHook([](const std::string& operation, uint64_t offset) {
        if (operation == "sendChunk" && offset == WIRE_CHUNK) {
            throw TransportError(TransportError::Kind::Timeout, "slow");
        }
    });
    coordinator_->enqueue(job("t1"));
    ASSERT_TRUE(coordinator_->runQueue().isOk());
    coordinator_.reset();
    relay_->setHook(nullptr);

    // A new process over the same persisted state
    coordinator_ = makeCoordinator(store_);
    auto pending = coordinator_->pendingTransfers(TransferDirection::Upload);
    ASSERT_TRUE(pending.isOk());
    ASSERT_EQ(pending.value().size(), 1u);
    EXPECT_EQ(pending.value()[0].chunkSize, CHUNK);

    auto resumed = coordinator_->resumePendingUploads([this](const TransferState& state) -> std::optional<UploadJob> {
        auto rebuilt = job(state.transferId);
        rebuilt.chunkSize = 0;
        return rebuilt;
    });
    ASSERT_TRUE(resumed.isOk());
    EXPECT_EQ(resumed.value(), 1u);

    ASSERT_TRUE(coordinator_->runQueue().isOk());
    EXPECT_EQ(relay_->callCount("initTransfer"), 1);
    EXPECT_EQ(relay_->sentOffsets(), std::vector<uint64_t>({0, WIRE_CHUNK, 2 * WIRE_CHUNK}));
    EXPECT_EQ(relayPlaintext("t1"), PAYLOAD);
}

TEST_F(CoordinatorTest, ResendingDeliveredChunksKeepsStreamIntact) {
    coordinator_->enqueue(job("t1"));
    ASSERT_TRUE(coordinator_->runQueue().isOk());

    // Progress persisted one chunk behind what the relay already holds
    auto state = store_->load("t1");
    ASSERT_TRUE(state.has_value());
    state->status = TransferStatus::Paused;
    state->nextChunkIndex = 1;
    state->nextOffset = WIRE_CHUNK;
    store_->save(*state);

    coordinator_ = makeCoordinator(store_);
    auto resumed = coordinator_->resumePendingUploads([this](const TransferState& pending) -> std::optional<UploadJob> {
        return job(pending.transferId);
    });
    ASSERT_TRUE(resumed.isOk());
    EXPECT_EQ(resumed.value(), 1u);
    ASSERT_TRUE(coordinator_->runQueue().isOk());

    EXPECT_EQ(relay_->sentOffsets(),
              std::vector<uint64_t>({0, WIRE_CHUNK, 2 * WIRE_CHUNK, WIRE_CHUNK, 2 * WIRE_CHUNK}));
    EXPECT_EQ(relay_->callCount("initTransfer"), 1);
    EXPECT_EQ(relayPlaintext("t1"), PAYLOAD);
    EXPECT_EQ(store_->load("t1")->status, TransferStatus::Completed);
}

TEST_F(CoordinatorTest, NextChunkSizeHonoursFixedSize) {
    auto opts = options();
    opts.fixedChunkSize = 65536;
    auto fixed = makeCoordinator(store_, opts);
    EXPECT_EQ(fixed->nextChunkSize(), 65536u);
    EXPECT_EQ(coordinator_->nextChunkSize(), 128u * 1024u);
}
