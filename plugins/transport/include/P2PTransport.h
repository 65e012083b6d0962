#pragma once

/**
 * @file P2PTransport.h
 * @brief Chunk transport over a WebRTC data channel
 *
 * One dispatcher thread per session owns every incoming message and
 * completes the waiting sendChunk()/fetchRange() call keyed by
 * (transferId, offset). Control calls (init, finalize, manifest,
 * receipt, scan) always go to the relay.
 */

#include "ITransport.h"
#include "IDataChannel.h"
#include "P2PTypes.h"
#include "FallbackTransport.h"
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <thread>

namespace CipherLink {
namespace Transport {

class P2PTransport : public ITransport {
public:
    P2PTransport(P2PContext context,
                 std::shared_ptr<IDataChannel> channel,
                 TransportPtr relay,
                 P2POptions options = P2POptions());
    ~P2PTransport() override;

    P2PTransport(const P2PTransport&) = delete;
    P2PTransport& operator=(const P2PTransport&) = delete;

    std::string initTransfer(
        const std::string& sessionId,
        const std::string& transferToken,
        const std::vector<uint8_t>& manifestCiphertext,
        uint64_t totalBytes,
        const std::optional<std::string>& transferId = std::nullopt) override;

    /**
     * @brief Push one chunk to the peer and wait for its ack
     * @throws TransportError Timeout when no ack arrives within ackTimeout,
     *         Unavailable once the session has fallen back
     */
    void sendChunk(const std::string& sessionId, const std::string& transferId,
                   const std::string& transferToken, uint64_t offset,
                   const std::vector<uint8_t>& data) override;

    void finalizeTransfer(const std::string& sessionId, const std::string& transferId,
                          const std::string& transferToken) override;

    std::vector<uint8_t> fetchManifest(const std::string& sessionId, const std::string& transferId,
                                       const std::string& transferToken) override;

    /**
     * @brief Return the chunk the peer pushed at offset, waiting for it if needed
     *
     * Chunks that arrived before the request are served from the cache.
     */
    std::vector<uint8_t> fetchRange(const std::string& sessionId, const std::string& transferId,
                                    const std::string& transferToken, uint64_t offset,
                                    uint64_t length) override;

    void sendReceipt(const std::string& sessionId, const std::string& transferId,
                     const std::string& transferToken) override;

    ScanSession scanInit(const std::string& sessionId, const std::string& transferId,
                         const std::string& transferToken, uint64_t totalBytes,
                         uint32_t chunkSize) override;

    void scanChunk(const std::string& scanId, const std::string& transferToken,
                   uint64_t chunkIndex, const std::vector<uint8_t>& data) override;

    std::string scanFinalize(const std::string& scanId, const std::string& transferToken) override;

    /**
     * @brief Tell the peer, fail every pending wait and stop using the channel
     */
    bool forceFallback(const std::string& reason) override;

    std::optional<std::vector<uint8_t>> takeCachedRange(const std::string& transferId, uint64_t offset) override;

    std::string name() const override { return "p2p"; }

    const P2PContext& context() const { return context_; }
    bool hasFallenBack() const;
    std::size_t pendingCount() const;
    std::size_t cachedChunkCount() const;

private:
    using Key = std::pair<std::string, uint64_t>;

    void post(std::function<void()> task);
    void dispatchLoop();
    void handleMessage(const std::string& message);
    void handleChunk(P2PEnvelope envelope);
    void handleAck(const P2PEnvelope& envelope);

    bool fallBack(const std::string& reason, bool notifyPeer);
    void drainPendingLocked(const std::string& reason);
    void ensureChannelOpen();
    [[noreturn]] void throwFallenBackLocked() const;

    P2PContext context_;
    std::shared_ptr<IDataChannel> channel_;
    TransportPtr relay_;
    P2POptions options_;

    mutable std::mutex mutex_;
    std::map<Key, std::promise<void>> pendingAcks_;
    std::map<Key, std::promise<std::vector<uint8_t>>> pendingFetches_;
    std::map<Key, std::vector<uint8_t>> earlyChunks_;
    bool fallenBack_ = false;
    std::string fallbackReason_;

    std::mutex inboxMutex_;
    std::condition_variable inboxCv_;
    std::deque<std::function<void()>> inbox_;
    bool stopping_ = false;
    std::thread dispatcher_;
};

/**
 * @brief FallbackTransport(P2PTransport(channel, relay), relay)
 */
TransportPtr makeP2PTransport(const P2PContext& context,
                              std::shared_ptr<IDataChannel> channel,
                              TransportPtr relay,
                              const P2POptions& options = P2POptions(),
                              FallbackTransport::FallbackCallback onFallback = nullptr);

} // namespace Transport
} // namespace CipherLink
