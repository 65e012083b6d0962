#include "P2PTransport.h"
#include "TransportError.h"
#include "Logger.h"
#include "LoggerMacros.h"

namespace CipherLink {
namespace Transport {

P2PTransport::P2PTransport(P2PContext context,
                           std::shared_ptr<IDataChannel> channel,
                           TransportPtr relay,
                           P2POptions options)
    : context_(std::move(context))
    , channel_(std::move(channel))
    , relay_(std::move(relay))
    , options_(options)
{
    dispatcher_ = std::thread(&P2PTransport::dispatchLoop, this);

    channel_->setMessageHandler([this](const std::string& message) {
        post([this, message]() { handleMessage(message); });
    });
    channel_->setClosedHandler([this]() {
        post([this]() { fallBack("data channel closed", false); });
    });

    Logger::instance().log(LogLevel::INFO,
        "P2P session " + context_.sessionId + "/" + context_.claimId + " created ("
            + (context_.isInitiator ? "initiator" : "responder") + ", ice=" + toString(context_.iceMode) + ")",
        "P2PTransport");
}

P2PTransport::~P2PTransport() {
    channel_->setMessageHandler(nullptr);
    channel_->setClosedHandler(nullptr);

    {
        std::lock_guard<std::mutex> lock(inboxMutex_);
        stopping_ = true;
    }
    inboxCv_.notify_all();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    drainPendingLocked("P2P session destroyed");
}

void P2PTransport::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(inboxMutex_);
        if (stopping_) {
            return;
        }
        inbox_.push_back(std::move(task));
    }
    inboxCv_.notify_one();
}

void P2PTransport::dispatchLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(inboxMutex_);
            inboxCv_.wait(lock, [this] { return stopping_ || !inbox_.empty(); });
            if (stopping_) {
                return;
            }
            task = std::move(inbox_.front());
            inbox_.pop_front();
        }
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR_COMP(std::string("Data-channel dispatch failed: ") + e.what(), "P2PTransport");
            fallBack(std::string("dispatch failed: ") + e.what(), false);
        }
    }
}

void P2PTransport::handleMessage(const std::string& message) {
    P2PEnvelope envelope;
    try {
        envelope = P2PEnvelope::decode(message);
    } catch (const ProtocolError& e) {
        LOG_WARN_COMP(std::string("Dropping data-channel message: ") + e.what(), "P2PTransport");
        return;
    }

    switch (envelope.type) {
        case P2PEnvelope::Type::Chunk:
            handleChunk(std::move(envelope));
            break;
        case P2PEnvelope::Type::Ack:
            handleAck(envelope);
            break;
        case P2PEnvelope::Type::Fallback:
            fallBack(envelope.reason.empty() ? "peer requested fallback" : "peer: " + envelope.reason, false);
            break;
    }
}

void P2PTransport::handleChunk(P2PEnvelope envelope) {
    Key key{envelope.transferId, envelope.offset};
    bool stored = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fallenBack_) {
            LOG_DEBUG_COMP_IF("Ignoring chunk after fallback", "P2PTransport");
            return;
        }

        auto pending = pendingFetches_.find(key);
        if (pending != pendingFetches_.end()) {
            pending->second.set_value(std::move(envelope.payload));
            pendingFetches_.erase(pending);
            stored = true;
        } else {
            auto cached = earlyChunks_.find(key);
            if (cached != earlyChunks_.end()) {
                cached->second = std::move(envelope.payload);
                stored = true;
            } else if (earlyChunks_.size() < options_.maxCachedChunks) {
                earlyChunks_.emplace(key, std::move(envelope.payload));
                stored = true;
            }
        }
    }

    if (!stored) {
        LOG_WARN_COMP("Chunk cache full, dropping offset " + std::to_string(key.second) + " without ack",
                      "P2PTransport");
        return;
    }

    try {
        channel_->send(P2PEnvelope::ack(key.first, key.second).encode());
    } catch (const TransportError& e) {
        fallBack(std::string("ack send failed: ") + e.what(), false);
    }
}

void P2PTransport::handleAck(const P2PEnvelope& envelope) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pendingAcks_.find(Key{envelope.transferId, envelope.offset});
    if (it == pendingAcks_.end()) {
        LOG_DEBUG_COMP_IF("Late ack for offset " + std::to_string(envelope.offset), "P2PTransport");
        return;
    }
    it->second.set_value();
    pendingAcks_.erase(it);
}

bool P2PTransport::fallBack(const std::string& reason, bool notifyPeer) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fallenBack_) {
            return false;
        }
        fallenBack_ = true;
        fallbackReason_ = reason;
        drainPendingLocked(reason);
    }

    Logger::instance().log(LogLevel::WARN, "P2P session falling back: " + reason, "P2PTransport");

    if (notifyPeer && channel_->isOpen()) {
        try {
            channel_->send(P2PEnvelope::fallback(reason).encode());
        } catch (const TransportError& e) {
            LOG_WARN_COMP(std::string("Could not notify peer of fallback: ") + e.what(), "P2PTransport");
        }
    }
    return true;
}

void P2PTransport::drainPendingLocked(const std::string& reason) {
    auto failure = std::make_exception_ptr(TransportError::unavailable("P2P session fell back: " + reason));
    for (auto& [key, promise] : pendingAcks_) {
        promise.set_exception(failure);
    }
    for (auto& [key, promise] : pendingFetches_) {
        promise.set_exception(failure);
    }
    pendingAcks_.clear();
    pendingFetches_.clear();
}

void P2PTransport::throwFallenBackLocked() const {
    throw TransportError::unavailable("P2P session fell back: " + fallbackReason_);
}

void P2PTransport::ensureChannelOpen() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fallenBack_) {
            throwFallenBackLocked();
        }
    }
    if (!channel_->waitOpen(options_.openTimeout)) {
        fallBack("data channel did not open", false);
        throw TransportError::unavailable("P2P data channel did not open");
    }
}

bool P2PTransport::forceFallback(const std::string& reason) {
    return fallBack(reason, true);
}

void P2PTransport::sendChunk(const std::string&, const std::string& transferId,
                             const std::string&, uint64_t offset,
                             const std::vector<uint8_t>& data) {
    ensureChannelOpen();

    Key key{transferId, offset};
    std::future<void> ack;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fallenBack_) {
            throwFallenBackLocked();
        }
        if (pendingAcks_.size() >= options_.maxPending && pendingAcks_.count(key) == 0) {
            throw TransportError(TransportError::Kind::Timeout,
                "P2P outbox full (" + std::to_string(pendingAcks_.size()) + " unacknowledged chunks)");
        }
        auto& promise = pendingAcks_[key];
        promise = std::promise<void>();
        ack = promise.get_future();
    }

    try {
        channel_->send(P2PEnvelope::chunk(transferId, offset, data).encode());
    } catch (const TransportError& e) {
        fallBack(std::string("chunk send failed: ") + e.what(), false);
        throw TransportError::unavailable(std::string("P2P send failed: ") + e.what());
    }

    if (ack.wait_for(options_.ackTimeout) != std::future_status::ready) {
        std::lock_guard<std::mutex> lock(mutex_);
        pendingAcks_.erase(key);
        throw TransportError(TransportError::Kind::Timeout,
            "No ack for chunk at offset " + std::to_string(offset));
    }
    ack.get();
    LOG_DEBUG_COMP_IF("Chunk at offset " + std::to_string(offset) + " acked", "P2PTransport");
}

std::vector<uint8_t> P2PTransport::fetchRange(const std::string&, const std::string& transferId,
                                              const std::string&, uint64_t offset, uint64_t) {
    if (auto cached = takeCachedRange(transferId, offset)) {
        return std::move(*cached);
    }
    ensureChannelOpen();

    Key key{transferId, offset};
    std::future<std::vector<uint8_t>> chunk;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto cached = earlyChunks_.find(key);
        if (cached != earlyChunks_.end()) {
            auto data = std::move(cached->second);
            earlyChunks_.erase(cached);
            return data;
        }
        if (fallenBack_) {
            throwFallenBackLocked();
        }
        if (pendingFetches_.size() >= options_.maxPending && pendingFetches_.count(key) == 0) {
            throw TransportError(TransportError::Kind::Timeout, "Too many outstanding P2P fetches");
        }
        auto& promise = pendingFetches_[key];
        promise = std::promise<std::vector<uint8_t>>();
        chunk = promise.get_future();
    }

    if (chunk.wait_for(options_.ackTimeout) != std::future_status::ready) {
        std::lock_guard<std::mutex> lock(mutex_);
        pendingFetches_.erase(key);
        throw TransportError(TransportError::Kind::Timeout,
            "Peer did not deliver chunk at offset " + std::to_string(offset));
    }
    return chunk.get();
}

std::optional<std::vector<uint8_t>> P2PTransport::takeCachedRange(const std::string& transferId, uint64_t offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cached = earlyChunks_.find(Key{transferId, offset});
    if (cached == earlyChunks_.end()) {
        return std::nullopt;
    }
    auto data = std::move(cached->second);
    earlyChunks_.erase(cached);
    return data;
}

bool P2PTransport::hasFallenBack() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fallenBack_;
}

std::size_t P2PTransport::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pendingAcks_.size() + pendingFetches_.size();
}

std::size_t P2PTransport::cachedChunkCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return earlyChunks_.size();
}

std::string P2PTransport::initTransfer(
    const std::string& sessionId,
    const std::string& transferToken,
    const std::vector<uint8_t>& manifestCiphertext,
    uint64_t totalBytes,
    const std::optional<std::string>& transferId) {
    return relay_->initTransfer(sessionId, transferToken, manifestCiphertext, totalBytes, transferId);
}

void P2PTransport::finalizeTransfer(const std::string& sessionId, const std::string& transferId,
                                    const std::string& transferToken) {
    relay_->finalizeTransfer(sessionId, transferId, transferToken);
}

std::vector<uint8_t> P2PTransport::fetchManifest(const std::string& sessionId, const std::string& transferId,
                                                 const std::string& transferToken) {
    return relay_->fetchManifest(sessionId, transferId, transferToken);
}

void P2PTransport::sendReceipt(const std::string& sessionId, const std::string& transferId,
                               const std::string& transferToken) {
    relay_->sendReceipt(sessionId, transferId, transferToken);
}

ScanSession P2PTransport::scanInit(const std::string& sessionId, const std::string& transferId,
                                   const std::string& transferToken, uint64_t totalBytes,
                                   uint32_t chunkSize) {
    return relay_->scanInit(sessionId, transferId, transferToken, totalBytes, chunkSize);
}

void P2PTransport::scanChunk(const std::string& scanId, const std::string& transferToken,
                             uint64_t chunkIndex, const std::vector<uint8_t>& data) {
    relay_->scanChunk(scanId, transferToken, chunkIndex, data);
}

std::string P2PTransport::scanFinalize(const std::string& scanId, const std::string& transferToken) {
    return relay_->scanFinalize(scanId, transferToken);
}

TransportPtr makeP2PTransport(const P2PContext& context,
                              std::shared_ptr<IDataChannel> channel,
                              TransportPtr relay,
                              const P2POptions& options,
                              FallbackTransport::FallbackCallback onFallback) {
    auto primary = std::make_shared<P2PTransport>(context, std::move(channel), relay, options);
    return std::make_shared<FallbackTransport>(primary, relay, std::move(onFallback));
}

} // namespace Transport
} // namespace CipherLink
