/**
 * @file test_p2p_transport.cpp
 * @brief Chunk push/ack over a data channel and the one-way relay fallback
 */

#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <memory>
#include <thread>

#include "FallbackTransport.h"
#include "MockDataChannel.h"
#include "MockTransport.h"
#include "P2PTransport.h"
#include "TransportError.h"

using namespace CipherLink;
using namespace CipherLink::Transport;
using CipherLink::Testing::InMemoryRelay;
using CipherLink::Testing::LoopbackChannel;

namespace {

template<typename Predicate>
bool waitFor(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

std::vector<uint8_t> bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

bool isAck(const std::string& message) {
    return message.find("\"type\":\"ack\"") != std::string::npos;
}

} // namespace

class P2PTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto pair = LoopbackChannel::createPair();
        senderChannel_ = pair.first;
        receiverChannel_ = pair.second;
        relay_ = std::make_shared<InMemoryRelay>();

        options_.ackTimeout = std::chrono::milliseconds(2000);
        options_.openTimeout = std::chrono::milliseconds(50);
    }

    void TearDown() override {
        sender_.reset();
        receiver_.reset();
    }

    void connect() {
        P2PContext senderContext{"s1", "claim-1", "sig-token", true, IceMode::Direct};
        P2PContext receiverContext{"s1", "claim-1", "sig-token", false, IceMode::Direct};
        sender_ = std::make_shared<P2PTransport>(senderContext, senderChannel_, relay_, options_);
        receiver_ = std::make_shared<P2PTransport>(receiverContext, receiverChannel_, relay_, options_);
    }

    std::shared_ptr<LoopbackChannel> senderChannel_;
    std::shared_ptr<LoopbackChannel> receiverChannel_;
    std::shared_ptr<InMemoryRelay> relay_;
    P2POptions options_;
    std::shared_ptr<P2PTransport> sender_;
    std::shared_ptr<P2PTransport> receiver_;
};

TEST_F(P2PTransportTest, EnvelopeEncoding) {
    auto chunk = P2PEnvelope::decode(P2PEnvelope::chunk("t1", 64, {1, 2, 255}).encode());
    EXPECT_EQ(chunk.type, P2PEnvelope::Type::Chunk);
    EXPECT_EQ(chunk.transferId, "t1");
    EXPECT_EQ(chunk.offset, 64u);
    EXPECT_EQ(chunk.payload, std::vector<uint8_t>({1, 2, 255}));

    auto ack = P2PEnvelope::decode(R"({"type":"ack","transfer_id":"t1","offset":64})");
    EXPECT_EQ(ack.type, P2PEnvelope::Type::Ack);
    EXPECT_EQ(ack.offset, 64u);

    auto fallback = P2PEnvelope::decode(P2PEnvelope::fallback("stalled").encode());
    EXPECT_EQ(fallback.type, P2PEnvelope::Type::Fallback);
    EXPECT_EQ(fallback.reason, "stalled");

    EXPECT_THROW(P2PEnvelope::decode("not json"), ProtocolError);
    EXPECT_THROW(P2PEnvelope::decode(R"({"type":"hello"})"), ProtocolError);
    EXPECT_THROW(P2PEnvelope::decode(R"({"type":"ack","offset":1})"), ProtocolError);
    EXPECT_THROW(P2PEnvelope::decode(R"({"type":"chunk","transfer_id":"t","offset":-1})"), ProtocolError);
    EXPECT_THROW(P2PEnvelope::decode(R"({"type":{"x":1}})"), ProtocolError);
    EXPECT_THROW(P2PEnvelope::decode(R"({"type":"chunk","transfer_id":["t"],"offset":0})"), ProtocolError);
    EXPECT_THROW(P2PEnvelope::decode(R"({"type":"chunk","transfer_id":"t","offset":0,"payload":7})"),
                 ProtocolError);
    EXPECT_THROW(P2PEnvelope::decode(R"({"type":"fallback","reason":false})"), ProtocolError);
    EXPECT_THROW(P2PEnvelope::decode(R"({"type":"chunk","transfer_id":"t","offset":0,"payload":"$$"})"),
                 ProtocolError);
}

TEST_F(P2PTransportTest, PushedChunkIsAckedAndServedFromCache) {
    connect();
    sender_->sendChunk("s1", "t1", "tok", 0, bytes("first"));
    EXPECT_EQ(sender_->pendingCount(), 0u);
    EXPECT_EQ(receiver_->cachedChunkCount(), 1u);

    auto data = receiver_->fetchRange("s1", "t1", "tok", 0, 5);
    EXPECT_EQ(data, bytes("first"));
    EXPECT_EQ(receiver_->cachedChunkCount(), 0u);
    EXPECT_EQ(relay_->callCount("sendChunk"), 0);
    EXPECT_EQ(relay_->callCount("fetchRange"), 0);
}

TEST_F(P2PTransportTest, FetchWaitsForChunkFromPeer) {
    connect();
    auto fetched = std::async(std::launch::async, [this] {
        return receiver_->fetchRange("s1", "t1", "tok", 33, 6);
    });
    ASSERT_TRUE(waitFor([this] { return receiver_->pendingCount() == 1; }));

    sender_->sendChunk("s1", "t1", "tok", 33, bytes("second"));
    EXPECT_EQ(fetched.get(), bytes("second"));
    EXPECT_EQ(receiver_->pendingCount(), 0u);
}

TEST_F(P2PTransportTest, ControlCallsGoToRelay) {
    connect();
    EXPECT_EQ(sender_->initTransfer("s1", "tok", {1}, 1, std::string("t1")), "t1");
    sender_->finalizeTransfer("s1", "t1", "tok");
    EXPECT_TRUE(relay_->transfer("t1").finalized);
    EXPECT_EQ(receiver_->fetchManifest("s1", "t1", "tok"), std::vector<uint8_t>({1}));
}

TEST_F(P2PTransportTest, MissingAckTimesOut) {
    options_.ackTimeout = std::chrono::milliseconds(100);
    receiverChannel_->setDropFilter(isAck);
    connect();

    try {
        sender_->sendChunk("s1", "t1", "tok", 0, bytes("lost"));
        FAIL() << "expected timeout";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.kind(), TransportError::Kind::Timeout);
        EXPECT_TRUE(e.isTransient());
    }
    EXPECT_EQ(sender_->pendingCount(), 0u);
    EXPECT_FALSE(sender_->hasFallenBack());
}

TEST_F(P2PTransportTest, ForcedFallbackFailsPendingWaitsAndNotifiesPeer) {
    options_.ackTimeout = std::chrono::milliseconds(10000);
    receiverChannel_->setDropFilter(isAck);
    connect();

    auto blocked = std::async(std::launch::async, [this] {
        sender_->sendChunk("s1", "t1", "tok", 0, bytes("stuck"));
    });
    ASSERT_TRUE(waitFor([this] { return sender_->pendingCount() == 1; }));

    EXPECT_TRUE(sender_->forceFallback("stalled"));
    ASSERT_EQ(blocked.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    try {
        blocked.get();
        FAIL() << "expected unavailable";
    } catch (const TransportError& e) {
        EXPECT_TRUE(e.isUnavailable());
    }
    EXPECT_EQ(sender_->pendingCount(), 0u);
    EXPECT_FALSE(sender_->forceFallback("again"));

    auto sent = senderChannel_->sentMessages();
    ASSERT_EQ(sent.size(), 2u);
    auto notice = P2PEnvelope::decode(sent.back());
    EXPECT_EQ(notice.type, P2PEnvelope::Type::Fallback);
    EXPECT_EQ(notice.reason, "stalled");

    EXPECT_TRUE(waitFor([this] { return receiver_->hasFallenBack(); }));
    EXPECT_THROW(sender_->sendChunk("s1", "t1", "tok", 1, bytes("x")), TransportError);
}

TEST_F(P2PTransportTest, ChannelCloseFallsBackBothPeers) {
    connect();
    senderChannel_->close();
    EXPECT_TRUE(waitFor([this] { return sender_->hasFallenBack() && receiver_->hasFallenBack(); }));

    try {
        sender_->sendChunk("s1", "t1", "tok", 0, bytes("late"));
        FAIL() << "expected unavailable";
    } catch (const TransportError& e) {
        EXPECT_TRUE(e.isUnavailable());
    }
}

TEST_F(P2PTransportTest, ChannelThatNeverOpensIsUnavailable) {
    senderChannel_->setOpen(false);
    connect();
    try {
        sender_->sendChunk("s1", "t1", "tok", 0, bytes("x"));
        FAIL() << "expected unavailable";
    } catch (const TransportError& e) {
        EXPECT_TRUE(e.isUnavailable());
    }
    EXPECT_TRUE(sender_->hasFallenBack());
}

TEST_F(P2PTransportTest, SendFailureFallsBack) {
    connect();
    senderChannel_->setFailSends(true);
    EXPECT_THROW(sender_->sendChunk("s1", "t1", "tok", 0, bytes("x")), TransportError);
    EXPECT_TRUE(sender_->hasFallenBack());
    EXPECT_EQ(sender_->pendingCount(), 0u);
}

TEST_F(P2PTransportTest, CacheIsBoundedAndUnstoredChunksAreNotAcked) {
    options_.maxCachedChunks = 2;
    options_.ackTimeout = std::chrono::milliseconds(150);
    connect();

    sender_->sendChunk("s1", "t1", "tok", 0, bytes("a"));
    sender_->sendChunk("s1", "t1", "tok", 1, bytes("b"));
    EXPECT_THROW(sender_->sendChunk("s1", "t1", "tok", 2, bytes("c")), TransportError);
    EXPECT_EQ(receiver_->cachedChunkCount(), 2u);

    // Re-pushing a cached offset replaces it instead of growing the cache
    sender_->sendChunk("s1", "t1", "tok", 1, bytes("B"));
    EXPECT_EQ(receiver_->fetchRange("s1", "t1", "tok", 1, 1), bytes("B"));
}

TEST_F(P2PTransportTest, OutboxIsBounded) {
    options_.maxPending = 1;
    options_.ackTimeout = std::chrono::milliseconds(10000);
    receiverChannel_->setDropFilter(isAck);
    connect();

    auto blocked = std::async(std::launch::async, [this] {
        sender_->sendChunk("s1", "t1", "tok", 0, bytes("a"));
    });
    ASSERT_TRUE(waitFor([this] { return sender_->pendingCount() == 1; }));

    try {
        sender_->sendChunk("s1", "t1", "tok", 1, bytes("b"));
        FAIL() << "expected outbox full";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.kind(), TransportError::Kind::Timeout);
    }

    sender_->forceFallback("test done");
    EXPECT_THROW(blocked.get(), TransportError);
}

TEST_F(P2PTransportTest, MalformedMessagesAreIgnored) {
    connect();
    receiverChannel_->deliver("garbage");
    receiverChannel_->deliver(R"({"type":"mystery"})");
    receiverChannel_->deliver(R"({"type":"chunk","transfer_id":["t"],"offset":0})");
    receiverChannel_->deliver(R"({"type":{"x":1}})");
    sender_->sendChunk("s1", "t1", "tok", 0, bytes("ok"));
    EXPECT_FALSE(receiver_->hasFallenBack());
    EXPECT_EQ(receiver_->fetchRange("s1", "t1", "tok", 0, 2), bytes("ok"));
}

TEST_F(P2PTransportTest, CachedChunksOutliveFallback) {
    connect();
    FallbackTransport receiving(receiver_, relay_);

    relay_->initTransfer("s1", "tok", {}, 4, std::string("t1"));
    relay_->sendChunk("s1", "t1", "tok", 0, bytes("RELAY"));

    sender_->sendChunk("s1", "t1", "tok", 0, bytes("PEER!"));
    ASSERT_EQ(receiver_->cachedChunkCount(), 1u);

    EXPECT_TRUE(receiving.forceFallback("switching"));
    EXPECT_TRUE(receiving.usingFallback());

    // The chunk the peer already delivered is served once, then the relay takes over
    EXPECT_EQ(receiving.fetchRange("s1", "t1", "tok", 0, 5), bytes("PEER!"));
    EXPECT_EQ(receiving.fetchRange("s1", "t1", "tok", 0, 5), bytes("RELAY"));
}

TEST_F(P2PTransportTest, FactoryWrapsInFallback) {
    auto transport = makeP2PTransport(P2PContext{"s1", "c", "t", true, IceMode::Relay},
                                      senderChannel_, relay_, options_);
    EXPECT_EQ(transport->name(), "p2p");
    EXPECT_TRUE(transport->forceFallback("relay only"));
    EXPECT_EQ(transport->name(), "memory");
}
