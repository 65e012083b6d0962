#include "RtcDataChannel.h"
#include "TransportError.h"
#include "Logger.h"
#include "LoggerMacros.h"

namespace CipherLink {
namespace Transport {

bool RtcDataChannel::isAvailable() {
#ifdef CIPHERLINK_HAVE_WEBRTC
    return true;
#else
    return false;
#endif
}

RtcDataChannel::RtcDataChannel(std::shared_ptr<P2PSignalingClient> signaling, const P2POptions& options)
    : signaling_(std::move(signaling))
    , options_(options)
{
}

RtcDataChannel::~RtcDataChannel() {
    close();
}

std::shared_ptr<RtcDataChannel> RtcDataChannel::connect(std::shared_ptr<P2PSignalingClient> signaling,
                                                        const P2POptions& options) {
#ifdef CIPHERLINK_HAVE_WEBRTC
    static std::once_flag loggerInit;
    std::call_once(loggerInit, [] { rtc::InitLogger(rtc::LogLevel::Warning); });

    IceConfig ice = signaling->fetchIceConfig();
    const P2PContext& context = signaling->context();

    rtc::Configuration config;
    for (const auto& url : ice.stunUrls) {
        config.iceServers.emplace_back(url);
    }
    for (const auto& url : ice.turnUrls) {
        rtc::IceServer server(url);
        server.username = ice.username;
        server.password = ice.credential;
        config.iceServers.push_back(server);
    }
    if (context.iceMode == IceMode::Relay) {
        config.iceTransportPolicy = rtc::TransportPolicy::Relay;
    }

    std::shared_ptr<RtcDataChannel> channel(new RtcDataChannel(signaling, options));
    std::weak_ptr<RtcDataChannel> weak = channel;

    try {
        channel->peerConnection_ = std::make_shared<rtc::PeerConnection>(config);
    } catch (const std::exception& e) {
        throw TransportError::unavailable(std::string("Failed to create peer connection: ") + e.what());
    }
    auto& pc = channel->peerConnection_;

    pc->onStateChange([weak](rtc::PeerConnection::State state) {
        auto self = weak.lock();
        if (!self) return;
        if (state == rtc::PeerConnection::State::Failed) {
            self->markFailed("peer connection failed");
        } else if (state == rtc::PeerConnection::State::Closed) {
            self->markFailed("peer connection closed");
        }
    });

    pc->onLocalDescription([weak](rtc::Description description) {
        auto self = weak.lock();
        if (!self) return;
        try {
            if (description.type() == rtc::Description::Type::Offer) {
                self->signaling_->postOffer(std::string(description));
            } else {
                self->signaling_->postAnswer(std::string(description));
            }
        } catch (const CipherLinkError& e) {
            self->markFailed(std::string("could not post local description: ") + e.what());
        }
    });

    pc->onLocalCandidate([weak](rtc::Candidate candidate) {
        auto self = weak.lock();
        if (!self) return;
        try {
            self->signaling_->postIce(std::string(candidate));
        } catch (const CipherLinkError& e) {
            LOG_WARN_COMP(std::string("Could not post local candidate: ") + e.what(), "RtcDataChannel");
        }
    });

    pc->onDataChannel([weak](std::shared_ptr<rtc::DataChannel> dc) {
        if (auto self = weak.lock()) {
            self->setupDataChannel(std::move(dc));
        }
    });

    RtcDataChannel* raw = channel.get();
    channel->negotiator_ = std::make_unique<PeerNegotiator>(signaling, *channel, options,
        [raw](const std::string& reason) { raw->markFailed("negotiation failed: " + reason); });

    if (context.isInitiator) {
        // Creating the channel triggers the local offer
        channel->setupDataChannel(pc->createDataChannel(LABEL));
    }
    channel->negotiator_->start();

    Logger::instance().log(LogLevel::INFO,
        "WebRTC negotiation started for claim " + context.claimId + " (ice=" + toString(context.iceMode) + ")",
        "RtcDataChannel");
    return channel;
#else
    (void)signaling;
    (void)options;
    throw TransportError::unavailable("WebRTC support is not built in");
#endif
}

#ifdef CIPHERLINK_HAVE_WEBRTC
void RtcDataChannel::setupDataChannel(std::shared_ptr<rtc::DataChannel> channel) {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        dataChannel_ = channel;
    }

    RtcDataChannel* raw = this;
    channel->onOpen([raw]() {
        Logger::instance().log(LogLevel::INFO, "WebRTC data channel open", "RtcDataChannel");
        raw->markOpen();
    });

    channel->onClosed([raw]() {
        raw->markFailed("data channel closed");
    });

    channel->onMessage([raw](rtc::message_variant data) {
        if (std::holds_alternative<std::string>(data)) {
            raw->deliver(std::get<std::string>(data));
        } else if (std::holds_alternative<rtc::binary>(data)) {
            const auto& binary = std::get<rtc::binary>(data);
            std::string text;
            text.reserve(binary.size());
            for (auto b : binary) {
                text.push_back(static_cast<char>(b));
            }
            raw->deliver(text);
        }
    });
}
#endif

void RtcDataChannel::markOpen() {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (failed_) return;
        open_ = true;
    }
    stateCv_.notify_all();
}

void RtcDataChannel::markFailed(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (failed_) return;
        failed_ = true;
        open_ = false;
    }
    stateCv_.notify_all();
    LOG_WARN_COMP("WebRTC channel unusable: " + reason, "RtcDataChannel");

    std::lock_guard<std::mutex> lock(handlerMutex_);
    if (closedHandler_) {
        closedHandler_();
    }
}

void RtcDataChannel::deliver(const std::string& message) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    if (messageHandler_) {
        messageHandler_(message);
    }
}

bool RtcDataChannel::waitOpen(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(stateMutex_);
    stateCv_.wait_for(lock, timeout, [this] { return open_ || failed_; });
    return open_;
}

bool RtcDataChannel::isOpen() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return open_;
}

void RtcDataChannel::send(const std::string& message) {
#ifdef CIPHERLINK_HAVE_WEBRTC
    std::shared_ptr<rtc::DataChannel> channel;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!open_ || !dataChannel_) {
            throw TransportError(TransportError::Kind::Connection, "WebRTC data channel is not open");
        }
        channel = dataChannel_;
    }
    try {
        if (!channel->send(message)) {
            LOG_DEBUG_COMP_IF("Data channel buffered message", "RtcDataChannel");
        }
    } catch (const std::exception& e) {
        throw TransportError(TransportError::Kind::Connection, std::string("WebRTC send failed: ") + e.what());
    }
#else
    (void)message;
    throw TransportError::unavailable("WebRTC support is not built in");
#endif
}

void RtcDataChannel::setMessageHandler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    messageHandler_ = std::move(handler);
}

void RtcDataChannel::setClosedHandler(ClosedHandler handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    closedHandler_ = std::move(handler);
}

void RtcDataChannel::close() {
    if (negotiator_) {
        negotiator_->stop();
    }
#ifdef CIPHERLINK_HAVE_WEBRTC
    std::shared_ptr<rtc::DataChannel> channel;
    std::shared_ptr<rtc::PeerConnection> pc;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        channel = dataChannel_;
        pc = peerConnection_;
        open_ = false;
    }
    if (channel) {
        channel->resetCallbacks();
        channel->close();
    }
    if (pc) {
        pc->resetCallbacks();
        pc->close();
    }
#endif
}

void RtcDataChannel::setRemoteDescription(const std::string& sdp, SignalMessage::Type type) {
#ifdef CIPHERLINK_HAVE_WEBRTC
    auto rtcType = type == SignalMessage::Type::Offer ? rtc::Description::Type::Offer
                                                      : rtc::Description::Type::Answer;
    try {
        peerConnection_->setRemoteDescription(rtc::Description(sdp, rtcType));
    } catch (const std::exception& e) {
        throw TransportError(TransportError::Kind::Protocol, std::string("Invalid remote description: ") + e.what());
    }
#else
    (void)sdp;
    (void)type;
    throw TransportError::unavailable("WebRTC support is not built in");
#endif
}

void RtcDataChannel::addRemoteCandidate(const std::string& candidate) {
#ifdef CIPHERLINK_HAVE_WEBRTC
    try {
        peerConnection_->addRemoteCandidate(rtc::Candidate(candidate));
    } catch (const std::exception& e) {
        throw TransportError(TransportError::Kind::Protocol, std::string("Invalid remote candidate: ") + e.what());
    }
#else
    (void)candidate;
    throw TransportError::unavailable("WebRTC support is not built in");
#endif
}

TransportPtr connectP2PTransport(const std::string& baseUrl,
                                 std::shared_ptr<IHttpClient> httpClient,
                                 const P2PContext& context,
                                 TransportPtr relay,
                                 const P2POptions& options,
                                 FallbackTransport::FallbackCallback onFallback) {
    auto signaling = std::make_shared<P2PSignalingClient>(baseUrl, std::move(httpClient), context);
    try {
        auto channel = RtcDataChannel::connect(signaling, options);
        return makeP2PTransport(context, channel, relay, options, std::move(onFallback));
    } catch (const CipherLinkError& e) {
        Logger::instance().log(LogLevel::WARN,
            std::string("P2P unavailable, using relay: ") + e.what(), "RtcDataChannel");
        if (onFallback) {
            onFallback(e.what());
        }
        return relay;
    }
}

} // namespace Transport
} // namespace CipherLink
