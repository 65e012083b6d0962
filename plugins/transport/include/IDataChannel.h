#pragma once

#include <string>
#include <functional>
#include <chrono>

namespace CipherLink {
namespace Transport {

/**
 * @brief Ordered, reliable message channel between the two peers
 *
 * Handlers may be invoked from the channel's own thread. Setting a
 * handler to nullptr detaches it; after the setter returns the old
 * handler is no longer running.
 */
class IDataChannel {
public:
    using MessageHandler = std::function<void(const std::string& message)>;
    using ClosedHandler = std::function<void()>;

    virtual ~IDataChannel() = default;

    /**
     * @brief Block until the channel is open, failed or the timeout passes
     * @return true when the channel is open
     */
    virtual bool waitOpen(std::chrono::milliseconds timeout) = 0;

    virtual bool isOpen() const = 0;

    /**
     * @throws TransportError when the message cannot be queued
     */
    virtual void send(const std::string& message) = 0;

    virtual void setMessageHandler(MessageHandler handler) = 0;
    virtual void setClosedHandler(ClosedHandler handler) = 0;

    virtual void close() = 0;
};

} // namespace Transport
} // namespace CipherLink
