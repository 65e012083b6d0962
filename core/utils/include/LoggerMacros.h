/**
 * @file LoggerMacros.h
 * @brief Conditional logging helpers
 *
 * The *_IF macros skip message construction when the level is disabled,
 * which matters on per-chunk paths:
 *   LOG_DEBUG_COMP_IF("chunk " + std::to_string(index) + " acked", "P2PTransport");
 */

#pragma once

#include "Logger.h"
#include <chrono>
#include <string>

namespace CipherLink {

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::CipherLink::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

#define LOG_INFO_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::CipherLink::Logger::instance(); \
        if (logger__.isInfoEnabled()) { \
            logger__.info(msg, component); \
        } \
    } while(0)

#define LOG_WARN_COMP(msg, component) ::CipherLink::Logger::instance().warn(msg, component)
#define LOG_ERROR_COMP(msg, component) ::CipherLink::Logger::instance().error(msg, component)

// Logs elapsed time at DEBUG level on destruction
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& name, const std::string& component = "Performance")
        : name_(name), component_(component), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto& logger = Logger::instance();
        if (logger.isDebugEnabled()) {
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_).count();
            logger.debug(name_ + " took " + std::to_string(duration) + "ms", component_);
        }
    }

private:
    std::string name_;
    std::string component_;
    std::chrono::steady_clock::time_point start_;
};

#define SCOPED_TIMER_COMP(name, component) ::CipherLink::ScopedTimer timer__(name, component)

} // namespace CipherLink
