#pragma once

#include "TransportError.h"
#include "LoggerMacros.h"
#include <chrono>
#include <functional>
#include <random>
#include <string>

namespace CipherLink {

class Config;

/**
 * @brief Exponential backoff with multiplicative jitter
 *
 *   delay(n) = min(base * factor^(n-1), max) * jitter,  jitter in [jitterMin, jitterMax]
 *
 * Only transient TransportErrors are retried. Everything else propagates
 * on the first failure.
 */
class RetryPolicy {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using RetryObserver = std::function<void(int attempt, const Transport::TransportError& error)>;

    std::chrono::milliseconds baseDelay{400};
    std::chrono::milliseconds maxDelay{8000};
    double factor = 2.0;
    double jitterMin = 0.6;
    double jitterMax = 1.4;
    int controlAttempts = 4;
    int chunkAttempts = 5;

    static RetryPolicy fromConfig(const Config& config);

    /**
     * @param attempt 1-based number of the attempt that just failed
     */
    std::chrono::milliseconds delayFor(int attempt, double jitter) const;

    double randomJitter() const;

    // Tests replace the sleeper to run without real delays
    void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    template<typename Fn>
    auto run(int maxAttempts, const std::string& operation, Fn&& call,
             const RetryObserver& onRetry = nullptr) const -> decltype(call()) {
        for (int attempt = 1;; ++attempt) {
            try {
                return call();
            } catch (const Transport::TransportError& e) {
                if (!e.isTransient() || attempt >= maxAttempts) {
                    throw;
                }
                auto delay = delayFor(attempt, randomJitter());
                LOG_WARN_COMP(operation + " attempt " + std::to_string(attempt) + "/" +
                              std::to_string(maxAttempts) + " failed (" + e.what() + "), retrying in " +
                              std::to_string(delay.count()) + "ms", "RetryPolicy");
                if (onRetry) {
                    onRetry(attempt, e);
                }
                sleep(delay);
            }
        }
    }

private:
    void sleep(std::chrono::milliseconds delay) const;

    Sleeper sleeper_;
};

} // namespace CipherLink
