#include "RetryPolicy.h"
#include "Config.h"
#include <algorithm>
#include <cmath>
#include <thread>

namespace CipherLink {

RetryPolicy RetryPolicy::fromConfig(const Config& config) {
    RetryPolicy policy;
    policy.baseDelay = std::chrono::milliseconds(config.getInt64("retry.base_delay_ms", 400));
    policy.maxDelay = std::chrono::milliseconds(config.getInt64("retry.max_delay_ms", 8000));
    policy.factor = config.getDouble("retry.factor", 2.0);
    policy.jitterMin = config.getDouble("retry.jitter_min", 0.6);
    policy.jitterMax = config.getDouble("retry.jitter_max", 1.4);
    policy.controlAttempts = std::max(1, config.getInt("retry.control_attempts", 4));
    policy.chunkAttempts = std::max(1, config.getInt("retry.chunk_attempts", 5));
    if (policy.jitterMax < policy.jitterMin) {
        std::swap(policy.jitterMin, policy.jitterMax);
    }
    return policy;
}

std::chrono::milliseconds RetryPolicy::delayFor(int attempt, double jitter) const {
    double exponent = std::max(0, attempt - 1);
    double raw = static_cast<double>(baseDelay.count()) * std::pow(factor, exponent);
    double capped = std::min(raw, static_cast<double>(maxDelay.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(capped * jitter)));
}

double RetryPolicy::randomJitter() const {
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_real_distribution<double> distribution(jitterMin, jitterMax);
    return distribution(engine);
}

void RetryPolicy::sleep(std::chrono::milliseconds delay) const {
    if (sleeper_) {
        sleeper_(delay);
        return;
    }
    std::this_thread::sleep_for(delay);
}

} // namespace CipherLink
