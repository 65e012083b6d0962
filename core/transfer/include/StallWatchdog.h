#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace CipherLink {

/**
 * @brief Fires a callback once if progress() is not called within the timeout
 *
 * The coordinator arms one per job and uses the callback to force the
 * job's transport onto its fallback path before its retry attempts run out.
 */
class StallWatchdog {
public:
    using Callback = std::function<void()>;

    StallWatchdog(std::chrono::milliseconds timeout, Callback onStall);
    ~StallWatchdog();

    StallWatchdog(const StallWatchdog&) = delete;
    StallWatchdog& operator=(const StallWatchdog&) = delete;

    void start();
    void progress();
    void stop();

    bool fired() const { return fired_.load(); }

private:
    void run();

    std::chrono::milliseconds timeout_;
    Callback onStall_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::chrono::steady_clock::time_point deadline_;
    bool stopping_ = false;
    std::atomic<bool> fired_{false};
    std::thread thread_;
};

} // namespace CipherLink
