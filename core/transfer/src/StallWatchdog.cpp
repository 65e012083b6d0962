#include "StallWatchdog.h"
#include "Logger.h"

namespace CipherLink {

StallWatchdog::StallWatchdog(std::chrono::milliseconds timeout, Callback onStall)
    : timeout_(timeout)
    , onStall_(std::move(onStall))
{
}

StallWatchdog::~StallWatchdog() {
    stop();
}

void StallWatchdog::start() {
    if (thread_.joinable() || timeout_.count() <= 0) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
        deadline_ = std::chrono::steady_clock::now() + timeout_;
    }
    thread_ = std::thread(&StallWatchdog::run, this);
}

void StallWatchdog::progress() {
    std::lock_guard<std::mutex> lock(mutex_);
    deadline_ = std::chrono::steady_clock::now() + timeout_;
}

void StallWatchdog::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void StallWatchdog::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        auto deadline = deadline_;
        if (cv_.wait_until(lock, deadline, [this, deadline] { return stopping_ || deadline_ != deadline; })) {
            continue;
        }
        lock.unlock();
        fired_ = true;
        Logger::instance().log(LogLevel::WARN,
            "No progress for " + std::to_string(timeout_.count()) + "ms, triggering fallback", "StallWatchdog");
        if (onStall_) {
            onStall_();
        }
        return;
    }
}

} // namespace CipherLink
