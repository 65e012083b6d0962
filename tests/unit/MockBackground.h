#pragma once

#include "BackgroundTransport.h"
#include "TransferBackground.h"
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace CipherLink {
namespace Testing {

class RecordingScheduler : public IResumeScheduler {
public:
    void scheduleResume(const TransferState& state) override {
        std::lock_guard<std::mutex> lock(mutex_);
        scheduled.push_back(state.transferId);
    }

    void cancelResume(const std::string& transferId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled.push_back(transferId);
    }

    std::vector<std::string> scheduled;
    std::vector<std::string> cancelled;

private:
    std::mutex mutex_;
};

class RecordingForeground : public IForegroundController {
public:
    void start(TransferDirection direction) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events.push_back(direction == TransferDirection::Download ? "start:download" : "start:upload");
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(mutex_);
        events.push_back("stop");
    }

    std::vector<std::string> events;

private:
    std::mutex mutex_;
};

class RecordingHooks : public ITransferBackgroundHooks {
public:
    void onStateUpdated(const TransferState& state) override {
        std::lock_guard<std::mutex> lock(mutex_);
        updates.push_back(state);
    }

    void onStateRemoved(const std::string& transferId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        removed.push_back(transferId);
    }

    std::vector<TransferState> updates;
    std::vector<std::string> removed;

private:
    std::mutex mutex_;
};

/**
 * @brief OS download service stand-in
 *
 * With a fetcher set, fetch() answers through it; otherwise it declines.
 */
class FakeBackgroundService : public Transport::IBackgroundTransferService {
public:
    using Fetcher = std::function<std::optional<std::vector<uint8_t>>(const Transport::HttpRequest&)>;

    explicit FakeBackgroundService(bool available = true) : available_(available) {}

    bool isAvailable() override {
        ++probes;
        return available_;
    }

    std::optional<std::vector<uint8_t>> fetch(const Transport::HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests.push_back(request);
        if (!fetcher) {
            return std::nullopt;
        }
        return fetcher(request);
    }

    Fetcher fetcher;
    std::vector<Transport::HttpRequest> requests;
    std::atomic<int> probes{0};

private:
    bool available_;
    std::mutex mutex_;
};

} // namespace Testing
} // namespace CipherLink
