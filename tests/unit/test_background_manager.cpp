/**
 * @file test_background_manager.cpp
 * @brief Resume scheduling and foreground mode tracking
 */

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include "TransferBackground.h"

using namespace CipherLink;

namespace {

class RecordingScheduler : public IResumeScheduler {
public:
    void scheduleResume(const TransferState& state) override {
        events.push_back("schedule:" + state.transferId);
    }
    void cancelResume(const std::string& transferId) override {
        events.push_back("cancel:" + transferId);
    }
    std::vector<std::string> events;
};

class RecordingForeground : public IForegroundController {
public:
    void start(TransferDirection direction) override {
        events.push_back("start:" + toString(direction));
    }
    void stop() override {
        events.push_back("stop");
    }
    std::vector<std::string> events;
};

TransferState makeState(const std::string& id, TransferDirection direction, TransferStatus status) {
    TransferState state;
    state.transferId = id;
    state.sessionId = "s1";
    state.direction = direction;
    state.status = status;
    return state;
}

} // namespace

class BackgroundManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        scheduler_ = std::make_shared<RecordingScheduler>();
        foreground_ = std::make_shared<RecordingForeground>();
        manager_ = std::make_unique<TransferBackgroundManager>(scheduler_, foreground_);
    }

    std::shared_ptr<RecordingScheduler> scheduler_;
    std::shared_ptr<RecordingForeground> foreground_;
    std::unique_ptr<TransferBackgroundManager> manager_;
};

TEST_F(BackgroundManagerTest, NonTerminalStatesAreScheduledTerminalOnesCancelled) {
    manager_->onStateUpdated(makeState("t1", TransferDirection::Upload, TransferStatus::Queued));
    manager_->onStateUpdated(makeState("t1", TransferDirection::Upload, TransferStatus::Paused));
    manager_->onStateUpdated(makeState("t1", TransferDirection::Upload, TransferStatus::Completed));
    manager_->onStateUpdated(makeState("t2", TransferDirection::Download, TransferStatus::Failed));
    manager_->onStateRemoved("t3");

    EXPECT_EQ(scheduler_->events, std::vector<std::string>({
        "schedule:t1", "schedule:t1", "cancel:t1", "cancel:t2", "cancel:t3"}));
}

TEST_F(BackgroundManagerTest, DownloadsTakePrecedenceForForegroundMode) {
    manager_->onStateUpdated(makeState("u1", TransferDirection::Upload, TransferStatus::Uploading));
    manager_->onStateUpdated(makeState("u1", TransferDirection::Upload, TransferStatus::Uploading));
    manager_->onStateUpdated(makeState("d1", TransferDirection::Download, TransferStatus::Downloading));
    EXPECT_EQ(manager_->activeCount(), 2u);

    manager_->onStateUpdated(makeState("d1", TransferDirection::Download, TransferStatus::Completed));
    manager_->onStateUpdated(makeState("u1", TransferDirection::Upload, TransferStatus::Paused));
    EXPECT_EQ(manager_->activeCount(), 0u);

    EXPECT_EQ(foreground_->events, std::vector<std::string>({
        "start:" + toString(TransferDirection::Upload),
        "start:" + toString(TransferDirection::Download),
        "start:" + toString(TransferDirection::Upload),
        "stop"}));
}

TEST_F(BackgroundManagerTest, RemovalStopsForeground) {
    manager_->onStateUpdated(makeState("d1", TransferDirection::Download, TransferStatus::Downloading));
    manager_->onStateRemoved("d1");
    manager_->onStateRemoved("d1");
    EXPECT_EQ(foreground_->events, std::vector<std::string>({
        "start:" + toString(TransferDirection::Download), "stop"}));
}

TEST_F(BackgroundManagerTest, WorksWithoutCollaborators) {
    TransferBackgroundManager bare(nullptr, nullptr);
    bare.onStateUpdated(makeState("t1", TransferDirection::Upload, TransferStatus::Uploading));
    EXPECT_EQ(bare.activeCount(), 1u);
    bare.onStateRemoved("t1");
    EXPECT_EQ(bare.activeCount(), 0u);
}
