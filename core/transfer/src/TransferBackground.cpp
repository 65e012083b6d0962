#include "TransferBackground.h"
#include "LoggerMacros.h"

namespace CipherLink {

TransferBackgroundManager::TransferBackgroundManager(std::shared_ptr<IResumeScheduler> scheduler,
                                                     std::shared_ptr<IForegroundController> foreground)
    : scheduler_(std::move(scheduler))
    , foreground_(std::move(foreground))
{
}

void TransferBackgroundManager::onStateUpdated(const TransferState& state) {
    if (scheduler_) {
        if (state.needsResume()) {
            scheduler_->scheduleResume(state);
        } else {
            scheduler_->cancelResume(state.transferId);
        }
    }

    std::optional<TransferDirection> active;
    if (state.isActive()) {
        active = state.direction;
    }
    updateForeground(state.transferId, active);
}

void TransferBackgroundManager::onStateRemoved(const std::string& transferId) {
    if (scheduler_) {
        scheduler_->cancelResume(transferId);
    }
    updateForeground(transferId, std::nullopt);
}

void TransferBackgroundManager::updateForeground(const std::string& transferId,
                                                 std::optional<TransferDirection> activeDirection) {
    std::optional<TransferDirection> mode;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        activeUploads_.erase(transferId);
        activeDownloads_.erase(transferId);
        if (activeDirection == TransferDirection::Download) {
            activeDownloads_.insert(transferId);
        } else if (activeDirection == TransferDirection::Upload) {
            activeUploads_.insert(transferId);
        }

        if (!activeDownloads_.empty()) {
            mode = TransferDirection::Download;
        } else if (!activeUploads_.empty()) {
            mode = TransferDirection::Upload;
        }
        changed = mode != foregroundMode_;
        foregroundMode_ = mode;
    }

    if (!changed || !foreground_) {
        return;
    }
    if (mode) {
        LOG_DEBUG_COMP_IF("Foreground mode: " + toString(*mode), "Background");
        foreground_->start(*mode);
    } else {
        LOG_DEBUG_COMP_IF("Foreground stopped", "Background");
        foreground_->stop();
    }
}

std::size_t TransferBackgroundManager::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activeUploads_.size() + activeDownloads_.size();
}

} // namespace CipherLink
