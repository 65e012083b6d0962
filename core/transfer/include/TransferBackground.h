#pragma once

#include "TransferState.h"
#include "TransferManifest.h"
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace CipherLink {

/**
 * @brief Notified after every persisted state change
 */
class ITransferBackgroundHooks {
public:
    virtual ~ITransferBackgroundHooks() = default;
    virtual void onStateUpdated(const TransferState& state) = 0;

    // The transfer was cancelled and its persisted state deleted
    virtual void onStateRemoved(const std::string& transferId) = 0;
};

/**
 * @brief Platform job scheduler that re-launches resumable transfers
 */
class IResumeScheduler {
public:
    virtual ~IResumeScheduler() = default;
    virtual void scheduleResume(const TransferState& state) = 0;
    virtual void cancelResume(const std::string& transferId) = 0;
};

/**
 * @brief Keeps the process in the foreground while transfers run
 */
class IForegroundController {
public:
    virtual ~IForegroundController() = default;
    virtual void start(TransferDirection direction) = 0;
    virtual void stop() = 0;
};

/**
 * @brief Picks where a completed download ends up
 */
class IDestinationResolver {
public:
    virtual ~IDestinationResolver() = default;
    virtual std::string resolve(const TransferManifest& manifest, const std::string& payloadPath) = 0;
};

/**
 * @brief Background hooks backed by a resume scheduler and a foreground controller
 *
 * Non-terminal states get a scheduled resume, terminal ones have it
 * cancelled. The foreground controller runs in receive mode while any
 * download is active, in send mode while only uploads are, and stops
 * when nothing is active. It is only called when that mode changes.
 */
class TransferBackgroundManager : public ITransferBackgroundHooks {
public:
    TransferBackgroundManager(std::shared_ptr<IResumeScheduler> scheduler,
                              std::shared_ptr<IForegroundController> foreground);

    void onStateUpdated(const TransferState& state) override;
    void onStateRemoved(const std::string& transferId) override;

    std::size_t activeCount() const;

private:
    void updateForeground(const std::string& transferId, std::optional<TransferDirection> activeDirection);

    std::shared_ptr<IResumeScheduler> scheduler_;
    std::shared_ptr<IForegroundController> foreground_;

    mutable std::mutex mutex_;
    std::set<std::string> activeUploads_;
    std::set<std::string> activeDownloads_;
    std::optional<TransferDirection> foregroundMode_;
};

} // namespace CipherLink
