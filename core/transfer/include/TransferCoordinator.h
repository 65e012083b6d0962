#pragma once

#include "ChunkSizer.h"
#include "Errors.h"
#include "ITransferStateStore.h"
#include "ITransport.h"
#include "Result.h"
#include "RetryPolicy.h"
#include "ThreadPool.h"
#include "TransferBackground.h"
#include "TransferTypes.h"
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace CipherLink {

class Config;
class PayloadSource;
class StallWatchdog;
class TransferCipher;

struct CoordinatorOptions {
    // 0 picks the size of each new job from recent throughput
    uint32_t fixedChunkSize = 0;
    std::chrono::milliseconds stallTimeout{15000};
    std::string downloadDir = ".";
    RetryPolicy retry;
    // Notified after every persisted change and every state removal
    std::shared_ptr<ITransferBackgroundHooks> backgroundHooks;

    static CoordinatorOptions fromConfig(const Config& config);
};

/**
 * @brief Drives encrypted uploads and downloads over an ITransport
 *
 * Uploads drain strictly FIFO, one job at a time, chunks strictly in order.
 * Every chunk is persisted through the state store before the loop moves
 * on, so a restart resumes from the last transported chunk.
 *
 * Job outcomes:
 * - transient transport failure after retries: paused, the queue stops
 * - permanent HTTP status, AEAD failure, protocol error: failed, the queue continues
 * - secure store or state store unavailable: the call returns an Error and
 *   the job stays queued
 *
 * Downloads run independently of the queue and may overlap with it.
 */
class TransferCoordinator {
public:
    using StateCallback = std::function<void(const TransferState&)>;
    using ScanStatusCallback = std::function<void(const std::string& transferId, const std::string& status)>;
    using P2PTransportFactory = std::function<Transport::TransportPtr(const Transport::P2PContext&)>;
    using UploadJobBuilder = std::function<std::optional<UploadJob>(const TransferState&)>;

    TransferCoordinator(Transport::TransportPtr transport,
                        std::shared_ptr<ITransferStateStore> store,
                        CoordinatorOptions options = {});
    ~TransferCoordinator();

    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    void setStateCallback(StateCallback callback);
    void setScanStatusCallback(ScanStatusCallback callback);
    void setDestinationResolver(std::shared_ptr<IDestinationResolver> resolver);

    /**
     * @brief Builds the transport for jobs that carry a P2P context
     *
     * Without a factory those jobs use the default transport.
     */
    void setP2PTransportFactory(P2PTransportFactory factory);

    /**
     * @brief Append a job to the upload queue
     * @return Transfer id the job registers under and can be cancelled by
     */
    std::string enqueue(UploadJob job);

    /**
     * @brief Drain the queue on the calling thread
     *
     * Returns Ok when the queue is empty, paused or stopped by a transient
     * failure. Returns an Error only for resource failures. A concurrent
     * call while the queue is draining returns Ok immediately.
     */
    VoidResult runQueue();
    std::future<VoidResult> runQueueAsync();

    /**
     * @brief Stop at the next chunk boundary. The in-flight call completes first.
     */
    void pause();

    /**
     * @brief Clear the pause flag and drain the queue again
     */
    VoidResult resume();

    /**
     * @brief Drop a queued or running transfer and delete its persisted state
     *
     * A running job stops at its next chunk boundary.
     */
    VoidResult cancel(const std::string& transferId);

    Result<DownloadResult> downloadTransfer(const DownloadRequest& request);
    std::future<Result<DownloadResult>> downloadTransferAsync(DownloadRequest request);

    /**
     * @brief Re-enqueue persisted, unfinished uploads
     * @param builder Rebuilds the job (keys, payload) from its persisted state;
     *        returning nullopt skips the transfer
     * @return Number of jobs enqueued
     */
    Result<std::size_t> resumePendingUploads(const UploadJobBuilder& builder);

    Result<std::vector<TransferState>> pendingTransfers(
        std::optional<TransferDirection> direction = std::nullopt);

    uint32_t nextChunkSize() const;

    bool isPaused() const { return paused_.load(); }
    bool isRunning() const;
    std::size_t queueSize() const;

private:
    enum class JobOutcome {
        Completed,
        Paused,
        Failed,
        Cancelled
    };

    struct QueuedJob {
        std::string key;
        UploadJob job;
    };
    using QueuedJobPtr = std::shared_ptr<QueuedJob>;

    // Marks an id as running so cancel() defers to the chunk loop
    class InFlightScope {
    public:
        InFlightScope(TransferCoordinator& owner, std::string transferId);
        // The caller already inserted transferId while holding owner.mutex_
        InFlightScope(TransferCoordinator& owner, std::string transferId, std::adopt_lock_t);
        ~InFlightScope();

        InFlightScope(const InFlightScope&) = delete;
        InFlightScope& operator=(const InFlightScope&) = delete;

    private:
        TransferCoordinator& owner_;
        std::string transferId_;
    };

    JobOutcome runUpload(QueuedJob& queued);
    void registerTransfer(QueuedJob& queued, Transport::ITransport& transport, TransferState& state,
                          const std::vector<uint8_t>& sessionKey);
    JobOutcome uploadChunks(const QueuedJob& queued, Transport::ITransport& transport, TransferState& state,
                            PayloadSource& source, const TransferCipher& cipher, StallWatchdog& watchdog);
    void runScan(const UploadJob& job, Transport::ITransport& transport, const TransferState& state,
                 PayloadSource& source);

    Result<DownloadResult> runDownload(const DownloadRequest& request, TransferState& state);
    Error failDownload(TransferState& state, const CipherLinkError& error);

    Transport::TransportPtr transportFor(const std::optional<Transport::P2PContext>& p2p);
    std::unique_ptr<StallWatchdog> makeWatchdog(const Transport::TransportPtr& transport,
                                                const std::string& transferId);

    /**
     * @brief Persist the status a non-resource failure maps to
     *
     * Transient transport errors pause the job. A job that never got past
     * registration stays queued so it registers again on resume.
     */
    JobOutcome recordFailure(TransferState& state, const CipherLinkError& error);

    void persist(TransferState& state);
    void discardState(const std::string& transferId);
    void notifyScanStatus(const std::string& transferId, const std::string& status);

    bool takeCancelled(const std::string& transferId);
    void eraseQueued(const QueuedJobPtr& job);

    static bool isResourceError(const CipherLinkError& error);
    static std::string generateTransferId();

    Transport::TransportPtr transport_;
    std::shared_ptr<ITransferStateStore> store_;
    CoordinatorOptions options_;
    ChunkSizer chunkSizer_;

    mutable std::mutex mutex_;
    std::deque<QueuedJobPtr> queue_;
    std::set<std::string> inFlight_;
    std::set<std::string> cancelled_;
    bool running_ = false;
    std::atomic<bool> paused_{false};

    std::mutex callbackMutex_;
    StateCallback onState_;
    ScanStatusCallback onScanStatus_;
    std::shared_ptr<IDestinationResolver> destinationResolver_;
    P2PTransportFactory p2pFactory_;

    // Declared last so queued work finishes before members go away
    ThreadPool pool_;
};

} // namespace CipherLink
