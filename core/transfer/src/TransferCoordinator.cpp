#include "TransferCoordinator.h"
#include "Config.h"
#include "EncryptedPayload.h"
#include "KeyDerivation.h"
#include "LoggerMacros.h"
#include "PayloadSource.h"
#include "StallWatchdog.h"
#include "TransportError.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <json/json.h>
#include <stdexcept>
#include <system_error>

namespace CipherLink {

using Transport::TransportError;
using Transport::TransportPtr;

namespace fs = std::filesystem;

namespace {

const char* COMPONENT = "Coordinator";

std::string progressOf(const TransferState& state) {
    uint64_t total = PayloadSource::chunkCount(state.totalBytes, state.chunkSize);
    return std::to_string(state.nextChunkIndex) + "/" + std::to_string(total);
}

TransferManifest buildManifest(const TransferFile& file, const TransferState& state) {
    TransferManifest manifest;
    manifest.transferId = state.transferId;
    manifest.payloadKind = file.payloadKind;
    manifest.packagingMode = file.packagingMode;
    manifest.totalBytes = state.totalBytes;
    manifest.chunkSize = state.chunkSize;

    if (file.payloadKind == PayloadKind::TEXT) {
        manifest.textTitle = file.textTitle;
        manifest.textMime = TEXT_MIME_PLAIN;
        manifest.textLength = state.totalBytes;
        return manifest;
    }

    ManifestFile entry;
    entry.relativePath = file.name;
    entry.mediaType = mediaTypeFromMime(file.mimeType);
    entry.sizeBytes = state.totalBytes;
    entry.originalFilename = file.name;
    entry.mime = file.mimeType;
    manifest.files.push_back(entry);

    if (file.payloadKind == PayloadKind::ZIP) {
        manifest.packageTitle = file.name;
        manifest.outputFilename = file.name;
    } else if (file.payloadKind == PayloadKind::ALBUM) {
        manifest.packageTitle = file.name;
        manifest.albumTitle = file.name;
        manifest.albumItemCount = 1;
    }
    return manifest;
}

void removeFile(const std::string& path) {
    if (path.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        LOG_WARN_COMP("Failed to remove " + path + ": " + ec.message(), COMPONENT);
    }
}

} // namespace

CoordinatorOptions CoordinatorOptions::fromConfig(const Config& config) {
    CoordinatorOptions options;
    options.fixedChunkSize = static_cast<uint32_t>(config.getSize("transfer.chunk_size", 0));
    options.stallTimeout = std::chrono::milliseconds(config.getInt64("transfer.stall_timeout_ms", 15000));
    options.downloadDir = config.get("download.dir", ".");
    options.retry = RetryPolicy::fromConfig(config);
    return options;
}

TransferCoordinator::InFlightScope::InFlightScope(TransferCoordinator& owner, std::string transferId)
    : owner_(owner)
    , transferId_(std::move(transferId))
{
    std::lock_guard<std::mutex> lock(owner_.mutex_);
    owner_.inFlight_.insert(transferId_);
}

TransferCoordinator::InFlightScope::InFlightScope(TransferCoordinator& owner, std::string transferId,
                                                 std::adopt_lock_t)
    : owner_(owner)
    , transferId_(std::move(transferId))
{
}

TransferCoordinator::InFlightScope::~InFlightScope() {
    std::lock_guard<std::mutex> lock(owner_.mutex_);
    owner_.inFlight_.erase(transferId_);
    owner_.cancelled_.erase(transferId_);
}

TransferCoordinator::TransferCoordinator(TransportPtr transport,
                                         std::shared_ptr<ITransferStateStore> store,
                                         CoordinatorOptions options)
    : transport_(std::move(transport))
    , store_(std::move(store))
    , options_(std::move(options))
    , pool_(2)
{
    if (!transport_ || !store_) {
        throw std::invalid_argument("TransferCoordinator requires a transport and a state store");
    }
    LOG_DEBUG_COMP_IF("Coordinator ready on " + transport_->name(), COMPONENT);
}

TransferCoordinator::~TransferCoordinator() {
    paused_ = true;
    pool_.shutdown();
}

void TransferCoordinator::setStateCallback(StateCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    onState_ = std::move(callback);
}

void TransferCoordinator::setScanStatusCallback(ScanStatusCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    onScanStatus_ = std::move(callback);
}

void TransferCoordinator::setDestinationResolver(std::shared_ptr<IDestinationResolver> resolver) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    destinationResolver_ = std::move(resolver);
}

void TransferCoordinator::setP2PTransportFactory(P2PTransportFactory factory) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    p2pFactory_ = std::move(factory);
}

std::string TransferCoordinator::enqueue(UploadJob job) {
    auto queued = std::make_shared<QueuedJob>();
    if (job.transferId) {
        queued->key = *job.transferId;
    } else if (!job.file.id.empty()) {
        queued->key = job.file.id;
    } else {
        queued->key = generateTransferId();
    }
    queued->job = std::move(job);

    std::string key = queued->key;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(queued));
    }
    LOG_INFO_COMP_IF("Queued upload " + key, COMPONENT);
    return key;
}

VoidResult TransferCoordinator::runQueue() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return Ok();
        }
        running_ = true;
    }

    VoidResult result = Ok();
    try {
        while (true) {
            QueuedJobPtr next;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (queue_.empty() || paused_.load()) {
                    break;
                }
                next = queue_.front();
                // Marked in flight under the lock that dequeues it
                inFlight_.insert(next->key);
            }

            JobOutcome outcome;
            {
                InFlightScope scope(*this, next->key, std::adopt_lock);
                outcome = runUpload(*next);
            }
            if (outcome == JobOutcome::Paused) {
                // The job keeps its place at the head of the queue
                break;
            }
            eraseQueued(next);
        }
    } catch (const CipherLinkError& e) {
        LOG_ERROR_COMP("Upload queue aborted: " + std::string(e.what()), COMPONENT);
        result = e.toError(COMPONENT);
    } catch (const std::exception& e) {
        LOG_ERROR_COMP("Upload queue aborted: " + std::string(e.what()), COMPONENT);
        result = makeError(Core::ErrorCode::INTERNAL_ERROR, e.what(), COMPONENT);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    return result;
}

std::future<VoidResult> TransferCoordinator::runQueueAsync() {
    return pool_.enqueue([this]() { return runQueue(); });
}

void TransferCoordinator::pause() {
    paused_ = true;
    LOG_INFO_COMP_IF("Pause requested", COMPONENT);
}

VoidResult TransferCoordinator::resume() {
    paused_ = false;
    LOG_INFO_COMP_IF("Resuming upload queue", COMPONENT);
    return runQueue();
}

VoidResult TransferCoordinator::cancel(const std::string& transferId) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inFlight_.count(transferId) > 0) {
            cancelled_.insert(transferId);
            LOG_INFO_COMP_IF("Cancel of " + transferId + " deferred to the next chunk boundary", COMPONENT);
            return Ok();
        }
        queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                                    [&](const QueuedJobPtr& job) { return job->key == transferId; }),
                     queue_.end());
    }

    try {
        discardState(transferId);
    } catch (const CipherLinkError& e) {
        return e.toError(COMPONENT);
    }
    LOG_INFO_COMP_IF("Cancelled " + transferId, COMPONENT);
    return Ok();
}

TransferCoordinator::JobOutcome TransferCoordinator::runUpload(QueuedJob& queued) {
    UploadJob& job = queued.job;

    TransferState state;
    auto existing = store_->load(queued.key);
    if (existing && !existing->isTerminal() && existing->direction == TransferDirection::Upload) {
        state = *existing;
    } else {
        state.transferId = queued.key;
        state.direction = TransferDirection::Upload;
        state.status = TransferStatus::Queued;
    }
    state.sessionId = job.sessionId;
    state.transferToken = job.transferToken;
    state.peerPublicKeyB64 = Crypto::toBase64(job.peerPublicKey);
    state.payloadPath = job.file.payloadPath;
    state.scanRequired = job.scanRequired;
    if (job.p2p) {
        state.claimId = job.p2p->claimId;
    }

    auto transport = transportFor(job.p2p);
    try {
        PayloadSource source(job.file);
        if (state.nextChunkIndex > 0 && state.totalBytes != source.size()) {
            throw ProtocolError(Core::ErrorCode::BYTE_COUNT_MISMATCH,
                                "Payload is " + std::to_string(source.size()) + " bytes, transfer " +
                                state.transferId + " was started with " + std::to_string(state.totalBytes));
        }
        state.totalBytes = source.size();

        // A registered transfer keeps the chunk size its manifest declared
        if (!job.transferId || state.chunkSize == 0) {
            state.chunkSize = job.chunkSize > 0 ? job.chunkSize : nextChunkSize();
        }

        auto sessionKey = KeyDerivation::deriveSessionKey(job.localKeyPair, job.peerPublicKey, job.sessionId);
        if (!job.transferId) {
            registerTransfer(queued, *transport, state, sessionKey);
        } else {
            state.status = TransferStatus::Uploading;
            persist(state);
        }
        TransferCipher cipher(sessionKey, job.sessionId, state.transferId);
        Crypto::secureWipe(sessionKey);

        LOG_INFO_COMP_IF("Uploading " + state.transferId + " via " + transport->name() + " from chunk " +
                         progressOf(state) + " (" + std::to_string(state.chunkSize) + " byte chunks)", COMPONENT);

        JobOutcome outcome;
        {
            auto watchdog = makeWatchdog(transport, state.transferId);
            watchdog->start();
            outcome = uploadChunks(queued, *transport, state, source, cipher, *watchdog);
        }
        if (outcome != JobOutcome::Completed) {
            return outcome;
        }

        options_.retry.run(options_.retry.controlAttempts, "finalizeTransfer", [&]() {
            transport->finalizeTransfer(job.sessionId, state.transferId, job.transferToken);
        });
        state.status = TransferStatus::Completed;
        state.attempt = 0;
        state.errorMessage.clear();
        persist(state);
        LOG_INFO_COMP_IF("Upload " + state.transferId + " completed", COMPONENT);

        if (job.scanRequired) {
            runScan(job, *transport, state, source);
        }
        return JobOutcome::Completed;
    } catch (const CipherLinkError& e) {
        if (isResourceError(e)) {
            throw;
        }
        return recordFailure(state, e);
    } catch (const Json::Exception& e) {
        return recordFailure(state, ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD, e.what()));
    }
}

void TransferCoordinator::registerTransfer(QueuedJob& queued, Transport::ITransport& transport,
                                           TransferState& state, const std::vector<uint8_t>& sessionKey) {
    UploadJob& job = queued.job;
    auto manifest = buildManifest(job.file, state);

    std::vector<uint8_t> sealedManifest;
    {
        TransferCipher cipher(sessionKey, job.sessionId, state.transferId);
        sealedManifest = cipher.encryptManifest(Crypto::toBytes(manifest.serialize())).serialize();
    }

    auto assigned = options_.retry.run(options_.retry.controlAttempts, "initTransfer", [&]() {
        return transport.initTransfer(job.sessionId, job.transferToken, sealedManifest,
                                      state.totalBytes, state.transferId);
    });
    // The manifest is sealed to the id it was sent with
    if (assigned != state.transferId) {
        throw ProtocolError(Core::ErrorCode::MISSING_TRANSFER_ID,
                            "Relay registered " + assigned + " instead of " + state.transferId);
    }

    job.transferId = assigned;
    state.status = TransferStatus::Uploading;
    state.nextOffset = 0;
    state.nextChunkIndex = 0;
    persist(state);
}

TransferCoordinator::JobOutcome TransferCoordinator::uploadChunks(
    const QueuedJob& queued, Transport::ITransport& transport, TransferState& state,
    PayloadSource& source, const TransferCipher& cipher, StallWatchdog& watchdog) {
    const UploadJob& job = queued.job;
    const uint64_t totalChunks = PayloadSource::chunkCount(state.totalBytes, state.chunkSize);

    while (state.nextChunkIndex < totalChunks) {
        if (takeCancelled(queued.key)) {
            discardState(state.transferId);
            LOG_INFO_COMP_IF("Upload " + state.transferId + " cancelled at chunk " + progressOf(state), COMPONENT);
            return JobOutcome::Cancelled;
        }
        if (paused_.load()) {
            state.status = TransferStatus::Paused;
            persist(state);
            LOG_INFO_COMP_IF("Upload " + state.transferId + " paused at chunk " + progressOf(state), COMPONENT);
            return JobOutcome::Paused;
        }

        auto plaintext = source.chunk(state.nextChunkIndex, state.chunkSize);
        auto payload = cipher.encryptChunk(state.nextChunkIndex, plaintext).serialize();
        const uint64_t offset = state.nextOffset;

        auto started = std::chrono::steady_clock::now();
        options_.retry.run(options_.retry.chunkAttempts, "sendChunk", [&]() {
            transport.sendChunk(job.sessionId, state.transferId, job.transferToken, offset, payload);
        }, [&](int attempt, const TransportError&) {
            state.attempt = attempt;
        });
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        chunkSizer_.recordChunk(payload.size(), elapsed);
        watchdog.progress();

        state.nextOffset += payload.size();
        state.nextChunkIndex += 1;
        state.attempt = 0;
        state.errorMessage.clear();
        persist(state);

        LOG_DEBUG_COMP_IF("Chunk " + progressOf(state) + " of " + state.transferId + " sent in " +
                          std::to_string(elapsed.count()) + "ms", COMPONENT);
    }
    return JobOutcome::Completed;
}

void TransferCoordinator::runScan(const UploadJob& job, Transport::ITransport& transport,
                                  const TransferState& state, PayloadSource& source) {
    SCOPED_TIMER_COMP("Scan relay of " + state.transferId, COMPONENT);
    std::vector<uint8_t> scanKey;
    try {
        auto session = options_.retry.run(options_.retry.controlAttempts, "scanInit", [&]() {
            return transport.scanInit(job.sessionId, state.transferId, job.transferToken,
                                      state.totalBytes, state.chunkSize);
        });
        scanKey = Crypto::fromBase64(session.scanKeyB64);
        if (scanKey.size() != Crypto::KEY_SIZE) {
            throw ProtocolError(Core::ErrorCode::INVALID_KEY,
                                "Scan key is " + std::to_string(scanKey.size()) + " bytes");
        }

        const uint64_t totalChunks = PayloadSource::chunkCount(state.totalBytes, state.chunkSize);
        for (uint64_t index = 0; index < totalChunks; ++index) {
            auto sealed = KeyDerivation::encryptScanChunk(scanKey, index, source.chunk(index, state.chunkSize));
            options_.retry.run(options_.retry.chunkAttempts, "scanChunk", [&]() {
                transport.scanChunk(session.scanId, job.transferToken, index, sealed);
            });
        }

        auto status = options_.retry.run(options_.retry.controlAttempts, "scanFinalize", [&]() {
            return transport.scanFinalize(session.scanId, job.transferToken);
        });
        Crypto::secureWipe(scanKey);
        LOG_INFO_COMP_IF("Scan of " + state.transferId + ": " + status, COMPONENT);
        notifyScanStatus(state.transferId, status);
    } catch (const CipherLinkError& e) {
        Crypto::secureWipe(scanKey);
        LOG_WARN_COMP("Scan relay failed for " + state.transferId + ": " + e.what(), COMPONENT);
        notifyScanStatus(state.transferId, "failed");
    } catch (const std::invalid_argument& e) {
        LOG_WARN_COMP("Scan relay returned an unreadable key for " + state.transferId + ": " + e.what(), COMPONENT);
        notifyScanStatus(state.transferId, "failed");
    }
}

Result<DownloadResult> TransferCoordinator::downloadTransfer(const DownloadRequest& request) {
    if (request.transferId.empty()) {
        return makeError(Core::ErrorCode::MISSING_TRANSFER_ID, "download request", COMPONENT);
    }

    InFlightScope scope(*this, request.transferId);
    TransferState state;
    state.transferId = request.transferId;
    state.direction = TransferDirection::Download;
    try {
        return runDownload(request, state);
    } catch (const CipherLinkError& e) {
        return failDownload(state, e);
    } catch (const Json::Exception& e) {
        return failDownload(state, ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD, e.what()));
    } catch (const std::exception& e) {
        LOG_ERROR_COMP("Download " + request.transferId + " aborted: " + e.what(), COMPONENT);
        return makeError(Core::ErrorCode::INTERNAL_ERROR, e.what(), COMPONENT);
    }
}

std::future<Result<DownloadResult>> TransferCoordinator::downloadTransferAsync(DownloadRequest request) {
    return pool_.enqueue([this, request = std::move(request)]() {
        return downloadTransfer(request);
    });
}

Result<DownloadResult> TransferCoordinator::runDownload(const DownloadRequest& request, TransferState& state) {
    const std::string& transferId = request.transferId;

    auto existing = store_->load(transferId);
    if (existing && !existing->isTerminal() && existing->direction == TransferDirection::Download) {
        state = *existing;
    }
    state.sessionId = request.sessionId;
    state.transferToken = request.transferToken;
    state.peerPublicKeyB64 = Crypto::toBase64(request.peerPublicKey);
    if (request.p2p) {
        state.claimId = request.p2p->claimId;
    }
    state.status = TransferStatus::Downloading;

    auto transport = transportFor(request.p2p);
    auto sealedManifest = options_.retry.run(options_.retry.controlAttempts, "fetchManifest", [&]() {
        return transport->fetchManifest(request.sessionId, transferId, request.transferToken);
    });

    auto sessionKey = KeyDerivation::deriveSessionKey(request.localKeyPair, request.peerPublicKey, request.sessionId);
    TransferCipher cipher(sessionKey, request.sessionId, transferId);
    Crypto::secureWipe(sessionKey);

    auto manifestBytes = cipher.decryptManifest(EncryptedPayload::parse(sealedManifest));
    auto manifest = TransferManifest::parse(std::string(manifestBytes.begin(), manifestBytes.end()));
    if (manifest.totalBytes > 0 && manifest.chunkSize == 0) {
        throw ProtocolError(Core::ErrorCode::INVALID_MANIFEST, "Manifest of " + transferId + " has no chunk size");
    }

    if (state.chunkSize != manifest.chunkSize || state.totalBytes != manifest.totalBytes) {
        state.nextOffset = 0;
        state.nextChunkIndex = 0;
    }
    state.totalBytes = manifest.totalBytes;
    state.chunkSize = manifest.chunkSize;

    std::error_code ec;
    fs::path dir(options_.downloadDir);
    fs::create_directories(dir, ec);
    if (ec) {
        throw StorageError(Core::ErrorCode::FILE_IO_FAILED, "Cannot create " + dir.string() + ": " + ec.message());
    }
    fs::path partPath = dir / (transferId + ".part");
    fs::path manifestPath = dir / (transferId + ".manifest.json");
    {
        std::ofstream manifestFile(manifestPath, std::ios::binary | std::ios::trunc);
        manifestFile << manifest.serialize();
        if (!manifestFile) {
            throw StorageError(Core::ErrorCode::FILE_IO_FAILED, "Cannot write " + manifestPath.string());
        }
    }
    state.manifestPath = manifestPath.string();
    state.payloadPath = partPath.string();

    // Drop plaintext past the last persisted chunk
    uint64_t keep = std::min<uint64_t>(state.nextChunkIndex * state.chunkSize, state.totalBytes);
    uint64_t current = fs::exists(partPath, ec) ? fs::file_size(partPath, ec) : 0;
    if (ec || current < keep) {
        state.nextOffset = 0;
        state.nextChunkIndex = 0;
        keep = 0;
    }
    {
        std::ofstream create(partPath, std::ios::binary | std::ios::app);
        if (!create) {
            throw StorageError(Core::ErrorCode::FILE_IO_FAILED, "Cannot open " + partPath.string());
        }
    }
    fs::resize_file(partPath, keep, ec);
    if (ec) {
        throw StorageError(Core::ErrorCode::FILE_IO_FAILED, "Cannot truncate " + partPath.string() + ": " + ec.message());
    }
    persist(state);

    LOG_INFO_COMP_IF("Downloading " + transferId + " via " + transport->name() + " from chunk " +
                     progressOf(state), COMPONENT);

    const uint64_t totalChunks = PayloadSource::chunkCount(state.totalBytes, state.chunkSize);
    {
        auto watchdog = makeWatchdog(transport, transferId);
        watchdog->start();
        std::ofstream out(partPath, std::ios::binary | std::ios::app);
        if (!out) {
            throw StorageError(Core::ErrorCode::FILE_IO_FAILED, "Cannot open " + partPath.string());
        }

        while (state.nextChunkIndex < totalChunks) {
            if (takeCancelled(transferId)) {
                out.close();
                discardState(transferId);
                removeFile(partPath.string());
                LOG_INFO_COMP_IF("Download " + transferId + " cancelled at chunk " + progressOf(state), COMPONENT);
                return makeError(Core::ErrorCode::TRANSFER_CANCELLED, transferId, COMPONENT);
            }
            if (paused_.load()) {
                state.status = TransferStatus::Paused;
                persist(state);
                LOG_INFO_COMP_IF("Download " + transferId + " paused at chunk " + progressOf(state), COMPONENT);
                return makeError(Core::ErrorCode::TRANSFER_PAUSED, transferId, COMPONENT);
            }

            const uint64_t plaintextLength = std::min<uint64_t>(
                state.chunkSize, state.totalBytes - state.nextChunkIndex * state.chunkSize);
            const uint64_t length = EncryptedPayload::wireSize(plaintextLength);
            const uint64_t offset = state.nextOffset;

            auto sealed = options_.retry.run(options_.retry.chunkAttempts, "fetchRange", [&]() {
                return transport->fetchRange(request.sessionId, transferId, request.transferToken, offset, length);
            }, [&](int attempt, const TransportError&) {
                state.attempt = attempt;
            });
            if (sealed.size() != length) {
                throw ProtocolError(Core::ErrorCode::BYTE_COUNT_MISMATCH,
                                    "Range at " + std::to_string(offset) + " returned " +
                                    std::to_string(sealed.size()) + " of " + std::to_string(length) + " bytes");
            }

            auto plaintext = cipher.decryptChunk(state.nextChunkIndex, EncryptedPayload::parse(sealed));
            out.write(reinterpret_cast<const char*>(plaintext.data()), static_cast<std::streamsize>(plaintext.size()));
            out.flush();
            if (!out) {
                throw StorageError(Core::ErrorCode::FILE_IO_FAILED, "Write to " + partPath.string() + " failed");
            }
            watchdog->progress();

            state.nextOffset += sealed.size();
            state.nextChunkIndex += 1;
            state.attempt = 0;
            state.errorMessage.clear();
            persist(state);

            LOG_DEBUG_COMP_IF("Chunk " + progressOf(state) + " of " + transferId + " received", COMPONENT);
        }
    }

    uint64_t written = fs::file_size(partPath, ec);
    if (ec || written != state.totalBytes) {
        throw ProtocolError(Core::ErrorCode::BYTE_COUNT_MISMATCH,
                            "Reassembled " + std::to_string(written) + " bytes, manifest declares " +
                            std::to_string(state.totalBytes));
    }

    if (request.sendReceipt) {
        options_.retry.run(options_.retry.controlAttempts, "sendReceipt", [&]() {
            transport->sendReceipt(request.sessionId, transferId, request.transferToken);
        });
    }

    std::shared_ptr<IDestinationResolver> resolver;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        resolver = destinationResolver_;
    }
    std::string destination = resolver ? resolver->resolve(manifest, partPath.string()) : partPath.string();

    state.destination = destination;
    state.status = TransferStatus::Completed;
    state.errorMessage.clear();
    persist(state);
    LOG_INFO_COMP_IF("Download " + transferId + " completed (" + std::to_string(state.totalBytes) + " bytes)", COMPONENT);

    if (request.sendReceipt) {
        discardState(transferId);
    }

    DownloadResult result;
    result.transferId = transferId;
    result.manifest = std::move(manifest);
    result.payloadPath = partPath.string();
    result.destination = std::move(destination);
    return result;
}

Error TransferCoordinator::failDownload(TransferState& state, const CipherLinkError& error) {
    if (isResourceError(error)) {
        LOG_ERROR_COMP("Download " + state.transferId + " aborted: " + error.what(), COMPONENT);
        return error.toError(COMPONENT);
    }
    try {
        recordFailure(state, error);
    } catch (const CipherLinkError& persistError) {
        LOG_ERROR_COMP("Cannot record failure of " + state.transferId + ": " + persistError.what(), COMPONENT);
        return persistError.toError(COMPONENT);
    }
    return error.toError(COMPONENT);
}

Result<std::size_t> TransferCoordinator::resumePendingUploads(const UploadJobBuilder& builder) {
    std::vector<TransferState> pending;
    try {
        pending = store_->listPending(TransferDirection::Upload);
    } catch (const CipherLinkError& e) {
        return e.toError(COMPONENT);
    }

    std::size_t count = 0;
    for (const auto& state : pending) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            bool queued = std::any_of(queue_.begin(), queue_.end(),
                                      [&](const QueuedJobPtr& job) { return job->key == state.transferId; });
            if (queued) {
                continue;
            }
        }

        auto job = builder(state);
        if (!job) {
            LOG_DEBUG_COMP_IF("Skipping pending upload " + state.transferId, COMPONENT);
            continue;
        }
        if (state.status == TransferStatus::Queued) {
            // Never registered with the relay
            job->transferId.reset();
            job->file.id = state.transferId;
        } else {
            job->transferId = state.transferId;
        }
        enqueue(std::move(*job));
        ++count;
    }

    LOG_INFO_COMP_IF("Re-queued " + std::to_string(count) + " pending upload(s)", COMPONENT);
    return count;
}

Result<std::vector<TransferState>> TransferCoordinator::pendingTransfers(std::optional<TransferDirection> direction) {
    try {
        return store_->listPending(direction);
    } catch (const CipherLinkError& e) {
        return e.toError(COMPONENT);
    }
}

uint32_t TransferCoordinator::nextChunkSize() const {
    if (options_.fixedChunkSize > 0) {
        return options_.fixedChunkSize;
    }
    return chunkSizer_.nextChunkSize();
}

bool TransferCoordinator::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

std::size_t TransferCoordinator::queueSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

TransportPtr TransferCoordinator::transportFor(const std::optional<Transport::P2PContext>& p2p) {
    if (!p2p) {
        return transport_;
    }
    P2PTransportFactory factory;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        factory = p2pFactory_;
    }
    if (!factory) {
        return transport_;
    }
    auto transport = factory(*p2p);
    return transport ? transport : transport_;
}

std::unique_ptr<StallWatchdog> TransferCoordinator::makeWatchdog(const TransportPtr& transport,
                                                                 const std::string& transferId) {
    std::weak_ptr<Transport::ITransport> weak = transport;
    auto timeout = options_.stallTimeout;
    return std::make_unique<StallWatchdog>(timeout, [weak, transferId, timeout]() {
        auto target = weak.lock();
        if (!target) {
            return;
        }
        LOG_WARN_COMP("No progress on " + transferId + " for " + std::to_string(timeout.count()) +
                      "ms, forcing fallback", COMPONENT);
        target->forceFallback("stalled");
    });
}

TransferCoordinator::JobOutcome TransferCoordinator::recordFailure(TransferState& state, const CipherLinkError& error) {
    const auto* transportError = dynamic_cast<const TransportError*>(&error);
    const bool transient = transportError && transportError->isTransient();

    state.errorMessage = error.what();
    if (transient) {
        if (state.status != TransferStatus::Queued) {
            state.status = TransferStatus::Paused;
        }
        LOG_WARN_COMP("Transfer " + state.transferId + " paused after retries: " + error.what(), COMPONENT);
    } else {
        state.status = TransferStatus::Failed;
        LOG_ERROR_COMP("Transfer " + state.transferId + " failed: " + error.what(), COMPONENT);
    }
    persist(state);
    return transient ? JobOutcome::Paused : JobOutcome::Failed;
}

void TransferCoordinator::persist(TransferState& state) {
    state.updatedAtMs = currentTimeMs();
    store_->save(state);

    StateCallback onState;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        onState = onState_;
    }
    if (options_.backgroundHooks) {
        options_.backgroundHooks->onStateUpdated(state);
    }
    if (onState) {
        onState(state);
    }
}

void TransferCoordinator::discardState(const std::string& transferId) {
    auto state = store_->load(transferId);
    if (state && state->direction == TransferDirection::Download) {
        if (state->status != TransferStatus::Completed) {
            removeFile(state->payloadPath);
        }
        removeFile(state->manifestPath);
    }
    store_->remove(transferId);

    if (options_.backgroundHooks) {
        options_.backgroundHooks->onStateRemoved(transferId);
    }
}

void TransferCoordinator::notifyScanStatus(const std::string& transferId, const std::string& status) {
    ScanStatusCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = onScanStatus_;
    }
    if (callback) {
        callback(transferId, status);
    }
}

bool TransferCoordinator::takeCancelled(const std::string& transferId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_.erase(transferId) > 0;
}

void TransferCoordinator::eraseQueued(const QueuedJobPtr& job) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(queue_.begin(), queue_.end(), job);
    if (it != queue_.end()) {
        queue_.erase(it);
    }
}

bool TransferCoordinator::isResourceError(const CipherLinkError& error) {
    return error.code() == Core::ErrorCode::SECURE_STORAGE_UNAVAILABLE ||
           error.code() == Core::ErrorCode::STATE_STORE_FAILED;
}

std::string TransferCoordinator::generateTransferId() {
    return Crypto::toHex(Crypto::randomBytes(16));
}

} // namespace CipherLink
