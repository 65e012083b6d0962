#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "BeastHttpClient.h"
#include "Config.h"
#include "Crypto.h"
#include "HttpTransport.h"
#include "ISecureStore.h"
#include "KeyPairStore.h"
#include "Logger.h"
#include "RtcDataChannel.h"
#include "SQLiteTransferStateStore.h"
#include "TransferCoordinator.h"

using namespace CipherLink;
using namespace CipherLink::Transport;

namespace {

std::atomic<bool> interrupted{false};

void signalHandler(int) {
    interrupted = true;
}

const std::set<std::string> BOOLEAN_FLAGS = {"--scan", "--receipt", "--quiet", "--help"};

struct Arguments {
    std::map<std::string, std::string> options;
    std::set<std::string> flags;
    std::vector<std::string> positional;

    std::string get(const std::string& name, const std::string& fallback = "") const {
        auto it = options.find(name);
        return it == options.end() ? fallback : it->second;
    }

    bool has(const std::string& name) const { return flags.count(name) > 0 || options.count(name) > 0; }
};

Arguments parseArguments(int argc, char* argv[], int start) {
    Arguments args;
    for (int i = start; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0) {
            args.positional.push_back(arg);
        } else if (BOOLEAN_FLAGS.count(arg) > 0 || i + 1 >= argc) {
            args.flags.insert(arg);
        } else {
            args.options[arg] = argv[++i];
        }
    }
    return args;
}

void printUsage(const char* program) {
    std::cout << "CipherLink - end-to-end encrypted file transfer" << std::endl;
    std::cout << "\nUsage: " << program << " [--config <FILE>] [--quiet] <COMMAND> [OPTIONS]" << std::endl;
    std::cout << "\nCommands:" << std::endl;
    std::cout << "  keygen <ROLE> <SESSION>            Create or load a key pair and print its public key" << std::endl;
    std::cout << "  send --session <ID> --token <T> --peer-key <B64> [--scan] [--chunk-size <N>]" << std::endl;
    std::cout << "       [--text <TEXT> [--title <TITLE>]] [--claim <ID> --p2p direct|relay] <FILE>..." << std::endl;
    std::cout << "  receive --session <ID> --token <T> --transfer <ID> --peer-key <B64> [--receipt]" << std::endl;
    std::cout << "       [--claim <ID> --p2p direct|relay]" << std::endl;
    std::cout << "  pending [--direction upload|download]" << std::endl;
    std::cout << "  resume                             Re-run unfinished uploads" << std::endl;
    std::cout << "\nConfiguration keys: relay.base_url, store.db_path, secure.path, download.dir," << std::endl;
    std::cout << "  transfer.chunk_size, transfer.stall_timeout_ms, retry.*, p2p.*, http.timeout_ms, http.max_body_mb," << std::endl;
    std::cout << "  log.file, log.level, log.max_size_mb" << std::endl;
}

std::optional<P2PContext> p2pContextFrom(const Arguments& args, const std::string& sessionId,
                                         const std::string& token, bool initiator) {
    if (!args.has("--claim")) {
        return std::nullopt;
    }
    P2PContext context;
    context.sessionId = sessionId;
    context.claimId = args.get("--claim");
    context.token = token;
    context.isInitiator = initiator;
    context.iceMode = args.get("--p2p", "direct") == "relay" ? IceMode::Relay : IceMode::Direct;
    return context;
}

void printState(const TransferState& state) {
    std::cout << "  " << state.transferId << "  " << toString(state.direction) << "  "
              << toString(state.status) << "  chunk " << state.nextChunkIndex
              << "  " << state.nextOffset << " bytes sent/received";
    if (!state.errorMessage.empty()) {
        std::cout << "  (" << state.errorMessage << ")";
    }
    std::cout << std::endl;
}

/**
 * @brief Process-wide wiring shared by the transfer commands
 */
struct Runtime {
    std::string baseUrl;
    std::shared_ptr<IHttpClient> httpClient;
    std::shared_ptr<HttpTransport> relay;
    std::shared_ptr<ITransferStateStore> store;
    std::shared_ptr<KeyPairStore> keys;
    std::unique_ptr<TransferCoordinator> coordinator;
};

Runtime buildRuntime(const Config& config) {
    Runtime runtime;
    runtime.baseUrl = config.get("relay.base_url", "http://127.0.0.1:8080");
    auto timeout = std::chrono::milliseconds(config.getInt64("http.timeout_ms", 30000));

    auto client = std::make_shared<BeastHttpClient>();
    client->setMaxBodySize(config.getSize("http.max_body_mb", 64) * 1024 * 1024);
    runtime.httpClient = client;
    runtime.relay = std::make_shared<HttpTransport>(runtime.baseUrl, runtime.httpClient, timeout);
    runtime.store = std::make_shared<SQLiteTransferStateStore>(config.get("store.db_path", "cipherlink.db"));
    runtime.keys = std::make_shared<KeyPairStore>(
        std::make_shared<FileSecureStore>(config.get("secure.path", "cipherlink_keys.json")));

    runtime.coordinator = std::make_unique<TransferCoordinator>(
        runtime.relay, runtime.store, CoordinatorOptions::fromConfig(config));

    auto options = P2POptions::fromConfig(config);
    std::string baseUrl = runtime.baseUrl;
    auto httpClient = runtime.httpClient;
    TransportPtr relay = runtime.relay;
    runtime.coordinator->setP2PTransportFactory([baseUrl, httpClient, relay, options](const P2PContext& context) {
        return connectP2PTransport(baseUrl, httpClient, context, relay, options, [](const std::string& reason) {
            Logger::instance().warn("Peer-to-peer path unavailable, using relay: " + reason, "CLI");
        });
    });
    runtime.coordinator->setScanStatusCallback([](const std::string& transferId, const std::string& status) {
        std::cout << "Scan " << transferId << ": " << status << std::endl;
    });
    runtime.coordinator->setStateCallback([](const TransferState& state) {
        Logger::instance().debug(state.transferId + " -> " + toString(state.status) + " at chunk " +
                                 std::to_string(state.nextChunkIndex), "CLI");
    });
    return runtime;
}

// Pauses the coordinator once SIGINT/SIGTERM arrives
class InterruptWatcher {
public:
    explicit InterruptWatcher(TransferCoordinator& coordinator)
        : thread_([this, &coordinator]() {
            while (!done_) {
                if (interrupted) {
                    std::cout << "\nInterrupted, pausing at the next chunk..." << std::endl;
                    coordinator.pause();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        }) {}

    ~InterruptWatcher() {
        done_ = true;
        thread_.join();
    }

private:
    std::atomic<bool> done_{false};
    std::thread thread_;
};

int reportError(const Error& error) {
    std::cerr << "Error [" << Core::ErrorRegistry::getCodeName(static_cast<Core::ErrorCode>(error.code))
              << "]: " << error.toString() << std::endl;
    return 1;
}

int runKeygen(const Config& config, const Arguments& args) {
    if (args.positional.size() < 2) {
        std::cerr << "Usage: keygen <ROLE> <SESSION>" << std::endl;
        return 1;
    }
    KeyPairStore keys(std::make_shared<FileSecureStore>(config.get("secure.path", "cipherlink_keys.json")));
    auto keyPair = keys.loadOrCreate(args.positional[0], args.positional[1]);
    std::cout << Crypto::toBase64(keyPair.publicKey) << std::endl;
    return 0;
}

int runSend(const Config& config, const Arguments& args) {
    std::string sessionId = args.get("--session");
    std::string token = args.get("--token");
    std::string peerKey = args.get("--peer-key");
    if (sessionId.empty() || token.empty() || peerKey.empty()) {
        std::cerr << "send requires --session, --token and --peer-key" << std::endl;
        return 1;
    }
    if (args.positional.empty() && !args.has("--text")) {
        std::cerr << "Nothing to send" << std::endl;
        return 1;
    }

    Runtime runtime = buildRuntime(config);
    auto localKeys = runtime.keys->loadOrCreate("sender", sessionId);
    auto peerPublicKey = Crypto::fromBase64(peerKey);
    uint32_t chunkSize = static_cast<uint32_t>(std::stoul(args.get("--chunk-size", "0")));

    auto makeJob = [&]() {
        UploadJob job;
        job.sessionId = sessionId;
        job.transferToken = token;
        job.peerPublicKey = peerPublicKey;
        job.localKeyPair = localKeys;
        job.scanRequired = args.has("--scan");
        job.chunkSize = chunkSize;
        job.p2p = p2pContextFrom(args, sessionId, token, true);
        return job;
    };

    std::vector<std::string> ids;
    if (args.has("--text")) {
        UploadJob job = makeJob();
        std::string text = args.get("--text");
        job.file.name = "message.txt";
        job.file.bytes.assign(text.begin(), text.end());
        job.file.payloadKind = PayloadKind::TEXT;
        job.file.mimeType = TEXT_MIME_PLAIN;
        if (args.has("--title")) {
            job.file.textTitle = args.get("--title");
        }
        ids.push_back(runtime.coordinator->enqueue(std::move(job)));
    }
    for (const auto& path : args.positional) {
        UploadJob job = makeJob();
        job.file.name = std::filesystem::path(path).filename().string();
        job.file.payloadPath = std::filesystem::absolute(path).string();
        ids.push_back(runtime.coordinator->enqueue(std::move(job)));
    }

    VoidResult result = Ok();
    {
        InterruptWatcher watcher(*runtime.coordinator);
        result = runtime.coordinator->runQueue();
    }
    if (!result) {
        return reportError(result.error());
    }

    int exitCode = 0;
    for (const auto& id : ids) {
        auto state = runtime.store->load(id);
        if (!state) {
            std::cout << id << ": cancelled" << std::endl;
            continue;
        }
        std::cout << id << ": " << toString(state->status) << std::endl;
        if (state->status != TransferStatus::Completed) {
            exitCode = 2;
        }
    }
    return exitCode;
}

int runReceive(const Config& config, const Arguments& args) {
    DownloadRequest request;
    request.sessionId = args.get("--session");
    request.transferToken = args.get("--token");
    request.transferId = args.get("--transfer");
    std::string peerKey = args.get("--peer-key");
    if (request.sessionId.empty() || request.transferToken.empty() || request.transferId.empty() || peerKey.empty()) {
        std::cerr << "receive requires --session, --token, --transfer and --peer-key" << std::endl;
        return 1;
    }

    Runtime runtime = buildRuntime(config);
    request.localKeyPair = runtime.keys->loadOrCreate("receiver", request.sessionId);
    request.peerPublicKey = Crypto::fromBase64(peerKey);
    request.sendReceipt = args.has("--receipt");
    request.p2p = p2pContextFrom(args, request.sessionId, request.transferToken, false);

    Result<DownloadResult> result = makeError(Core::ErrorCode::INTERNAL_ERROR, "download not started", "CLI");
    {
        InterruptWatcher watcher(*runtime.coordinator);
        result = runtime.coordinator->downloadTransfer(request);
    }
    if (!result) {
        return reportError(result.error());
    }

    const auto& download = result.value();
    std::cout << "Received " << download.manifest.totalBytes << " bytes -> " << download.destination << std::endl;
    return 0;
}

int runPending(const Config& config, const Arguments& args) {
    Runtime runtime = buildRuntime(config);
    std::optional<TransferDirection> direction;
    if (args.has("--direction")) {
        direction = parseDirection(args.get("--direction"));
        if (!direction) {
            std::cerr << "Unknown direction: " << args.get("--direction") << std::endl;
            return 1;
        }
    }

    auto pending = runtime.coordinator->pendingTransfers(direction);
    if (!pending) {
        return reportError(pending.error());
    }
    std::cout << pending.value().size() << " pending transfer(s)" << std::endl;
    for (const auto& state : pending.value()) {
        printState(state);
    }
    return 0;
}

int runResume(const Config& config) {
    Runtime runtime = buildRuntime(config);
    auto keys = runtime.keys;

    auto count = runtime.coordinator->resumePendingUploads([keys](const TransferState& state) -> std::optional<UploadJob> {
        if (state.payloadPath.empty()) {
            Logger::instance().warn("Cannot resume " + state.transferId + ": payload was not file-backed", "CLI");
            return std::nullopt;
        }
        auto localKeys = keys->load("sender", state.sessionId);
        if (!localKeys) {
            Logger::instance().warn("Cannot resume " + state.transferId + ": no key pair for its session", "CLI");
            return std::nullopt;
        }
        UploadJob job;
        job.sessionId = state.sessionId;
        job.transferToken = state.transferToken;
        job.peerPublicKey = Crypto::fromBase64(state.peerPublicKeyB64);
        job.localKeyPair = *localKeys;
        job.scanRequired = state.scanRequired;
        job.file.id = state.transferId;
        job.file.name = std::filesystem::path(state.payloadPath).filename().string();
        job.file.payloadPath = state.payloadPath;
        return job;
    });
    if (!count) {
        return reportError(count.error());
    }
    std::cout << "Resuming " << count.value() << " upload(s)" << std::endl;

    VoidResult result = Ok();
    {
        InterruptWatcher watcher(*runtime.coordinator);
        result = runtime.coordinator->runQueue();
    }
    if (!result) {
        return reportError(result.error());
    }
    std::cout << runtime.coordinator->queueSize() << " upload(s) still pending" << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    // --- Global options ---
    std::string configPath;
    bool quiet = false;
    int index = 1;
    for (; index < argc; ++index) {
        std::string arg = argv[index];
        if (arg == "--config" && index + 1 < argc) {
            configPath = argv[++index];
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            break;
        }
    }
    if (index >= argc) {
        printUsage(argv[0]);
        return 1;
    }

    auto& config = Config::instance();
    if (!configPath.empty() && !config.loadFromFile(configPath)) {
        std::cerr << "Error: cannot read config file " << configPath << std::endl;
        return 1;
    }

    // --- Logging ---
    auto& logger = Logger::instance();
    logger.setLevel(Logger::parseLevel(config.get("log.level", "info")));
    logger.setConsoleOutput(!quiet);
    if (!config.get("log.file").empty()) {
        logger.setMaxFileSize(config.getSize("log.max_size_mb", 10));
        logger.setLogFile(config.get("log.file"));
    }

    std::string command = argv[index];
    Arguments args = parseArguments(argc, argv, index + 1);

    try {
        if (command == "keygen") {
            return runKeygen(config, args);
        }
        if (command == "send") {
            return runSend(config, args);
        }
        if (command == "receive") {
            return runReceive(config, args);
        }
        if (command == "pending") {
            return runPending(config, args);
        }
        if (command == "resume") {
            return runResume(config);
        }
    } catch (const CipherLinkError& e) {
        std::cerr << "Error: " << e.toError("CLI").toString() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    printUsage(argv[0]);
    return 1;
}
