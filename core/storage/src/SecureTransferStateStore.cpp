#include "SecureTransferStateStore.h"
#include "Errors.h"
#include "Logger.h"
#include <algorithm>
#include <memory>
#include <sstream>

namespace CipherLink {

namespace {
    std::string writeCompact(const Json::Value& value) {
        Json::StreamWriterBuilder writer;
        writer["indentation"] = "";
        return Json::writeString(writer, value);
    }

    bool parseJson(const std::string& text, Json::Value& out) {
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        std::string errs;
        return reader->parse(text.data(), text.data() + text.size(), &out, &errs);
    }
}

SecureTransferStateStore::SecureTransferStateStore(std::shared_ptr<ISecureStore> store)
    : store_(std::move(store)) {
}

std::string SecureTransferStateStore::keyFor(const std::string& transferId) {
    return std::string(KEY_PREFIX) + transferId;
}

std::set<std::string> SecureTransferStateStore::readIndex() {
    std::set<std::string> ids;
    auto raw = store_->read(INDEX_KEY);
    if (!raw) {
        return ids;
    }
    Json::Value root;
    if (!parseJson(*raw, root) || !root.isArray()) {
        Logger::instance().log(LogLevel::WARN, "Transfer state index is corrupt; rebuilding", "StateStore");
        return ids;
    }
    for (const auto& id : root) {
        if (id.isString()) {
            ids.insert(id.asString());
        }
    }
    return ids;
}

void SecureTransferStateStore::writeIndex(const std::set<std::string>& ids) {
    Json::Value root(Json::arrayValue);
    for (const auto& id : ids) {
        root.append(id);
    }
    store_->write(INDEX_KEY, writeCompact(root));
}

void SecureTransferStateStore::save(const TransferState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    store_->write(keyFor(state.transferId), writeCompact(state.toJson()));
    auto ids = readIndex();
    if (ids.insert(state.transferId).second) {
        writeIndex(ids);
    }
}

std::optional<TransferState> SecureTransferStateStore::load(const std::string& transferId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto raw = store_->read(keyFor(transferId));
    if (!raw) {
        return std::nullopt;
    }
    Json::Value root;
    if (!parseJson(*raw, root)) {
        Logger::instance().log(LogLevel::WARN, "Unreadable state record for " + transferId, "StateStore");
        return std::nullopt;
    }
    return TransferState::fromJson(root);
}

void SecureTransferStateStore::remove(const std::string& transferId) {
    std::lock_guard<std::mutex> lock(mutex_);
    store_->remove(keyFor(transferId));
    auto ids = readIndex();
    if (ids.erase(transferId) > 0) {
        writeIndex(ids);
    }
}

std::vector<TransferState> SecureTransferStateStore::listPending(std::optional<TransferDirection> direction) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferState> pending;
    for (const auto& id : readIndex()) {
        auto raw = store_->read(keyFor(id));
        if (!raw) {
            continue;
        }
        Json::Value root;
        if (!parseJson(*raw, root)) {
            continue;
        }
        try {
            auto state = TransferState::fromJson(root);
            if (!state.needsResume()) continue;
            if (direction && state.direction != *direction) continue;
            pending.push_back(std::move(state));
        } catch (const ProtocolError& e) {
            Logger::instance().log(LogLevel::WARN, "Skipping state " + id + ": " + e.what(), "StateStore");
        }
    }
    std::stable_sort(pending.begin(), pending.end(), [](const TransferState& a, const TransferState& b) {
        return a.updatedAtMs < b.updatedAtMs;
    });
    return pending;
}

} // namespace CipherLink
