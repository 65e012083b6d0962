#include "ISecureStore.h"
#include "Errors.h"
#include "Logger.h"
#include <filesystem>
#include <fstream>
#include <system_error>
#include <json/json.h>

namespace CipherLink {

namespace fs = std::filesystem;

FileSecureStore::FileSecureStore(std::string path)
    : path_(std::move(path))
{
}

void FileSecureStore::write(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto values = loadLocked();
    values[key] = value;
    saveLocked(values);
}

std::optional<std::string> FileSecureStore::read(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto values = loadLocked();
    auto it = values.find(key);
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second;
}

void FileSecureStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto values = loadLocked();
    if (values.erase(key) > 0) {
        saveLocked(values);
    }
}

std::map<std::string, std::string> FileSecureStore::loadLocked() const {
    std::map<std::string, std::string> values;
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        if (ec) {
            throw SecureStoreUnavailableError("Cannot access " + path_ + ": " + ec.message());
        }
        return values;
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        throw SecureStoreUnavailableError("Cannot open " + path_);
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &root, &errors) || !root.isObject()) {
        throw SecureStoreUnavailableError("Corrupt secure store " + path_ + ": " + errors);
    }
    for (const auto& key : root.getMemberNames()) {
        if (!root[key].isString()) {
            throw SecureStoreUnavailableError("Corrupt secure store " + path_ + ": '" + key + "' is not a string");
        }
        values[key] = root[key].asString();
    }
    return values;
}

void FileSecureStore::saveLocked(const std::map<std::string, std::string>& values) const {
    Json::Value root(Json::objectValue);
    for (const auto& [key, value] : values) {
        root[key] = value;
    }
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";

    std::error_code ec;
    fs::path target(path_);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw SecureStoreUnavailableError("Cannot create " + target.parent_path().string() + ": " + ec.message());
        }
    }

    fs::path temp = target;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file.is_open()) {
            throw SecureStoreUnavailableError("Cannot write " + temp.string());
        }
        fs::permissions(temp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
        if (ec) {
            Logger::instance().warn("Cannot restrict permissions of " + temp.string() + ": " + ec.message(), "SecureStore");
        }
        file << Json::writeString(writer, root);
        if (!file) {
            throw SecureStoreUnavailableError("Write to " + temp.string() + " failed");
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        throw SecureStoreUnavailableError("Cannot replace " + path_ + ": " + ec.message());
    }
}

} // namespace CipherLink
