#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <mutex>
#include <istream>
#include <cstdint>

namespace CipherLink {

    /**
     * @brief key=value configuration store.
     *
     * Lines starting with '#' are comments. Later files in loadLayered()
     * override earlier ones unless overrideExisting is false.
     * Option structs read from it via their fromConfig() helpers.
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;

        static Config& instance();

        bool loadFromFile(const std::string& path, bool overrideExisting = true);
        bool loadLayered(const std::vector<std::string>& paths, bool overrideExisting = true);
        void loadFromStream(std::istream& input, bool overrideExisting = true);
        bool saveToFile(const std::string& path) const;

        bool hasKey(const std::string& key) const;
        void clear();

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        int getInt(const std::string& key, int defaultValue = 0) const;
        void setInt(const std::string& key, int value);

        int64_t getInt64(const std::string& key, int64_t defaultValue = 0) const;

        size_t getSize(const std::string& key, size_t defaultValue = 0) const;

        bool getBool(const std::string& key, bool defaultValue = false) const;
        void setBool(const std::string& key, bool value);

        double getDouble(const std::string& key, double defaultValue = 0.0) const;
        void setDouble(const std::string& key, double value);

        /**
         * @brief Check present keys against per-key validators.
         * @param failedKey receives the first key that failed, if any
         */
        bool validate(const std::unordered_map<std::string, Validator>& schema,
                      std::string* failedKey = nullptr) const;

    private:
        std::unordered_map<std::string, std::string> settings_;
        mutable std::mutex mutex_;

        static std::string trim(const std::string& value);
        static bool parseLine(const std::string& line, std::string& key, std::string& value);
        bool storeKV(const std::string& key, const std::string& value, bool overrideExisting);
    };

}
