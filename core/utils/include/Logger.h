#pragma once

#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <atomic>

namespace CipherLink {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Process-wide logger shared by every CipherLink component.
     *
     * Lines are formatted as "[time] [LEVEL] [Component] message" and go to
     * the console (unless disabled) and, when configured, to a rotating file.
     */
    class Logger {
    public:
        static Logger& instance();

        void setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB); // Rotate once the file grows past this
        void setConsoleOutput(bool enabled);

        bool isDebugEnabled() const { return currentLevel_ <= LogLevel::DEBUG; }
        bool isInfoEnabled() const { return currentLevel_ <= LogLevel::INFO; }
        LogLevel getLevel() const { return currentLevel_; }

        /**
         * @brief Parse "debug", "info", "warn", "error" or "critical".
         * @return fallback when the name is not recognised
         */
        static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

    private:
        Logger() = default;
        ~Logger();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        std::atomic<LogLevel> currentLevel_{LogLevel::INFO};
        std::atomic<bool> consoleOutput_{true};
        std::string defaultComponent_ = "CipherLink";
        size_t maxFileSizeMB_ = 50;
        size_t currentFileSize_ = 0;

        static const char* levelToString(LogLevel level);
        static std::string getCurrentTime(const char* format);
        std::string rotateLogFileLocked();
        size_t getFileSize() const;
    };

}
