#pragma once
#include <iostream>
#include <optional>
#include <string>
#include <mutex>

namespace winsys::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global Logger Setup
    // stdout carries the protocol stream, so every log line goes to stderr.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return level >= min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros
    #define WINSYS_LOG_DEBUG(msg) winsys::core::logging::Logger::get().log(winsys::core::logging::LogLevel::DEBUG, msg)
    #define WINSYS_LOG_INFO(msg)  winsys::core::logging::Logger::get().log(winsys::core::logging::LogLevel::INFO, msg)
    #define WINSYS_LOG_WARN(msg)  winsys::core::logging::Logger::get().log(winsys::core::logging::LogLevel::WARN, msg)
    #define WINSYS_LOG_ERROR(msg) winsys::core::logging::Logger::get().log(winsys::core::logging::LogLevel::ERROR, msg)

} // namespace winsys::core::logging
