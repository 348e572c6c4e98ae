#pragma once
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace conduit::core::logging {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn" || text == "warning") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    class Logger {
    public:
        // Singleton access so the whole engine shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_instance_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            instance_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel min_level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        // The stream must outlive every later log call.
        void set_output(std::ostream& out) {
            std::lock_guard<std::mutex> lock(mutex_);
            out_ = &out;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            *out_ << timestamp() << " [" << level_to_string(level) << "] "
                  << (instance_id_.empty() ? "" : "[" + instance_id_ + "] ")
                  << message << std::endl;
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string instance_id_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* out_ = &std::cerr;

        static std::string timestamp() {
            const auto now = std::chrono::system_clock::now();
            const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
            const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    now.time_since_epoch()) % 1000;
            std::tm utc{};
            gmtime_r(&seconds, &utc);
            std::ostringstream ss;
            ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "."
               << std::setfill('0') << std::setw(3) << millis.count() << "Z";
            return ss.str();
        }

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    #define LOG_DEBUG(msg) conduit::core::logging::Logger::get().log(conduit::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  conduit::core::logging::Logger::get().log(conduit::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  conduit::core::logging::Logger::get().log(conduit::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) conduit::core::logging::Logger::get().log(conduit::core::logging::LogLevel::ERROR, msg)

} // namespace conduit::core::logging
