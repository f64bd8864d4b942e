#pragma once
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace forge::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Process-wide logger shared by every component
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_execution_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            execution_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel min_level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        // Mirrors every emitted line into `path` (append mode). Returns false if
        // the file cannot be opened; console logging continues either way.
        bool set_log_file(const std::filesystem::path& path) {
            std::lock_guard<std::mutex> lock(mutex_);
            std::error_code ec;
            if (path.has_parent_path()) {
                std::filesystem::create_directories(path.parent_path(), ec);
            }
            file_.close();
            file_.clear();
            file_.open(path, std::ios::app);
            return file_.is_open();
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            const std::string prefix =
                "[" + level_to_string(level) + "] " +
                (execution_id_.empty() ? "" : "[" + execution_id_ + "] ");
            std::cout << prefix << message << std::endl;

            if (file_.is_open()) {
                file_ << timestamp() << " " << prefix << message << "\n";
                file_.flush();
            }
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string execution_id_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ofstream file_;

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }

        static std::string timestamp() {
            const std::time_t now =
                std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm local{};
            localtime_r(&now, &local);
            std::ostringstream out;
            out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
            return out.str();
        }
    };

    // 3. Helper macros used everywhere else
    #define LOG_DEBUG(msg) forge::core::logging::Logger::get().log(forge::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  forge::core::logging::Logger::get().log(forge::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  forge::core::logging::Logger::get().log(forge::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) forge::core::logging::Logger::get().log(forge::core::logging::LogLevel::ERROR, msg)

} // namespace forge::core::logging
