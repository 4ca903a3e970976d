#pragma once
#include <iostream>
#include <ostream>
#include <string>
#include <mutex>

namespace storyloop::core::logging {

    // 1. Log levels, ordered by severity. SUCCESS prints at INFO severity.
    enum class LogLevel {
        DEBUG,
        INFO,
        SUCCESS,
        WARN,
        ERROR
    };

    // 2. Process-wide diagnostic logger
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_run_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            run_id_ = id;
        }

        // DEBUG lines are dropped unless verbose output was requested.
        void set_verbose(bool verbose) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = verbose ? LogLevel::DEBUG : LogLevel::INFO;
        }

        // Redirects output, e.g. to a string stream in tests. nullptr restores stdout.
        void set_sink(std::ostream* sink) {
            std::lock_guard<std::mutex> lock(mutex_);
            sink_ = sink != nullptr ? sink : &std::cout;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            *sink_ << "[" << level_to_string(level) << "] "
                   << (run_id_.empty() ? "" : "[" + run_id_ + "] ")
                   << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string run_id_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* sink_ = &std::cout;

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG:   return "DEBUG";
                case LogLevel::INFO:    return "INFO ";
                case LogLevel::SUCCESS: return "OK   ";
                case LogLevel::WARN:    return "WARN ";
                case LogLevel::ERROR:   return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros
    #define LOG_DEBUG(msg)   storyloop::core::logging::Logger::get().log(storyloop::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)    storyloop::core::logging::Logger::get().log(storyloop::core::logging::LogLevel::INFO, msg)
    #define LOG_SUCCESS(msg) storyloop::core::logging::Logger::get().log(storyloop::core::logging::LogLevel::SUCCESS, msg)
    #define LOG_WARN(msg)    storyloop::core::logging::Logger::get().log(storyloop::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg)   storyloop::core::logging::Logger::get().log(storyloop::core::logging::LogLevel::ERROR, msg)

} // namespace storyloop::core::logging
