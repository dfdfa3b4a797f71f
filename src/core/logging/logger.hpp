#pragma once
#include <iostream>
#include <ostream>
#include <string>
#include <mutex>

namespace eolfix::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the whole app shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        // DEBUG lines are only written when min_level is DEBUG.
        // silent drops INFO and WARN; ERROR is always written.
        void configure(LogLevel min_level, bool silent) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = min_level;
            silent_ = silent;
        }

        // Tests point these at string streams.
        void set_streams(std::ostream& out, std::ostream& err) {
            std::lock_guard<std::mutex> lock(mutex_);
            out_ = &out;
            err_ = &err;
        }

        void reset() {
            std::lock_guard<std::mutex> lock(mutex_);
            out_ = &std::cout;
            err_ = &std::cerr;
            min_level_ = LogLevel::INFO;
            silent_ = false;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return is_enabled(level);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // Thread safety!
            if (!is_enabled(level)) {
                return;
            }

            // Info is the tool's normal output; everything else is diagnostics.
            // Lines are written bare: the hook's output format has no level tags.
            std::ostream& stream = level == LogLevel::INFO ? *out_ : *err_;
            stream << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::ostream* out_ = &std::cout;
        std::ostream* err_ = &std::cerr;
        LogLevel min_level_ = LogLevel::INFO;
        bool silent_ = false;

        bool is_enabled(LogLevel level) const {
            if (level == LogLevel::ERROR) {
                return true;
            }
            if (level == LogLevel::DEBUG) {
                return min_level_ == LogLevel::DEBUG;
            }
            return !silent_ && level >= min_level_;
        }
    };

    // 3. Helper macros for clean syntax everywhere else in your code
    #define LOG_DEBUG(msg) eolfix::core::logging::Logger::get().log(eolfix::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  eolfix::core::logging::Logger::get().log(eolfix::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  eolfix::core::logging::Logger::get().log(eolfix::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) eolfix::core::logging::Logger::get().log(eolfix::core::logging::LogLevel::ERROR, msg)

} // namespace eolfix::core::logging
