#pragma once

#include "common/RingBuffer.hpp"
#include "common/Utils.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

namespace optgate {

    enum class LogLevel : uint8_t {
        DEBUG,
        INFO,
        WARNING,
        ERROR
    };

    struct LogEntry {
        int64_t timestamp_ms;
        LogLevel level;
        char message[240]; // Fixed size message, truncated
    };

    // Function: AsyncLogger
    // Description: Process-wide logger. Producers format into a fixed-size entry and
    //              push it into a ring buffer; a background thread writes the file.
    //              Many threads log (pacing lane, feed callback, relay loops, request
    //              handlers); the ring serializes them. When it is full the entry is
    //              dropped and counted rather than blocking.
    class AsyncLogger {
    public:
        static AsyncLogger& instance() {
            static AsyncLogger instance;
            return instance;
        }

        void start(const std::string& filename, bool mirror_stderr = false) {
            if (running_.exchange(true)) return;
            filename_ = filename;
            mirror_stderr_ = mirror_stderr;
            thread_ = std::thread(&AsyncLogger::run, this);
        }

        void stop() {
            running_ = false;
            if (thread_.joinable()) {
                thread_.join();
            }
        }

        void set_level(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }
        LogLevel level() const { return min_level_.load(std::memory_order_relaxed); }

        uint64_t dropped() const { return buffer_.dropped(); }

        template<typename... Args>
        void log(LogLevel level, const char* fmt, Args... args) {
            if (level < min_level_.load(std::memory_order_relaxed)) return;
            LogEntry entry;
            entry.timestamp_ms = now_ms();
            entry.level = level;
            snprintf(entry.message, sizeof(entry.message), fmt, args...);
            buffer_.push(entry);
        }

        // Overload for no args to fix -Wformat-security
        void log(LogLevel level, const char* msg) {
            if (level < min_level_.load(std::memory_order_relaxed)) return;
            LogEntry entry;
            entry.timestamp_ms = now_ms();
            entry.level = level;
            strncpy(entry.message, msg, sizeof(entry.message) - 1);
            entry.message[sizeof(entry.message) - 1] = '\0';
            buffer_.push(entry);
        }

    private:
        AsyncLogger() : running_(false) {}
        ~AsyncLogger() { stop(); }

        static int64_t now_ms() {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
        }

        static const char* level_tag(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "[DEBUG] ";
                case LogLevel::INFO: return "[INFO] ";
                case LogLevel::WARNING: return "[WARN] ";
                case LogLevel::ERROR: return "[ERROR] ";
            }
            return "";
        }

        void run() {
            std::ofstream file(filename_, std::ios::out | std::ios::app);
            if (!file.is_open()) {
                std::cerr << "[Logger] Cannot open " << filename_ << ", logging to stderr only" << std::endl;
                mirror_stderr_ = true;
            }

            auto write = [this, &file](const LogEntry& entry) {
                auto tp = std::chrono::system_clock::time_point(std::chrono::milliseconds(entry.timestamp_ms));
                std::string ts = utils::iso8601_utc(tp);
                if (file.is_open()) {
                    file << ts << " " << level_tag(entry.level) << entry.message << "\n";
                }
                if (mirror_stderr_) {
                    std::cerr << ts << " " << level_tag(entry.level) << entry.message << "\n";
                }
            };

            while (running_ || !buffer_.empty()) {
                if (buffer_.drain(write) == 0) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                } else if (file.is_open()) {
                    file.flush();
                }
            }
            file.close();
        }

        RingBuffer<LogEntry, 4096> buffer_;
        std::atomic<bool> running_;
        std::atomic<LogLevel> min_level_{LogLevel::INFO};
        std::thread thread_;
        std::string filename_;
        bool mirror_stderr_ = false;
    };

}

// Macro for easy usage
#define LOG_DEBUG(fmt, ...) optgate::AsyncLogger::instance().log(optgate::LogLevel::DEBUG, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) optgate::AsyncLogger::instance().log(optgate::LogLevel::INFO, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) optgate::AsyncLogger::instance().log(optgate::LogLevel::WARNING, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) optgate::AsyncLogger::instance().log(optgate::LogLevel::ERROR, fmt, ##__VA_ARGS__)
