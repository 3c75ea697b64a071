/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: logger.h

    Description:
        Thread-safe, level-filtered logger shared by every process of the
        room allocation service (broker, allocator workers, standby replica,
        submission client). Messages carry millisecond timestamps so events
        from different nodes can be lined up after the fact.

        Core Features:
        - Four levels: DEBUG, INFO, WARNING, ERROR
        - Level check happens before the lock is taken
        - One static mutex serializes console and file output
        - Optional mirror of every line into a per-process log file
          (broker.log, worker.log, standby.log)

    Thread Safety Model:
        - Static mutex protects the output streams and the file handle
        - RAII locking via std::lock_guard
        - Safe from any thread: dispatch loop, request threads, heartbeat and
          state-sync listeners

    Related Files:
        - common/logger.cpp: static member definitions

    Typical Usage:
        #include "common/logger.h"
        using namespace roomalloc;

        Logger::set_level(Logger::parse_level("debug"));
        Logger::set_log_file("broker.log");
        Logger::info("Broker frontend listening on port 5555");
        Logger::warning("Worker reply is not valid JSON, substituting error");

*******************************************************************************/

#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <iostream>
#include <fstream>
#include <sstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace roomalloc {

//==============================================================================
// LOG LEVELS
//==============================================================================
//
// Ordered by severity. A message is emitted when its level is greater than or
// equal to the configured threshold.
//
//   DEBUG   - per-frame routing decisions, beacon arrivals
//   INFO    - lifecycle, registrations, dispatches, promotions
//   WARNING - recoverable anomalies (malformed frames, failed sends)
//   ERROR   - persistence failures, socket setup failures
//
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

class Logger {
private:
    static LogLevel current_level_;
    static std::mutex mutex_;
    static std::ofstream file_;

    // "2026-10-19 14:32:15.123" in local time
    static std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm;
        localtime_r(&time, &local_tm);

        std::stringstream ss;
        ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    static std::string level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARNING:
                return "WARN";
            case LogLevel::ERROR:
                return "ERROR";
            default:
                return "UNKNOWN";
        }
    }

public:
    static void set_level(LogLevel level) {
        current_level_ = level;
    }

    static LogLevel get_level() {
        return current_level_;
    }

    // Accepts "debug", "info", "warning"/"warn", "error" in any case.
    // Unknown names fall back to INFO.
    static LogLevel parse_level(const std::string& name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "debug") return LogLevel::DEBUG;
        if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
        if (lower == "error") return LogLevel::ERROR;
        return LogLevel::INFO;
    }

    // Mirrors every emitted line into `path` (append mode). An empty path
    // closes the current file. Returns false if the file cannot be opened.
    static bool set_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_.is_open()) {
            file_.close();
        }
        if (path.empty()) {
            return true;
        }
        file_.open(path, std::ios::app);
        return file_.is_open();
    }

    static void log(LogLevel level, const std::string& message) {
        if (level < current_level_) return;

        std::string line = "[" + get_timestamp() + "] [" +
                           level_to_string(level) + "] " + message;

        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << line << std::endl;
        if (file_.is_open()) {
            file_ << line << std::endl;
        }
    }

    static void debug(const std::string& message) {
        log(LogLevel::DEBUG, message);
    }

    static void info(const std::string& message) {
        log(LogLevel::INFO, message);
    }

    static void warning(const std::string& message) {
        log(LogLevel::WARNING, message);
    }

    static void error(const std::string& message) {
        log(LogLevel::ERROR, message);
    }
};

} // namespace roomalloc

#endif // LOGGER_H
