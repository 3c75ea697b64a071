/*******************************************************************************
    Project: Distributed Room Allocation Service
    File: logger.cpp

    Description:
        Static member definitions for the Logger class. Compiled once into
        roomalloc_core and linked into every executable so the broker,
        allocator workers, the standby replica and the submission client
        share one logging configuration per process.

        Defaults:
        - Threshold INFO (DEBUG traffic such as beacon arrivals is hidden)
        - No log file; set_log_file() enables the mirror
*******************************************************************************/

#include "common/logger.h"

namespace roomalloc {

LogLevel Logger::current_level_ = LogLevel::INFO;

std::mutex Logger::mutex_;

std::ofstream Logger::file_;

} // namespace roomalloc
