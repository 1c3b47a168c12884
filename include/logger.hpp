//
// Created by Sanger Steel on 5/22/25.
//

#pragma once
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "latency_metrics.hpp"
#include "ring_buffers.hpp"

enum LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
};

const char* log_level_as_str(LogLevel level);

class AsyncLogger {
public:
    void display_loop();

    explicit AsyncLogger(const std::string& filename);

    ~AsyncLogger();

    void write(std::string message);

    static thread_local std::vector<time_point> time_starts;

private:
    void drain();

    MPSCRingBuffer<std::string, LogRingBufferMaxSize> messages;
    int fd;
    std::condition_variable cv;
    std::mutex mu;
    bool done;
    std::atomic<bool> ready_to_read;
    std::thread logger;
};

struct LoggingContext {
    LogLevel level;
    AsyncLogger logger;

    LoggingContext(const std::string& filename, LogLevel level);

    ~LoggingContext() = default;

    bool enabled(LogLevel at) const {
        return at >= level;
    }

    void debug(std::string message);

    void info(std::string message);

    void warn(std::string message);

    void error(std::string message);

    size_t set_start();

    void set_stop_and_display_time(size_t id, const char* name);

    void dump_debugging_state();

    std::atomic<int> requests_dispatched = 0;

    std::atomic<int> requests_failed = 0;

    std::atomic<int> requests_retried = 0;

    std::atomic<int> requests_cancelled = 0;

    std::atomic<int> warmup_requests = 0;

    std::atomic<int> outcomes_collected = 0;

    std::atomic<int> channel_full_waits = 0;
};


extern LoggingContext Logger;
