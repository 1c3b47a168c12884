//
// Created by Sanger Steel on 5/22/25.
//

#include "logger.hpp"
#include <fcntl.h>
#include <format>
#include <iostream>
#include <stdexcept>
#include <unistd.h>

thread_local std::vector<time_point> AsyncLogger::time_starts;

const char* log_level_as_str(LogLevel level) {
    switch (level) {
        case DEBUG: return "DEBUG";
        case INFO: return "INFO";
        case WARNING: return "WARNING";
        case ERROR: return "ERROR";
        default: return "INVALID";
    }
}

AsyncLogger::AsyncLogger(const std::string& filename) : done(false), ready_to_read(false) {
    if (filename == "stdout") {
        fd = STDOUT_FILENO;
    } else if (filename == "stderr") {
        fd = STDERR_FILENO;
    } else {
        fd = open(filename.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (fd == -1) {
            throw std::runtime_error(std::format("Could not open log file: {}", filename));
        }
    }
    // Deploy logger thread
    logger = std::thread(&AsyncLogger::display_loop, this);
}

AsyncLogger::~AsyncLogger() {
    {
        std::lock_guard<std::mutex> lock(mu);
        done = true;
        ready_to_read = true;
    }
    cv.notify_one(); // Make sure the display loop isn't stuck waiting to be able to query `done`
    logger.join();
    if (fd != STDOUT_FILENO && fd != STDERR_FILENO) {
        close(fd);
    }
}

void AsyncLogger::write(std::string message) {
    messages.push_blocking(std::move(message));

    // Multiple producers (possible log writers), so ready_to_read can risk data races,
    // which is why it's atomic here
    {
        std::lock_guard<std::mutex> lock(mu);
        ready_to_read.store(true, std::memory_order_release);
    }
    cv.notify_one();
}

void AsyncLogger::drain() {
    while (true) {
        auto to_display = messages.fetch();
        if (to_display.state != RingState::SUCCESS) {
            return;
        }
        auto to_write = std::format("{}\n", to_display.content.value());
        size_t written = 0;
        while (written < to_write.size()) {
            auto n = ::write(fd, to_write.c_str() + written, to_write.size() - written);
            if (n <= 0) {
                return;
            }
            written += static_cast<size_t>(n);
        }
    }
}

void AsyncLogger::display_loop() {
    while (true) {
        bool finishing;
        {
            std::unique_lock<std::mutex> wait_response_lock(mu);
            cv.wait(wait_response_lock, [this] { return ready_to_read.load(std::memory_order_acquire) || done; });
            ready_to_read.store(false, std::memory_order_release);
            finishing = done;
        }
        drain();
        if (finishing) {
            // Writers racing the destructor may still have landed a message
            drain();
            return;
        }
    }
}

LoggingContext::LoggingContext(const std::string& filename, LogLevel level) : level(level), logger(filename) {
}

size_t LoggingContext::set_start() {
    if (this->level == DEBUG) {
        if (logger.time_starts.size() > 10000) {
            logger.time_starts.clear();
            logger.time_starts.shrink_to_fit();
        }
        auto time_start = steady::now();
        logger.time_starts.emplace_back(time_start);
        return logger.time_starts.size() - 1;
    }
    return 0;
}

void LoggingContext::set_stop_and_display_time(size_t idx, const char* name) {
    if (this->level == DEBUG && idx < logger.time_starts.size()) {
        auto duration = seconds_between(logger.time_starts[idx], steady::now());
        logger.write(std::format("DEBUG: {} took {} s", name, duration));
    }
}

void LoggingContext::debug(std::string message) {
    if (enabled(DEBUG)) {
        logger.write(std::format("DEBUG: {}", std::move(message)));
    }
}

void LoggingContext::info(std::string message) {
    if (enabled(INFO)) {
        logger.write(std::format("INFO: {}", std::move(message)));
    }
}

void LoggingContext::warn(std::string message) {
    if (enabled(WARNING)) {
        logger.write(std::format("WARNING: {}", std::move(message)));
    }
}

void LoggingContext::error(std::string message) {
    if (enabled(ERROR)) {
        logger.write(std::format("ERROR: {}", std::move(message)));
    }
}

void LoggingContext::dump_debugging_state() {
    debug(std::format(
        "dispatched={} failed={} retried={} cancelled={} warmup={} collected={} channel_full_waits={}",
        requests_dispatched.load(), requests_failed.load(), requests_retried.load(),
        requests_cancelled.load(), warmup_requests.load(), outcomes_collected.load(),
        channel_full_waits.load()));
}
