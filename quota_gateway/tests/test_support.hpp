#pragma once

#include "../src/cancellation.hpp"
#include "../src/clock.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// 2024-03-15T12:00:00Z
constexpr int64_t kMidMarch2024Ms = 1710504000000;
// 2024-03-01T00:00:00Z
constexpr int64_t kMarch2024StartMs = 1709251200000;

class ManualClock : public Clock {
public:
    explicit ManualClock(int64_t start_ms = kMidMarch2024Ms) : now_ms_(start_ms) {}

    int64_t now_ms() const override { return now_ms_.load(); }

    void advance(std::chrono::milliseconds delta) { now_ms_ += delta.count(); }
    void set(int64_t now_ms) { now_ms_ = now_ms; }

private:
    std::atomic<int64_t> now_ms_;
};

// Records every requested backoff and returns immediately.
class RecordingSleeper : public Sleeper {
public:
    bool sleep_for(std::chrono::milliseconds delay, const CancellationToken* token) override {
        std::lock_guard<std::mutex> lock(mutex_);
        delays_.push_back(delay);
        return !(token && token->is_cancelled());
    }

    std::vector<std::chrono::milliseconds> delays() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return delays_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::chrono::milliseconds> delays_;
};

// Swaps the default logger for a ring buffer while in scope.
class LogCapture {
public:
    LogCapture()
        : sink_(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(512))
        , previous_(spdlog::default_logger())
    {
        auto logger = std::make_shared<spdlog::logger>("capture", sink_);
        logger->set_level(spdlog::level::debug);
        logger->set_pattern("%l %v");
        spdlog::set_default_logger(logger);
    }

    ~LogCapture() {
        spdlog::set_default_logger(previous_);
    }

    std::vector<std::string> lines_containing(const std::string& needle) const {
        std::vector<std::string> out;
        for (const auto& line : sink_->last_formatted()) {
            if (line.find(needle) != std::string::npos) {
                out.push_back(line);
            }
        }
        return out;
    }

private:
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
    std::shared_ptr<spdlog::logger> previous_;
};
