// File: common/timer.hpp

#ifndef TIMER_HPP
#define TIMER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "common/logging/logger.hpp"

/* Logs the wall time of a pipeline stage when stopped or destroyed, whichever comes first. */
class Timer {
public:
    using Clock = std::chrono::steady_clock;

    explicit Timer(std::string name) : name_(std::move(name)), start_time_(Clock::now()), stopped_(false) {
        LOG_DEBUG("Stage [{}] started.", name_);
    }

    ~Timer() {
        if (!stopped_) {
            stop();
        }
    }

    void stop() noexcept {
        if (!stopped_.exchange(true)) {
            const auto duration = elapsedMicroseconds();
            try {
                LOG_INFO("Stage [{}] finished in {} ({} µs).", name_, toHumanReadable(duration), duration);
            } catch (const std::exception &e) {
                std::cerr << "Timer failed to log stage " << name_ << ": " << e.what() << std::endl;
            }
        }
    }

    [[nodiscard]] int64_t elapsedMicroseconds() const noexcept {
        return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start_time_).count();
    }

    Timer(Timer &&other) noexcept :
        name_(std::move(other.name_)), start_time_(other.start_time_), stopped_(other.stopped_.exchange(true)) {}

    Timer &operator=(Timer &&other) noexcept {
        if (this != &other) {
            if (!stopped_) {
                stop();
            }
            name_ = std::move(other.name_);
            start_time_ = other.start_time_;
            stopped_ = other.stopped_.exchange(true);
        }
        return *this;
    }

    Timer(const Timer &) = delete;
    Timer &operator=(const Timer &) = delete;

private:
    std::string name_;
    Clock::time_point start_time_;
    std::atomic<bool> stopped_;

    static std::string toHumanReadable(const int64_t micros) {
        using namespace std::chrono;

        auto duration = microseconds(micros);
        const auto m = duration_cast<minutes>(duration);
        duration -= m;
        const auto s = duration_cast<seconds>(duration);
        duration -= s;
        const auto ms = duration_cast<milliseconds>(duration);

        if (m.count() > 0) {
            return fmt::format("{}m {}s {}ms", m.count(), s.count(), ms.count());
        }
        if (s.count() > 0) {
            return fmt::format("{}s {}ms", s.count(), ms.count());
        }
        return fmt::format("{}ms", ms.count());
    }
};

#endif // TIMER_HPP
