// File: common/timer.hpp

#ifndef TIMER_HPP
#define TIMER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include "common/logging/logger.hpp"

namespace common {

    /* Scope timer: logs the elapsed time of a named stage when stopped or destroyed. */
    class Timer {
    public:
        explicit Timer(std::string name) :
            name_(std::move(name)), start_time_(std::chrono::steady_clock::now()), stopped_(false) {
            LOG_TRACE("Started timer for [{}]", name_);
        }

        ~Timer() {
            if (!stopped_) {
                stop();
            }
        }

        Timer(const Timer &) = delete;
        Timer &operator=(const Timer &) = delete;

        // Stop the timer, log the duration and return it in microseconds.
        std::int64_t stop() noexcept {
            const auto elapsed = elapsedMicroseconds();
            if (!stopped_.exchange(true)) {
                LOG_DEBUG("Execution time of {}: {} ({} µs).", name_, toHumanReadable(elapsed), elapsed);
            }
            return elapsed;
        }

        [[nodiscard]] std::int64_t elapsedMicroseconds() const noexcept {
            return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() -
                                                                         start_time_)
                    .count();
        }

    private:
        std::string name_;
        std::chrono::steady_clock::time_point start_time_;
        std::atomic<bool> stopped_;

        static std::string toHumanReadable(const std::int64_t micros) {
            using namespace std::chrono;

            auto duration = microseconds(micros);
            const auto s = duration_cast<seconds>(duration);
            duration -= s;
            const auto ms = duration_cast<milliseconds>(duration);
            duration -= ms;

            if (s.count() > 0) {
                return fmt::format("{}s {}ms {}µs", s.count(), ms.count(), duration.count());
            }
            if (ms.count() > 0) {
                return fmt::format("{}ms {}µs", ms.count(), duration.count());
            }
            return fmt::format("{}µs", duration.count());
        }
    };

} // namespace common

#endif // TIMER_HPP
