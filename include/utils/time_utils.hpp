#pragma once

#include <string>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>
#include "common/types.hpp"

namespace fundarb {
namespace time_utils {

/**
 * Convert timestamp to ISO 8601 string.
 */
std::string to_iso8601(WallClock t);

/**
 * Parse ISO 8601 string ("2025-01-15T08:00:00Z", optional .mmm) to timestamp.
 */
WallClock from_iso8601(const std::string& s);

/**
 * Format duration for display.
 */
std::string format_duration_ms(int64_t ms);

/**
 * High resolution timer for cycle timing.
 */
class LatencyTimer {
public:
    LatencyTimer();

    void start();
    void stop();

    Duration elapsed() const;
    int64_t elapsed_ms() const;

private:
    Timestamp start_;
    Timestamp end_;
    bool running_{false};
};

/**
 * An external call did not answer before its deadline.
 */
class DeadlineExceeded : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Run fn on a worker thread and wait at most `timeout` for it.
 *
 * The worker is detached, so a hung call never blocks the cycle; fn must own
 * everything it touches (capture shared_ptrs and values, never `this`).
 * Exceptions thrown by fn are rethrown here; a timeout throws DeadlineExceeded.
 */
template <typename T, typename Fn>
std::optional<T> call_with_timeout(Fn fn, std::chrono::milliseconds timeout) {
    auto task = std::make_shared<std::packaged_task<std::optional<T>()>>(std::move(fn));
    auto result = task->get_future();
    std::thread([task]() { (*task)(); }).detach();

    if (result.wait_for(timeout) != std::future_status::ready) {
        throw DeadlineExceeded("no response within " + std::to_string(timeout.count()) + "ms");
    }
    return result.get();
}

} // namespace time_utils
} // namespace fundarb
