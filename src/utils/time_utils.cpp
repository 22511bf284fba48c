#include "utils/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>

namespace fundarb {
namespace time_utils {

std::string to_iso8601(WallClock t) {
    auto time_t = std::chrono::system_clock::to_time_t(t);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()) % 1000;

    std::tm tm = *std::gmtime(&time_t);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';

    return ss.str();
}

WallClock from_iso8601(const std::string& s) {
    std::tm tm = {};
    std::istringstream ss(s);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("Not an ISO 8601 timestamp: " + s);
    }

    auto time_t = timegm(&tm);
    auto tp = std::chrono::system_clock::from_time_t(time_t);

    // Parse milliseconds if present
    size_t dot_pos = s.find('.');
    if (dot_pos != std::string::npos && dot_pos + 1 < s.length()) {
        std::string ms_str = s.substr(dot_pos + 1, 3);
        int ms = std::stoi(ms_str);
        tp += std::chrono::milliseconds(ms);
    }

    return tp;
}

std::string format_duration_ms(int64_t ms) {
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    } else if (ms < 60000) {
        double sec = ms / 1000.0;
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << sec << "s";
        return ss.str();
    } else {
        int64_t min = ms / 60000;
        int64_t sec = (ms % 60000) / 1000;
        return std::to_string(min) + "m" + std::to_string(sec) + "s";
    }
}

// LatencyTimer implementation

LatencyTimer::LatencyTimer()
    : start_(now())
    , end_(start_)
{
}

void LatencyTimer::start() {
    start_ = now();
    running_ = true;
}

void LatencyTimer::stop() {
    end_ = now();
    running_ = false;
}

Duration LatencyTimer::elapsed() const {
    if (running_) {
        return now() - start_;
    }
    return end_ - start_;
}

int64_t LatencyTimer::elapsed_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed()).count();
}

} // namespace time_utils
} // namespace fundarb
