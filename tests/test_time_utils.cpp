#include <gtest/gtest.h>
#include "utils/time_utils.hpp"

using namespace fundarb;
using namespace fundarb::time_utils;

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, Iso8601_ParsesAndFormats) {
    auto t = from_iso8601("2025-01-15T08:00:00.250Z");
    EXPECT_EQ(to_iso8601(t), "2025-01-15T08:00:00.250Z");
    EXPECT_EQ(to_iso8601(from_iso8601("2025-01-15T08:00:00Z")), "2025-01-15T08:00:00.000Z");
}

TEST_F(TimeUtilsTest, Iso8601_RejectsGarbage) {
    EXPECT_THROW(from_iso8601("yesterday"), std::invalid_argument);
}

TEST_F(TimeUtilsTest, FormatDuration_PicksUnit) {
    EXPECT_EQ(format_duration_ms(250), "250ms");
    EXPECT_EQ(format_duration_ms(1500), "1.5s");
    EXPECT_EQ(format_duration_ms(125000), "2m5s");
}

TEST_F(TimeUtilsTest, CallWithTimeout_ReturnsValue) {
    auto value = call_with_timeout<int>([]() { return std::optional<int>(42); }, std::chrono::milliseconds(500));
    EXPECT_EQ(value.value_or(0), 42);
}

TEST_F(TimeUtilsTest, CallWithTimeout_ThrowsOnDeadline) {
    EXPECT_THROW(call_with_timeout<int>([]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return std::optional<int>(1);
    }, std::chrono::milliseconds(20)), DeadlineExceeded);
}

TEST_F(TimeUtilsTest, CallWithTimeout_RethrowsFailure) {
    EXPECT_THROW(call_with_timeout<int>([]() -> std::optional<int> {
        throw std::runtime_error("venue down");
    }, std::chrono::milliseconds(500)), std::runtime_error);
}
