#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <compare>
#include <ctime>
#include <sstream>
#include <iomanip>

namespace folio {

/**
 * Page and component identifiers. Assigned from per-engine counters that
 * start at 1 and only grow, so an id is never handed out twice.
 */
using PageId = int64_t;
using ComponentId = int64_t;

/**
 * Timestamp - Represents a point in time.
 *
 * Stored as milliseconds since Unix epoch for SQLite compatibility.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}

    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    explicit Timestamp(TimePoint tp) noexcept
        : millis_(std::chrono::duration_cast<Duration>(tp.time_since_epoch()).count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    [[nodiscard]] TimePoint to_time_point() const noexcept {
        return TimePoint(Duration(millis_));
    }

    /**
     * Format as ISO 8601 string (UTC, millisecond precision).
     */
    [[nodiscard]] std::string to_iso_string() const {
        auto time_t = Clock::to_time_t(to_time_point());
        std::tm utc{};
        gmtime_r(&time_t, &utc);

        std::ostringstream oss;
        oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << (millis_ % 1000) << 'Z';
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

private:
    int64_t millis_;
};

} // namespace folio
