#pragma once

#include <chrono>
#include <ctime>
#include <string>
#include <string_view>

namespace CodeRisk
{
    namespace Utils
    {
        /**
         * Time utilities used by logging and report headers.
         *
         * Notes:
         *  - system_clock is used for wall-clock timestamps.
         *  - steady_clock is used for measuring analysis durations.
         */

        using Clock        = std::chrono::system_clock;
        using TimePoint    = std::chrono::time_point<Clock>;
        using SteadyClock  = std::chrono::steady_clock;
        using milliseconds = std::chrono::milliseconds;

        /// Convert a TimePoint to time_t (second precision).
        std::time_t to_time_t(TimePoint tp) noexcept;

        /// Current wall-clock time.
        TimePoint now() noexcept;

        /**
         * Format a TimePoint into a human-readable timestamp string.
         *
         * Default format: "YYYY-MM-DD HH:MM:SS"
         */
        std::string formatTimestamp(TimePoint tp,
                                    std::string_view format = "%Y-%m-%d %H:%M:%S");

        /// Milliseconds elapsed since a steady_clock start point.
        double elapsedMillis(SteadyClock::time_point start) noexcept;

    } // namespace Utils
} // namespace CodeRisk
