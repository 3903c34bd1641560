#include "utils/TimeUtils.hpp"

#include <iomanip>
#include <sstream>

namespace CodeRisk
{
    namespace Utils
    {
        std::time_t to_time_t(TimePoint tp) noexcept
        {
            return Clock::to_time_t(tp);
        }

        TimePoint now() noexcept
        {
            return Clock::now();
        }

        std::string formatTimestamp(TimePoint tp, std::string_view format)
        {
            std::time_t t = to_time_t(tp);
            std::tm tm_buf{};
        #if defined(_WIN32)
            localtime_s(&tm_buf, &t);
        #else
            localtime_r(&t, &tm_buf);
        #endif

            // put_time needs a null-terminated format.
            const std::string fmt(format);
            std::ostringstream oss;
            oss << std::put_time(&tm_buf, fmt.c_str());
            return oss.str();
        }

        double elapsedMillis(SteadyClock::time_point start) noexcept
        {
            const auto delta = SteadyClock::now() - start;
            return std::chrono::duration<double, std::milli>(delta).count();
        }

    } // namespace Utils
} // namespace CodeRisk
