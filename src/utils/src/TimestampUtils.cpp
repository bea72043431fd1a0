#include "TimestampUtils.hpp"
#include <cmath>
#include <ctime>
#include <fmt/format.h>

std::string TimestampUtils::to_iso8601(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;

    const auto ms_since_epoch = duration_cast<milliseconds>(tp.time_since_epoch()).count();
    std::time_t seconds = static_cast<std::time_t>(ms_since_epoch / 1000);
    long long millis = ms_since_epoch % 1000;
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }

    std::tm tm{};
    gmtime_r(&seconds, &tm);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
}

std::optional<std::chrono::milliseconds> TimestampUtils::minutes_to_duration(double minutes) {
    if (!std::isfinite(minutes) || minutes <= 0) return std::nullopt;
    auto ms = static_cast<long long>(std::llround(minutes * 60.0 * 1000.0));
    if (ms <= 0) ms = 1;
    return std::chrono::milliseconds(ms);
}

std::string TimestampUtils::format_duration(std::chrono::milliseconds duration) {
    const long long total = duration.count();
    if (total < 1000) return fmt::format("{}ms", total);

    const long long minutes = total / 60000;
    const double seconds = static_cast<double>(total % 60000) / 1000.0;
    if (minutes == 0) return fmt::format("{:.3f}s", seconds);
    return fmt::format("{}m {:.3f}s", minutes, seconds);
}
