#pragma once

#include <chrono>
#include <optional>
#include <string>

class TimestampUtils {
public:
    // UTC, millisecond precision: 2024-05-01T12:30:45.123Z
    static std::string to_iso8601(std::chrono::system_clock::time_point tp);

    // timeout-minutes value (fractional allowed) as milliseconds; nullopt unless positive
    static std::optional<std::chrono::milliseconds> minutes_to_duration(double minutes);

    // "1m 5.250s", "850ms"
    static std::string format_duration(std::chrono::milliseconds duration);
};
