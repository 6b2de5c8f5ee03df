#pragma once

#include <chrono>
#include <ctime>
#include <optional>
#include <string>

namespace mg::util {

using SysTime = std::chrono::system_clock::time_point;

// ISO 8601 UTC with millisecond precision, e.g. 2024-03-01T12:00:00.123Z
std::string toIsoString(SysTime tp);

// Accepts the output of toIsoString, with or without the fractional part.
[[nodiscard]] std::optional<SysTime> parseIsoString(const std::string& iso);

// RFC 1123 date as sent in HTTP Last-Modified headers
[[nodiscard]] std::optional<SysTime> parseHttpDate(const std::string& date);

inline std::string getCurrentTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&now_c, &tm);
    char buffer[17];
    strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &tm);
    return {buffer};
}

}
