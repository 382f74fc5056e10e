#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>

namespace fm::util {

// Nanoseconds since the Unix epoch; the unit used for every persisted timestamp
using EpochNanos = int64_t;

inline EpochNanos toEpochNanos(const std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

inline EpochNanos toEpochNanos(const std::filesystem::file_time_type ft) {
    return toEpochNanos(std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(ft)));
}

inline EpochNanos nowEpochNanos() { return toEpochNanos(std::chrono::system_clock::now()); }

inline std::string timestampToString(const std::chrono::system_clock::time_point tp) {
    const std::time_t ts = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&ts, &tm);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

// Compact local stamp for artifact names, e.g. 20260118_093012
inline std::string getCurrentTimestamp(const std::chrono::system_clock::time_point tp = std::chrono::system_clock::now()) {
    const std::time_t now_c = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&now_c, &tm);
    char buffer[16];
    strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &tm);
    return {buffer};
}

inline std::string durationToString(const std::chrono::nanoseconds d) {
    using namespace std::chrono;
    const auto h = duration_cast<hours>(d);
    const auto m = duration_cast<minutes>(d - h);
    const auto s = duration_cast<seconds>(d - h - m);
    const auto us = duration_cast<microseconds>(d - h - m - s);
    std::ostringstream oss;
    oss << h.count() << ':' << std::setw(2) << std::setfill('0') << m.count() << ':'
        << std::setw(2) << std::setfill('0') << s.count() << '.'
        << std::setw(6) << std::setfill('0') << us.count();
    return oss.str();
}

}
