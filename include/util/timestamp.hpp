#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace ci::util {

// Fixed width, lexicographically sortable by time: YYYYMMDD-HHMMSS in UTC.
// Local time repeats an hour when DST ends, which would break the ordering.
inline std::string formatVersionStamp(const std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y%m%d-%H%M%S");
    return os.str();
}

inline std::string runTimestamp() {
    return formatVersionStamp(std::chrono::system_clock::now());
}

inline bool isVersionStamp(const std::string_view name) {
    if (name.size() != 15 || name[8] != '-') return false;
    for (size_t i = 0; i < name.size(); ++i) {
        if (i == 8) continue;
        if (name[i] < '0' || name[i] > '9') return false;
    }
    return true;
}

}
