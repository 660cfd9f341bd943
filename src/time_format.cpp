#include "time_format.hpp"

std::tm toLocalTm(std::chrono::system_clock::time_point tp) {
    auto timeT = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &timeT);
#else
    localtime_r(&timeT, &tm);
#endif
    return tm;
}

std::chrono::system_clock::time_point fromLocalTm(std::tm tm) {
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

std::string formatLocalTime(std::chrono::system_clock::time_point tp, const char* pattern) {
    std::tm tm = toLocalTm(tp);
    char timeBuf[64];
    std::size_t len = std::strftime(timeBuf, sizeof(timeBuf), pattern, &tm);
    return std::string(timeBuf, len);
}

std::chrono::system_clock::time_point toSystemTime(std::filesystem::file_time_type ft) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(ft));
}
