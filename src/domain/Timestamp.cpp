/**
 * @file Timestamp.cpp
 * @brief Implementation of the timestamp formatters.
 */

#include "domain/Timestamp.hpp"
#include <ctime>

namespace pdfcatalog::domain {

namespace {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

std::string Format(std::chrono::system_clock::time_point tp, const char* pattern) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = ToLocalTime(tt);
    char buffer[32];
    size_t n = std::strftime(buffer, sizeof(buffer), pattern, &tm);
    return std::string(buffer, n);
}

} // namespace

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    return Format(tp, "%Y-%m-%d %H:%M:%S");
}

std::string FormatBackupStamp(std::chrono::system_clock::time_point tp) {
    return Format(tp, "%Y-%m-%d_%H-%M-%S");
}

} // namespace pdfcatalog::domain
