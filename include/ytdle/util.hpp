#pragma once

#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace ytdle::util {

inline std::string ellipsize(const std::string& s, size_t maxlen) {
    if (s.size() <= maxlen) return s;
    return s.substr(0, maxlen) + "...";
}

inline std::string trim(const std::string& in) {
    size_t b = 0;
    size_t e = in.size();
    while (b < e && std::isspace(static_cast<unsigned char>(in[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(in[e - 1]))) e--;
    return in.substr(b, e - b);
}

inline bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// 1536 -> "1.50KiB"
inline std::string formatBytes(uint64_t bytes) {
    static const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double v = static_cast<double>(bytes);
    int unit = 0;
    while (v >= 1024.0 && unit < 4) {
        v /= 1024.0;
        unit++;
    }
    std::ostringstream oss;
    if (unit == 0) oss << bytes << kUnits[0];
    else oss << std::fixed << std::setprecision(2) << v << kUnits[unit];
    return oss.str();
}

inline std::string formatEta(int64_t seconds) {
    if (seconds < 0) return "--:--";
    int64_t h = seconds / 3600;
    int64_t m = (seconds % 3600) / 60;
    int64_t s = seconds % 60;
    std::ostringstream oss;
    oss << std::setfill('0');
    if (h > 0) oss << h << ":" << std::setw(2) << m << ":" << std::setw(2) << s;
    else oss << std::setw(2) << m << ":" << std::setw(2) << s;
    return oss.str();
}

// Local time, "2024-05-01T12:30:00" (history uses this format).
inline std::string formatIsoTime(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

inline std::string progressBar(double fraction, int width) {
    if (fraction < 0.0) fraction = 0.0;
    if (fraction > 1.0) fraction = 1.0;
    int filled = static_cast<int>(fraction * width);
    std::string bar = "[";
    bar.append(static_cast<size_t>(filled), '#');
    bar.append(static_cast<size_t>(width - filled), '-');
    bar += "]";
    return bar;
}

} // namespace ytdle::util
