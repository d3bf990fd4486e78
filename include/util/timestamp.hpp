#pragma once

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace sk::util {

inline std::string timestampToString(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // RFC 3339, UTC
    return oss.str();
}

// Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds (dropped) and either
// "Z" or a "+HH:MM" / "-HH:MM" offset. Throws std::invalid_argument on anything else.
inline std::time_t parseTimestampFromString(const std::string& iso) {
    std::tm tm{};
    std::istringstream ss(iso.substr(0, 19));
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iso.size() < 20 || ss.fail()) throw std::invalid_argument("Failed to parse timestamp: " + iso);

    size_t pos = 19;
    if (iso[pos] == '.') {
        ++pos;
        const size_t digits = pos;
        while (pos < iso.size() && std::isdigit(static_cast<unsigned char>(iso[pos]))) ++pos;
        if (pos == digits) throw std::invalid_argument("Failed to parse timestamp: " + iso);
    }

    std::time_t ts = timegm(&tm);
    if (pos < iso.size() && (iso[pos] == 'Z' || iso[pos] == 'z') && pos + 1 == iso.size()) return ts;

    if (pos + 6 == iso.size() && (iso[pos] == '+' || iso[pos] == '-') && iso[pos + 3] == ':') {
        const auto digit = [&](const size_t i) {
            if (!std::isdigit(static_cast<unsigned char>(iso[i])))
                throw std::invalid_argument("Failed to parse timestamp: " + iso);
            return iso[i] - '0';
        };
        const int hours = digit(pos + 1) * 10 + digit(pos + 2);
        const int minutes = digit(pos + 4) * 10 + digit(pos + 5);
        const std::time_t offset = hours * 3600 + minutes * 60;
        return iso[pos] == '+' ? ts - offset : ts + offset;
    }

    throw std::invalid_argument("Failed to parse timestamp: " + iso);
}

// IMF-fixdate as used by the cookie Expires attribute, e.g. "Sun, 06 Nov 1994 08:49:37 GMT".
inline std::string toHttpDate(const std::time_t ts) {
    static constexpr const char* days[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static constexpr const char* months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                             "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    std::tm tm{};
    gmtime_r(&ts, &tm);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%s, %02d %s %04d %02d:%02d:%02d GMT",
                  days[tm.tm_wday], tm.tm_mday, months[tm.tm_mon], tm.tm_year + 1900,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return {buffer};
}

} // namespace sk::util
