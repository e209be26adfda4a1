#pragma once

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace mcs::util {

// Parses an MDTM value ("YYYYMMDDHHMMSS", optionally followed by ".sss") as UTC.
inline std::time_t parseMdtmTimestamp(const std::string& value) {
    const auto digits = value.substr(0, value.find('.'));
    if (digits.size() != 14) throw std::runtime_error("Malformed MDTM timestamp: '" + value + "'");

    for (const char c : digits)
        if (c < '0' || c > '9') throw std::runtime_error("Malformed MDTM timestamp: '" + value + "'");

    if (digits.size() != value.size()) {
        const auto fraction = value.substr(15);
        if (fraction.empty() || fraction.find_first_not_of("0123456789") != std::string::npos)
            throw std::runtime_error("Malformed MDTM timestamp: '" + value + "'");
    }

    const auto field = [&](const size_t pos, const size_t len) { return std::stoi(digits.substr(pos, len)); };

    std::tm tm = {};
    tm.tm_year = field(0, 4) - 1900;
    tm.tm_mon = field(4, 2) - 1;
    tm.tm_mday = field(6, 2);
    tm.tm_hour = field(8, 2);
    tm.tm_min = field(10, 2);
    tm.tm_sec = field(12, 2);

    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60)
        throw std::runtime_error("MDTM timestamp out of range: '" + value + "'");

    const auto ts = timegm(&tm);

    // timegm normalizes overflow (Feb 31 -> Mar 2); reject anything that moved
    std::tm check = {};
    gmtime_r(&ts, &check);
    if (check.tm_year != tm.tm_year || check.tm_mon != tm.tm_mon || check.tm_mday != tm.tm_mday)
        throw std::runtime_error("MDTM timestamp is not a calendar date: '" + value + "'");

    return ts;
}

inline std::string timestampToString(const std::time_t ts) {
    std::tm tm = {};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

inline std::string toMdtmTimestamp(const std::time_t ts) {
    std::tm tm = {};
    gmtime_r(&ts, &tm);
    char buffer[15];
    strftime(buffer, sizeof(buffer), "%Y%m%d%H%M%S", &tm);
    return {buffer};
}

}
