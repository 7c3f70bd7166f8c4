#include "utils/time_utils.hpp"

#include <cctype>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace ludoteca {

namespace {

constexpr int64_t kNanosecond = 1;
constexpr int64_t kMicrosecond = 1000 * kNanosecond;
constexpr int64_t kMillisecond = 1000 * kMicrosecond;
constexpr int64_t kSecond = 1000 * kMillisecond;
constexpr int64_t kMinute = 60 * kSecond;
constexpr int64_t kHour = 60 * kMinute;

bool unitScale(const std::string& unit, int64_t& scale) {
    if (unit == "ns") scale = kNanosecond;
    else if (unit == "us" || unit == "\xC2\xB5s") scale = kMicrosecond;
    else if (unit == "ms") scale = kMillisecond;
    else if (unit == "s") scale = kSecond;
    else if (unit == "m") scale = kMinute;
    else if (unit == "h") scale = kHour;
    else return false;
    return true;
}

// Renders value / 10^precision with trailing zeros of the fraction dropped.
std::string fixedFraction(int64_t value, int precision) {
    int64_t divisor = 1;
    for (int i = 0; i < precision; ++i) divisor *= 10;

    std::string out = std::to_string(value / divisor);
    int64_t frac = value % divisor;
    if (frac == 0) return out;

    std::string digits = std::to_string(frac);
    digits.insert(0, static_cast<size_t>(precision) - digits.size(), '0');
    while (!digits.empty() && digits.back() == '0') digits.pop_back();
    return out + "." + digits;
}

} // namespace

bool parseDuration(const std::string& text, std::chrono::nanoseconds& out) {
    size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }
    if (pos >= text.size()) return false;
    if (text.substr(pos) == "0") {
        out = std::chrono::nanoseconds(0);
        return true;
    }

    long double total = 0;
    while (pos < text.size()) {
        const size_t number_start = pos;
        while (pos < text.size() && (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) {
            ++pos;
        }
        if (pos == number_start) return false;
        const std::string number = text.substr(number_start, pos - number_start);
        if (number == "." || number.find('.') != number.rfind('.')) return false;

        const size_t unit_start = pos;
        while (pos < text.size() && !std::isdigit(static_cast<unsigned char>(text[pos])) && text[pos] != '.') {
            ++pos;
        }
        int64_t scale = 0;
        if (!unitScale(text.substr(unit_start, pos - unit_start), scale)) return false;

        long double value = 0;
        std::istringstream iss(number);
        iss >> value;
        if (iss.fail()) return false;
        total += value * static_cast<long double>(scale);
    }

    if (total > static_cast<long double>(std::numeric_limits<int64_t>::max())) return false;
    const int64_t ns = static_cast<int64_t>(total + 0.5L);
    out = std::chrono::nanoseconds(negative ? -ns : ns);
    return true;
}

std::string formatDuration(std::chrono::nanoseconds d) {
    int64_t ns = d.count();
    if (ns == 0) return "0s";

    std::string sign;
    if (ns < 0) {
        sign = "-";
        ns = -ns;
    }

    if (ns < kMicrosecond) return sign + std::to_string(ns) + "ns";
    if (ns < kMillisecond) return sign + fixedFraction(ns, 3) + "\xC2\xB5s";
    if (ns < kSecond) return sign + fixedFraction(ns, 6) + "ms";

    std::string out = sign;
    const int64_t hours = ns / kHour;
    ns %= kHour;
    const int64_t minutes = ns / kMinute;
    ns %= kMinute;
    if (hours > 0) out += std::to_string(hours) + "h";
    if (hours > 0 || minutes > 0) out += std::to_string(minutes) + "m";
    out += fixedFraction(ns, 9) + "s";
    return out;
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace ludoteca
