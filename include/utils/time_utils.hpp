#ifndef LUDOTECA_TIME_UTILS_HPP
#define LUDOTECA_TIME_UTILS_HPP

#include <chrono>
#include <string>

namespace ludoteca {

// Parses "24h", "90m", "1h30m", "1.5s", "250ms", "10us", "5ns".
// Returns false on malformed input or a missing unit.
bool parseDuration(const std::string& text, std::chrono::nanoseconds& out);

// "0s", "750ns", "1.5µs", "12.345ms", "1.5s", "2m0s", "1h2m3.5s".
std::string formatDuration(std::chrono::nanoseconds d);

// RFC 3339 in UTC with second precision, e.g. "2024-05-01T12:00:00Z".
std::string formatTimestamp(std::chrono::system_clock::time_point tp);

} // namespace ludoteca

#endif // LUDOTECA_TIME_UTILS_HPP
