#include "utils/env_config.hpp"
#include "utils/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace ludoteca {

namespace {

const char* lookup(const char* key) {
    const char* value = std::getenv(key);
    if (!value || *value == '\0') return nullptr;
    return value;
}

} // namespace

bool parseBool(const std::string& text, bool& value) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        value = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        value = false;
        return true;
    }
    return false;
}

std::string getEnvString(const char* key, const std::string& default_value) {
    const char* value = lookup(key);
    return value ? std::string(value) : default_value;
}

bool getEnvBool(const char* key, bool default_value) {
    const char* value = lookup(key);
    if (!value) return default_value;

    bool result = default_value;
    if (!parseBool(value, result)) {
        throw std::invalid_argument(std::string("invalid boolean for ") + key + ": " + value);
    }
    return result;
}

std::chrono::milliseconds getEnvDuration(const char* key, std::chrono::milliseconds default_value) {
    const char* value = lookup(key);
    if (!value) return default_value;

    std::chrono::nanoseconds parsed{0};
    if (!parseDuration(value, parsed)) {
        throw std::invalid_argument(std::string("invalid duration for ") + key + ": " + value);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(parsed);
}

} // namespace ludoteca
