#ifndef LUDOTECA_ENV_CONFIG_HPP
#define LUDOTECA_ENV_CONFIG_HPP

#include <chrono>
#include <string>

namespace ludoteca {

// Environment readers. An unset or empty variable yields the default;
// a set but malformed one throws std::invalid_argument naming the variable.
std::string getEnvString(const char* key, const std::string& default_value);
bool getEnvBool(const char* key, bool default_value);
std::chrono::milliseconds getEnvDuration(const char* key, std::chrono::milliseconds default_value);

bool parseBool(const std::string& text, bool& value);

} // namespace ludoteca

#endif // LUDOTECA_ENV_CONFIG_HPP
