#include "utils/json_writer.hpp"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <limits>

namespace ludoteca {

JsonWriter& JsonWriter::beginObject() {
    separate();
    out_ << "{";
    first_.push_back(true);
    return *this;
}

JsonWriter& JsonWriter::endObject() {
    out_ << "}";
    if (!first_.empty()) first_.pop_back();
    return *this;
}

JsonWriter& JsonWriter::beginArray() {
    separate();
    out_ << "[";
    first_.push_back(true);
    return *this;
}

JsonWriter& JsonWriter::endArray() {
    out_ << "]";
    if (!first_.empty()) first_.pop_back();
    return *this;
}

JsonWriter& JsonWriter::key(const std::string& name) {
    separate();
    out_ << "\"" << escapeJson(name) << "\":";
    after_key_ = true;
    return *this;
}

JsonWriter& JsonWriter::value(const std::string& text) {
    separate();
    out_ << "\"" << escapeJson(text) << "\"";
    return *this;
}

JsonWriter& JsonWriter::value(const char* text) {
    return value(std::string(text ? text : ""));
}

JsonWriter& JsonWriter::value(bool flag) {
    separate();
    out_ << (flag ? "true" : "false");
    return *this;
}

JsonWriter& JsonWriter::value(int number) {
    separate();
    out_ << number;
    return *this;
}

JsonWriter& JsonWriter::value(double number) {
    separate();
    if (!std::isfinite(number)) {
        out_ << "null";
        return *this;
    }
    std::ostringstream formatted;
    formatted << std::setprecision(std::numeric_limits<double>::digits10) << number;
    out_ << formatted.str();
    return *this;
}

std::string JsonWriter::str() const {
    return out_.str();
}

void JsonWriter::separate() {
    if (after_key_) {
        after_key_ = false;
        return;
    }
    if (first_.empty()) return;
    if (first_.back()) {
        first_.back() = false;
    } else {
        out_ << ",";
    }
}

std::string JsonWriter::escapeJson(const std::string& str) {
    std::string result;
    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char escaped[8];
                    std::snprintf(escaped, sizeof(escaped), "\\u%04x", static_cast<unsigned char>(c));
                    result += escaped;
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

} // namespace ludoteca
