#ifndef LUDOTECA_JSON_WRITER_HPP
#define LUDOTECA_JSON_WRITER_HPP

#include <sstream>
#include <string>
#include <vector>

namespace ludoteca {

/**
 * Compact JSON writer keeping value types: strings are quoted, numbers and
 * booleans are not, and an empty object or array stays "{}" / "[]".
 *
 *   JsonWriter json;
 *   json.beginObject().key("total").value(3).endObject();
 *   json.str();  // {"total":3}
 */
class JsonWriter {
public:
    JsonWriter& beginObject();
    JsonWriter& endObject();
    JsonWriter& beginArray();
    JsonWriter& endArray();

    JsonWriter& key(const std::string& name);

    JsonWriter& value(const std::string& text);
    JsonWriter& value(const char* text);
    JsonWriter& value(bool flag);
    JsonWriter& value(int number);
    // Non-finite numbers are written as null.
    JsonWriter& value(double number);

    std::string str() const;

    static std::string escapeJson(const std::string& str);

private:
    void separate();

    std::ostringstream out_;
    // One entry per open container: true until its first element is written.
    std::vector<bool> first_;
    bool after_key_ = false;
};

} // namespace ludoteca

#endif // LUDOTECA_JSON_WRITER_HPP
