/**
 * JSON document model and recursive-descent reader.
 *
 * Object members are kept in key order so that iteration over catalog or
 * coverage entries is deterministic. Parse errors carry line and column.
 *
 * Usage:
 *   auto root = JsonReader::parse_file("mission.json");
 *   std::string id = root["id"].get_string("");
 *   auto dep = root["timing"]["departure_time"].get_optional_string();
 */

#ifndef COMMPLAN_IO_JSON_READER_HPP
#define COMMPLAN_IO_JSON_READER_HPP

#include "core/errors.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace commplan {

/// Malformed JSON text or an unreadable JSON file
class JsonError : public ConfigurationError {
public:
    explicit JsonError(const std::string& msg) : ConfigurationError(msg) {}
};

enum class JsonType {
    NIL,
    BOOL,
    NUMBER,
    STRING,
    OBJECT,
    ARRAY
};

class JsonValue {
public:
    using Object = std::map<std::string, JsonValue>;
    using Array = std::vector<JsonValue>;

    JsonValue() = default;
    explicit JsonValue(bool v) : type_(JsonType::BOOL), bool_val_(v) {}
    explicit JsonValue(double v) : type_(JsonType::NUMBER), num_val_(v) {}
    explicit JsonValue(std::string v) : type_(JsonType::STRING), str_val_(std::move(v)) {}
    explicit JsonValue(const char* v) : type_(JsonType::STRING), str_val_(v) {}

    static JsonValue make_object() { JsonValue v; v.type_ = JsonType::OBJECT; return v; }
    static JsonValue make_array()  { JsonValue v; v.type_ = JsonType::ARRAY; return v; }

    JsonType type() const { return type_; }

    bool is_null()   const { return type_ == JsonType::NIL; }
    bool is_bool()   const { return type_ == JsonType::BOOL; }
    bool is_number() const { return type_ == JsonType::NUMBER; }
    bool is_string() const { return type_ == JsonType::STRING; }
    bool is_object() const { return type_ == JsonType::OBJECT; }
    bool is_array()  const { return type_ == JsonType::ARRAY; }

    // Strict accessors (throw JsonError on type mismatch)
    bool as_bool() const;
    double as_number() const;
    int as_int() const { return static_cast<int>(as_number()); }
    const std::string& as_string() const;
    const Object& as_object() const;
    const Array& as_array() const;

    // Lenient accessors (default on missing or mismatched type)
    bool get_bool(bool def = false) const { return is_bool() ? bool_val_ : def; }
    double get_number(double def = 0.0) const { return is_number() ? num_val_ : def; }
    int get_int(int def = 0) const { return is_number() ? static_cast<int>(num_val_) : def; }
    std::string get_string(const std::string& def = "") const { return is_string() ? str_val_ : def; }

    std::optional<double> get_optional_number() const {
        if (is_number()) return num_val_;
        return std::nullopt;
    }
    std::optional<std::string> get_optional_string() const {
        if (is_string() && !str_val_.empty()) return str_val_;
        return std::nullopt;
    }

    /// Member lookup; a missing key or a non-object yields a shared null value
    const JsonValue& operator[](const std::string& key) const;
    /// Element lookup; out of range or a non-array yields a shared null value
    const JsonValue& operator[](std::size_t index) const;

    bool has(const std::string& key) const;
    std::size_t size() const;

    void add_member(const std::string& key, JsonValue&& val);
    void add_element(JsonValue&& val);

private:
    JsonType type_ = JsonType::NIL;
    bool bool_val_ = false;
    double num_val_ = 0.0;
    std::string str_val_;
    Object obj_val_;
    Array arr_val_;

    static const JsonValue& null_value();
};

class JsonReader {
public:
    /**
     * Parse a JSON document. Trailing non-whitespace is rejected.
     * @throws JsonError on parse errors
     */
    static JsonValue parse(const std::string& json);

    /**
     * Parse a JSON file.
     * @throws JsonError if the file cannot be read or does not parse
     */
    static JsonValue parse_file(const std::string& filename);
};

} // namespace commplan

#endif // COMMPLAN_IO_JSON_READER_HPP
