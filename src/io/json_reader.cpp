#include "io/json_reader.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace commplan {

// ═══════════════════════════════════════════════════════════════
// JsonValue
// ═══════════════════════════════════════════════════════════════

namespace {

const char* type_name(JsonType t) {
    switch (t) {
        case JsonType::NIL:    return "null";
        case JsonType::BOOL:   return "bool";
        case JsonType::NUMBER: return "number";
        case JsonType::STRING: return "string";
        case JsonType::OBJECT: return "object";
        case JsonType::ARRAY:  return "array";
    }
    return "?";
}

JsonError mismatch(const char* wanted, JsonType got) {
    return JsonError(std::string("JsonValue: expected ") + wanted + ", found " + type_name(got));
}

} // anonymous namespace

bool JsonValue::as_bool() const {
    if (type_ != JsonType::BOOL) throw mismatch("bool", type_);
    return bool_val_;
}

double JsonValue::as_number() const {
    if (type_ != JsonType::NUMBER) throw mismatch("number", type_);
    return num_val_;
}

const std::string& JsonValue::as_string() const {
    if (type_ != JsonType::STRING) throw mismatch("string", type_);
    return str_val_;
}

const JsonValue::Object& JsonValue::as_object() const {
    if (type_ != JsonType::OBJECT) throw mismatch("object", type_);
    return obj_val_;
}

const JsonValue::Array& JsonValue::as_array() const {
    if (type_ != JsonType::ARRAY) throw mismatch("array", type_);
    return arr_val_;
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    if (type_ != JsonType::OBJECT) return null_value();
    auto it = obj_val_.find(key);
    if (it == obj_val_.end()) return null_value();
    return it->second;
}

const JsonValue& JsonValue::operator[](std::size_t index) const {
    if (type_ != JsonType::ARRAY || index >= arr_val_.size()) return null_value();
    return arr_val_[index];
}

bool JsonValue::has(const std::string& key) const {
    return type_ == JsonType::OBJECT && obj_val_.count(key) > 0;
}

std::size_t JsonValue::size() const {
    if (type_ == JsonType::ARRAY) return arr_val_.size();
    if (type_ == JsonType::OBJECT) return obj_val_.size();
    return 0;
}

void JsonValue::add_member(const std::string& key, JsonValue&& val) {
    obj_val_[key] = std::move(val);
}

void JsonValue::add_element(JsonValue&& val) {
    arr_val_.push_back(std::move(val));
}

const JsonValue& JsonValue::null_value() {
    static const JsonValue nil;
    return nil;
}

// ═══════════════════════════════════════════════════════════════
// Parser internals
// ═══════════════════════════════════════════════════════════════

namespace {

class Parser {
public:
    explicit Parser(const std::string& input) : src_(input) {}

    JsonValue parse_document() {
        skip_whitespace();
        JsonValue val = parse_value(0);
        skip_whitespace();
        if (pos_ < src_.size()) {
            throw error("Trailing characters after document");
        }
        return val;
    }

private:
    static constexpr int MAX_DEPTH = 256;

    const std::string& src_;
    std::size_t pos_ = 0;

    char peek() const {
        return pos_ < src_.size() ? src_[pos_] : '\0';
    }

    char advance() {
        if (pos_ >= src_.size()) throw error("Unexpected end of input");
        return src_[pos_++];
    }

    void expect(char c) {
        char got = advance();
        if (got != c) {
            throw error(std::string("Expected '") + c + "', got '" + got + "'");
        }
    }

    void skip_whitespace() {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) {
            pos_++;
        }
    }

    JsonError error(const std::string& msg) const {
        std::size_t line = 1;
        std::size_t col = 1;
        for (std::size_t i = 0; i < pos_ && i < src_.size(); ++i) {
            if (src_[i] == '\n') { line++; col = 1; } else { col++; }
        }
        return JsonError("JSON parse error at line " + std::to_string(line) +
                         ", column " + std::to_string(col) + ": " + msg);
    }

    JsonValue parse_value(int depth) {
        if (depth > MAX_DEPTH) throw error("Nesting too deep");
        skip_whitespace();
        char c = peek();

        if (c == '"') return JsonValue(parse_string());
        if (c == '{') return parse_object(depth);
        if (c == '[') return parse_array(depth);
        if (c == 't' || c == 'f') return parse_bool();
        if (c == 'n') return parse_null();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();
        if (c == '\0') throw error("Unexpected end of input");

        throw error(std::string("Unexpected character '") + c + "'");
    }

    static void append_utf8(std::string& out, unsigned long code) {
        if (code < 0x80) {
            out += static_cast<char>(code);
        } else if (code < 0x800) {
            out += static_cast<char>(0xC0 | (code >> 6));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else if (code < 0x10000) {
            out += static_cast<char>(0xE0 | (code >> 12));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (code >> 18));
            out += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        }
    }

    unsigned long parse_hex4() {
        if (pos_ + 4 > src_.size()) throw error("Incomplete \\u escape");
        unsigned long code = 0;
        for (int i = 0; i < 4; ++i) {
            char h = src_[pos_++];
            code <<= 4;
            if (h >= '0' && h <= '9')      code |= static_cast<unsigned long>(h - '0');
            else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned long>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned long>(h - 'A' + 10);
            else throw error("Invalid hex digit in \\u escape");
        }
        return code;
    }

    std::string parse_string() {
        expect('"');
        std::string result;
        while (true) {
            if (pos_ >= src_.size()) throw error("Unterminated string");
            char c = src_[pos_++];

            if (c == '"') break;
            if (c != '\\') {
                result += c;
                continue;
            }

            char esc = advance();
            switch (esc) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u': {
                    unsigned long code = parse_hex4();
                    // Surrogate pair
                    if (code >= 0xD800 && code <= 0xDBFF &&
                        src_.compare(pos_, 2, "\\u") == 0) {
                        pos_ += 2;
                        unsigned long low = parse_hex4();
                        if (low < 0xDC00 || low > 0xDFFF) throw error("Invalid surrogate pair");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    }
                    append_utf8(result, code);
                    break;
                }
                default:
                    throw error(std::string("Unknown escape \\") + esc);
            }
        }
        return result;
    }

    void consume_digits(const char* what) {
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            throw error(std::string("Expected digit ") + what);
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) pos_++;
    }

    JsonValue parse_number() {
        std::size_t start = pos_;
        if (peek() == '-') pos_++;

        if (peek() == '0') {
            pos_++;
        } else {
            consume_digits("in number");
        }
        if (peek() == '.') {
            pos_++;
            consume_digits("after decimal point");
        }
        if (peek() == 'e' || peek() == 'E') {
            pos_++;
            if (peek() == '+' || peek() == '-') pos_++;
            consume_digits("in exponent");
        }

        std::string numstr = src_.substr(start, pos_ - start);
        return JsonValue(std::strtod(numstr.c_str(), nullptr));
    }

    JsonValue parse_bool() {
        if (src_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            return JsonValue(true);
        }
        if (src_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return JsonValue(false);
        }
        throw error("Expected 'true' or 'false'");
    }

    JsonValue parse_null() {
        if (src_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return JsonValue();
        }
        throw error("Expected 'null'");
    }

    JsonValue parse_object(int depth) {
        expect('{');
        JsonValue obj = JsonValue::make_object();

        skip_whitespace();
        if (peek() == '}') {
            pos_++;
            return obj;
        }

        while (true) {
            skip_whitespace();
            std::string key = parse_string();
            skip_whitespace();
            expect(':');
            obj.add_member(key, parse_value(depth + 1));

            skip_whitespace();
            if (peek() != ',') break;
            pos_++;
        }

        skip_whitespace();
        expect('}');
        return obj;
    }

    JsonValue parse_array(int depth) {
        expect('[');
        JsonValue arr = JsonValue::make_array();

        skip_whitespace();
        if (peek() == ']') {
            pos_++;
            return arr;
        }

        while (true) {
            arr.add_element(parse_value(depth + 1));
            skip_whitespace();
            if (peek() != ',') break;
            pos_++;
        }

        skip_whitespace();
        expect(']');
        return arr;
    }
};

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════

JsonValue JsonReader::parse(const std::string& json) {
    Parser parser(json);
    return parser.parse_document();
}

JsonValue JsonReader::parse_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw JsonError("Cannot open JSON file: " + filename);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    try {
        return parse(ss.str());
    } catch (const JsonError& e) {
        throw JsonError(filename + ": " + e.what());
    }
}

} // namespace commplan
