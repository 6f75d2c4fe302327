/**
 * Streaming JSON writer (header-only).
 *
 * Writes straight to an ostream. An indent of 0 produces compact output.
 * Optional values are written as null when empty; NaN and infinities
 * are written as null.
 *
 * Usage:
 *   JsonWriter w(std::cout);
 *   w.begin_object();
 *     w.kv("mission_id", "M-1");
 *     w.key("segments").begin_array();
 *       ...
 *     w.end_array();
 *   w.end_object();
 */

#ifndef COMMPLAN_IO_JSON_WRITER_HPP
#define COMMPLAN_IO_JSON_WRITER_HPP

#include <cmath>
#include <cstdio>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace commplan {

class JsonWriter {
public:
    explicit JsonWriter(std::ostream& os, int indent_size = 2)
        : os_(os), indent_size_(indent_size) {}

    // ── Structure ──

    JsonWriter& begin_object() { return open('{'); }
    JsonWriter& end_object()   { return close('}'); }
    JsonWriter& begin_array()  { return open('['); }
    JsonWriter& end_array()    { return close(']'); }

    // ── Keys ──

    JsonWriter& key(const std::string& k) {
        separate();
        os_ << '"';
        write_escaped(k);
        os_ << (indent_size_ > 0 ? "\": " : "\":");
        after_key_ = true;
        return *this;
    }

    // ── Values ──

    JsonWriter& value(const std::string& v) {
        begin_value();
        os_ << '"';
        write_escaped(v);
        os_ << '"';
        return *this;
    }

    JsonWriter& value(const char* v) { return value(std::string(v)); }

    JsonWriter& value(int v)         { begin_value(); os_ << v; return *this; }
    JsonWriter& value(long long v)   { begin_value(); os_ << v; return *this; }
    JsonWriter& value(std::size_t v) { begin_value(); os_ << v; return *this; }

    JsonWriter& value(double v) {
        begin_value();
        if (!std::isfinite(v)) {
            os_ << "null";
        } else {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.15g", v);
            os_ << buf;
        }
        return *this;
    }

    JsonWriter& value(bool v) {
        begin_value();
        os_ << (v ? "true" : "false");
        return *this;
    }

    template<typename T>
    JsonWriter& value(const std::optional<T>& v) {
        if (v) return value(*v);
        return null_value();
    }

    JsonWriter& null_value() {
        begin_value();
        os_ << "null";
        return *this;
    }

    template<typename T>
    JsonWriter& kv(const std::string& k, const T& v) {
        key(k);
        return value(v);
    }

    JsonWriter& string_array(const std::string& k, const std::vector<std::string>& items) {
        key(k).begin_array();
        for (const auto& s : items) value(s);
        return end_array();
    }

private:
    struct Scope {
        int count = 0;  // items written at this level
    };

    std::ostream& os_;
    int indent_size_;
    std::vector<Scope> stack_;
    bool after_key_ = false;

    JsonWriter& open(char c) {
        begin_value();
        os_ << c;
        stack_.push_back(Scope{});
        return *this;
    }

    JsonWriter& close(char c) {
        bool had_items = !stack_.empty() && stack_.back().count > 0;
        if (!stack_.empty()) stack_.pop_back();
        if (had_items) newline();
        os_ << c;
        return *this;
    }

    void begin_value() {
        if (after_key_) {
            after_key_ = false;
            return;
        }
        separate();
    }

    void separate() {
        if (stack_.empty()) return;
        auto& scope = stack_.back();
        if (scope.count > 0) os_ << ',';
        newline();
        scope.count++;
    }

    void newline() {
        if (indent_size_ <= 0) return;
        os_ << '\n';
        const std::size_t width = stack_.size() * static_cast<std::size_t>(indent_size_);
        for (std::size_t i = 0; i < width; i++) os_ << ' ';
    }

    void write_escaped(const std::string& s) {
        for (char c : s) {
            switch (c) {
                case '"':  os_ << "\\\""; break;
                case '\\': os_ << "\\\\"; break;
                case '\b': os_ << "\\b";  break;
                case '\f': os_ << "\\f";  break;
                case '\n': os_ << "\\n";  break;
                case '\r': os_ << "\\r";  break;
                case '\t': os_ << "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                        os_ << buf;
                    } else {
                        os_ << c;
                    }
                    break;
            }
        }
    }
};

} // namespace commplan

#endif // COMMPLAN_IO_JSON_WRITER_HPP
