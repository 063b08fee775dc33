// src/value.cpp
// Canonical value tree — construction, comparison, JSON rendering.

#include "pulse/value.hpp"

#include <cmath>
#include <cstdio>

namespace pulse {

const char* to_string(ValueType type) noexcept {
    switch (type) {
        case ValueType::Null:   return "null";
        case ValueType::Bool:   return "bool";
        case ValueType::Number: return "number";
        case ValueType::String: return "string";
        case ValueType::List:   return "list";
        case ValueType::Object: return "object";
    }
    return "unknown";
}

static inline bool needs_escape(char c) {
    return c == '"' || c == '\\' || static_cast<unsigned char>(c) < 0x20;
}

// Append a JSON string literal, bulk-copying runs that need no escaping.
static void append_quoted(std::string& out, const std::string& s) {
    out.push_back('"');
    size_t i = 0;
    while (i < s.size()) {
        size_t run_start = i;
        while (i < s.size() && !needs_escape(s[i])) ++i;
        if (i > run_start) {
            out.append(s, run_start, i - run_start);
        }
        if (i < s.size()) {
            char c = s[i];
            switch (c) {
                case '"':  out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\b': out += "\\b"; break;
                case '\f': out += "\\f"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default: {
                    char hex[7];
                    std::snprintf(hex, sizeof(hex), "\\u%04x", static_cast<unsigned char>(c));
                    out.append(hex, 6);
                    break;
                }
            }
            ++i;
        }
    }
    out.push_back('"');
}

static void append_double(std::string& out, double d) {
    // JSON has no NaN or Infinity.
    if (!std::isfinite(d)) {
        out += "null";
        return;
    }
    char tmp[32];
    int n = std::snprintf(tmp, sizeof(tmp), "%.17g", d);
    if (n > 0) out.append(tmp, static_cast<size_t>(n));
}

Value Value::list(List items) {
    Value v;
    v.data_ = std::make_shared<const List>(std::move(items));
    return v;
}

Value Value::object(Members members) {
    Members unique;
    unique.reserve(members.size());
    for (auto& m : members) {
        bool replaced = false;
        for (auto& existing : unique) {
            if (existing.first == m.first) {
                existing.second = std::move(m.second);
                replaced = true;
                break;
            }
        }
        if (!replaced) unique.push_back(std::move(m));
    }
    Value v;
    v.data_ = std::make_shared<const Members>(std::move(unique));
    return v;
}

ValueType Value::type() const noexcept {
    switch (data_.index()) {
        case 0: return ValueType::Null;
        case 1: return ValueType::Bool;
        case 2:
        case 3: return ValueType::Number;
        case 4: return ValueType::String;
        case 5: return ValueType::List;
        default: return ValueType::Object;
    }
}

double Value::as_double() const {
    if (auto* n = std::get_if<int64_t>(&data_)) return static_cast<double>(*n);
    return std::get<double>(data_);
}

const Value* Value::find(const std::string& key) const noexcept {
    auto* obj = std::get_if<ObjectPtr>(&data_);
    if (!obj) return nullptr;
    for (const auto& m : **obj) {
        if (m.first == key) return &m.second;
    }
    return nullptr;
}

size_t Value::size() const noexcept {
    if (auto* l = std::get_if<ListPtr>(&data_)) return (*l)->size();
    if (auto* o = std::get_if<ObjectPtr>(&data_)) return (*o)->size();
    return 0;
}

std::string Value::to_json() const {
    std::string out;
    out.reserve(64);
    write_json(out);
    return out;
}

void Value::write_json(std::string& out) const {
    switch (type()) {
        case ValueType::Null:
            out += "null";
            break;
        case ValueType::Bool:
            out += as_bool() ? "true" : "false";
            break;
        case ValueType::Number:
            if (is_int()) {
                out += std::to_string(as_int());
            } else {
                append_double(out, std::get<double>(data_));
            }
            break;
        case ValueType::String:
            append_quoted(out, as_string());
            break;
        case ValueType::List: {
            out.push_back('[');
            bool first = true;
            for (const auto& item : as_list()) {
                if (!first) out.push_back(',');
                first = false;
                item.write_json(out);
            }
            out.push_back(']');
            break;
        }
        case ValueType::Object: {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, value] : as_object()) {
                if (!first) out.push_back(',');
                first = false;
                append_quoted(out, key);
                out.push_back(':');
                value.write_json(out);
            }
            out.push_back('}');
            break;
        }
    }
}

// Objects compare as maps: same key set, equal values, order ignored.
bool operator==(const Value& a, const Value& b) {
    ValueType type = a.type();
    if (type != b.type()) return false;

    switch (type) {
        case ValueType::Null:
            return true;
        case ValueType::Bool:
            return a.as_bool() == b.as_bool();
        case ValueType::Number:
            if (a.is_int() && b.is_int()) return a.as_int() == b.as_int();
            return a.as_double() == b.as_double();
        case ValueType::String:
            return a.as_string() == b.as_string();
        case ValueType::List:
            return a.as_list() == b.as_list();
        case ValueType::Object: {
            const auto& am = a.as_object();
            if (am.size() != b.size()) return false;
            for (const auto& [key, value] : am) {
                const Value* other = b.find(key);
                if (!other || *other != value) return false;
            }
            return true;
        }
    }
    return false;
}

} // namespace pulse
