// src/serialize.cpp
// Untyped payload conversion.

#include "pulse/serialize.hpp"

#include <cstdint>
#include <typeinfo>

namespace pulse {

namespace {

template <typename T>
bool try_number(const std::any& value, Value& out) {
    if (const T* n = std::any_cast<T>(&value)) {
        out = to_value(*n);
        return true;
    }
    return false;
}

template <typename... Ts>
bool try_numbers(const std::any& value, Value& out) {
    return (try_number<Ts>(value, out) || ...);
}

std::string join_path(const std::string& path, const std::string& key) {
    return path.empty() ? key : path + "." + key;
}

Value convert(const std::any& value, const std::string& path);

Value convert_properties(const Properties& properties, const std::string& path) {
    Members members;
    members.reserve(properties.size());
    for (const auto& [key, value] : properties) {
        members.emplace_back(key, convert(value, join_path(path, key)));
    }
    return Value::object(std::move(members));
}

Value convert(const std::any& value, const std::string& path) {
    if (!value.has_value()) return Value();

    if (const auto* b = std::any_cast<bool>(&value)) return Value(*b);
    if (const auto* s = std::any_cast<std::string>(&value)) return Value(*s);
    if (const auto* s = std::any_cast<const char*>(&value)) {
        if (*s == nullptr) return Value();
        return Value(*s);
    }
    if (std::any_cast<std::nullptr_t>(&value)) return Value();
    if (const auto* v = std::any_cast<Value>(&value)) return *v;
    if (const auto* p = std::any_cast<Properties>(&value)) return convert_properties(*p, path);

    if (const auto* items = std::any_cast<std::vector<std::any>>(&value)) {
        List list;
        list.reserve(items->size());
        for (size_t i = 0; i < items->size(); i++) {
            list.push_back(convert((*items)[i], path + "[" + std::to_string(i) + "]"));
        }
        return Value::list(std::move(list));
    }

    Value number;
    try {
        if (try_numbers<int, long, long long, unsigned, unsigned long, unsigned long long,
                        short, unsigned short, signed char, unsigned char, char,
                        double, float>(value, number)) {
            return number;
        }
    } catch (const PulseError&) {
        throw PulseError::serialization("non-finite number at '" + path + "'");
    }

    throw PulseError::serialization(
        std::string("unsupported value type '") + value.type().name() + "' at '" + path + "'");
}

} // namespace

Value serialize(const std::any& value) {
    return convert(value, "");
}

Value serialize(const Properties& properties) {
    return convert_properties(properties, "");
}

} // namespace pulse
