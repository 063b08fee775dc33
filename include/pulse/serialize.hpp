// include/pulse/serialize.hpp
// Conversion of typed and untyped call-site payloads into Values.

#pragma once

#include "error.hpp"
#include "value.hpp"

#include <any>
#include <cmath>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace pulse {

// Untyped key/value payload. Supported contents: empty std::any (null),
// bool, any integral or floating type, std::string, const char*,
// std::nullptr_t, Value, Properties, std::vector<std::any>.
//
// Example:
//   Properties{{"url", std::string("/home")}, {"status", 200}}
using Properties = std::map<std::string, std::any>;

// Untyped conversion. Throws PulseError(Serialization) on unsupported
// contents or non-finite numbers.
Value serialize(const std::any& value);
Value serialize(const Properties& properties);

// --- Typed conversion ---
//
// Types from other namespaces take part by providing a `to_value`
// overload that ADL can find:
//
//   namespace shop {
//   struct Checkout { std::string sku; int quantity; };
//   pulse::Value to_value(const Checkout& c) {
//       return pulse::Value::object({{"sku", c.sku}, {"quantity", c.quantity}});
//   }
//   }

template <typename T>
Value to_value(const std::vector<T>& items);
template <typename T>
Value to_value(const std::map<std::string, T>& members);
template <typename T>
Value to_value(const std::optional<T>& value);

inline Value to_value(const Value& value) { return value; }
inline Value to_value(std::nullptr_t) { return Value(); }
inline Value to_value(bool b) { return Value(b); }
inline Value to_value(const std::string& s) { return Value(s); }
inline Value to_value(const char* s) { return Value(s); }
inline Value to_value(const std::any& value) { return serialize(value); }

template <typename T,
          typename std::enable_if<std::is_integral<T>::value &&
                                  !std::is_same<T, bool>::value, int>::type = 0>
Value to_value(T n) {
    return Value(n);
}

inline Value to_value(double d) {
    if (!std::isfinite(d)) {
        throw PulseError::serialization("non-finite number cannot be represented");
    }
    return Value(d);
}

inline Value to_value(float f) { return to_value(static_cast<double>(f)); }

template <typename T>
Value to_value(const std::vector<T>& items) {
    List list;
    list.reserve(items.size());
    for (const auto& item : items) {
        list.push_back(to_value(item));
    }
    return Value::list(std::move(list));
}

template <typename T>
Value to_value(const std::map<std::string, T>& members) {
    Members out;
    out.reserve(members.size());
    for (const auto& [key, value] : members) {
        out.emplace_back(key, to_value(value));
    }
    return Value::object(std::move(out));
}

template <typename T>
Value to_value(const std::optional<T>& value) {
    if (!value) return Value();
    return to_value(*value);
}

} // namespace pulse
