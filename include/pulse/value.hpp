// include/pulse/value.hpp
// Canonical value tree — immutable, JSON-like, structurally comparable.

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace pulse {

class Value;

using List = std::vector<Value>;
using Member = std::pair<std::string, Value>;
using Members = std::vector<Member>;

enum class ValueType : uint8_t {
    Null   = 0,
    Bool   = 1,
    Number = 2,
    String = 3,
    List   = 4,
    Object = 5,
};

const char* to_string(ValueType type) noexcept;

// Normalized representation of every payload and trait set.
//
// Lists and objects are held behind shared_ptr<const ...>, so copying a
// Value is cheap and a constructed Value can never change. Object keys are
// unique and keep their insertion order.
//
// Example:
//   auto v = Value::object({{"plan", "pro"}, {"seats", 12}});
//   v.find("plan")->as_string();  // "pro"
class Value {
public:
    Value() noexcept = default;
    Value(std::nullptr_t) noexcept {}
    Value(bool b) noexcept : data_(b) {}
    Value(double d) noexcept : data_(d) {}
    Value(float f) noexcept : data_(static_cast<double>(f)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(const char* s) : data_(std::string(s)) {}

    template <typename T,
              typename std::enable_if<std::is_integral<T>::value &&
                                      !std::is_same<T, bool>::value, int>::type = 0>
    Value(T n) noexcept {
        if constexpr (std::is_unsigned<T>::value && sizeof(T) >= sizeof(int64_t)) {
            if (n > static_cast<T>(std::numeric_limits<int64_t>::max())) {
                data_ = static_cast<double>(n);
                return;
            }
        }
        data_ = static_cast<int64_t>(n);
    }

    // Build a list value.
    static Value list(List items);

    // Build an object value. A repeated key keeps its first position and
    // takes the last value.
    static Value object(Members members);

    ValueType type() const noexcept;

    bool is_null() const noexcept { return std::holds_alternative<std::nullptr_t>(data_); }
    bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }
    bool is_number() const noexcept { return is_int() || std::holds_alternative<double>(data_); }
    bool is_int() const noexcept { return std::holds_alternative<int64_t>(data_); }
    bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
    bool is_list() const noexcept { return std::holds_alternative<ListPtr>(data_); }
    bool is_object() const noexcept { return std::holds_alternative<ObjectPtr>(data_); }

    // Typed accessors throw std::bad_variant_access on a type mismatch.
    bool as_bool() const { return std::get<bool>(data_); }
    int64_t as_int() const { return std::get<int64_t>(data_); }
    double as_double() const;
    const std::string& as_string() const { return std::get<std::string>(data_); }
    const List& as_list() const { return *std::get<ListPtr>(data_); }
    const Members& as_object() const { return *std::get<ObjectPtr>(data_); }

    // Look up an object member. Returns nullptr for a missing key or a
    // non-object value.
    const Value* find(const std::string& key) const noexcept;

    // Element count for lists and objects, 0 otherwise.
    size_t size() const noexcept;

    // Compact JSON rendering.
    std::string to_json() const;
    void write_json(std::string& out) const;

    friend bool operator==(const Value& a, const Value& b);
    friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

private:
    using ListPtr = std::shared_ptr<const List>;
    using ObjectPtr = std::shared_ptr<const Members>;

    std::variant<std::nullptr_t, bool, int64_t, double, std::string, ListPtr, ObjectPtr>
        data_{nullptr};
};

} // namespace pulse
