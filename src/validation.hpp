// src/validation.hpp
// Internal input validation functions.

#pragma once

#include "pulse/error.hpp"
#include "pulse/value.hpp"
#include <array>
#include <optional>
#include <string>

namespace pulse {
namespace validation {

inline int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Decode the 32-character hex write key to its 16 bytes.
inline std::array<uint8_t, 16> validate_and_decode_api_key(const std::string& api_key) {
    std::array<uint8_t, 16> key{};
    if (api_key.size() != key.size() * 2) {
        throw PulseError::configuration(
            "apiKey must be 32 hex characters, got " + std::to_string(api_key.size()));
    }

    for (size_t i = 0; i < api_key.size(); i++) {
        int nibble = hex_digit(api_key[i]);
        if (nibble < 0) {
            throw PulseError::configuration(
                std::string("apiKey contains non-hex character '") + api_key[i] + "'");
        }
        key[i / 2] = static_cast<uint8_t>((key[i / 2] << 4) | nibble);
    }
    return key;
}

inline bool check_event_name(const std::string& name) {
    return !name.empty();
}

inline bool check_group_id(const std::string& group_id) {
    return !group_id.empty();
}

inline bool check_alias_id(const std::string& new_id) {
    return !new_id.empty();
}

// Payloads (properties, traits) are either absent or an object.
inline bool check_payload(const std::optional<Value>& payload) {
    return !payload || payload->is_object();
}

// Throw InvalidEvent unless `payload` is absent or an object.
inline void require_payload(const char* field, const std::optional<Value>& payload) {
    if (!check_payload(payload)) {
        throw PulseError::invalid_event(field,
            std::string("must be an object, got ") + to_string(payload->type()));
    }
}

} // namespace validation
} // namespace pulse
