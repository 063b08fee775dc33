// src/encoding.hpp
// Batch encoding — events rendered as one JSON document per frame.

#pragma once

#include "clock.hpp"
#include "pulse/event.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace pulse {
namespace encoding {

static constexpr size_t API_KEY_LENGTH = 16;

struct BatchParams {
    const uint8_t* api_key = nullptr;       // API_KEY_LENGTH bytes
    uint64_t batch_id = 0;
    uint64_t sent_at = 0;                   // ms since epoch
    const Event* events = nullptr;
    size_t event_count = 0;
};

inline void append_hex(std::string& out, const uint8_t* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    for (size_t i = 0; i < len; i++) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
}

// Encode:
//   {"batchId":N,"writeKey":"<hex>","sentAt":"<iso-8601>","batch":[<event>,...]}
// Returns the offset in `buf` where the document starts.
inline size_t encode_batch_into(std::vector<uint8_t>& buf, const BatchParams& params) {
    std::string out;
    out.reserve(128 + params.event_count * 256);

    out += "{\"batchId\":";
    out += std::to_string(params.batch_id);

    out += ",\"writeKey\":\"";
    if (params.api_key) append_hex(out, params.api_key, API_KEY_LENGTH);
    out += "\"";

    out += ",\"sentAt\":\"";
    out += format_iso8601(params.sent_at);
    out += "\"";

    out += ",\"batch\":[";
    for (size_t i = 0; i < params.event_count; i++) {
        if (i > 0) out.push_back(',');
        to_value(params.events[i]).write_json(out);
    }
    out += "]}";

    size_t start = buf.size();
    buf.insert(buf.end(), out.begin(), out.end());
    return start;
}

// Convenience wrapper returning a fresh buffer.
inline std::vector<uint8_t> encode_batch(const BatchParams& params) {
    std::vector<uint8_t> buf;
    encode_batch_into(buf, params);
    return buf;
}

} // namespace encoding
} // namespace pulse
