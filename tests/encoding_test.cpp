// tests/encoding_test.cpp
// Unit tests for JSON batch encoding.

#include <gtest/gtest.h>
#include "encoding.hpp"

#include <string>
#include <vector>

using namespace pulse;
using namespace pulse::encoding;

namespace {

const uint8_t KEY[16] = {0xa1, 0xb2, 0xc3, 0xd4, 0xe5, 0xf6, 0x07, 0x18,
                         0x29, 0x3a, 0x4b, 0x5c, 0x6d, 0x7e, 0x8f, 0x90};

Envelope make_envelope(const std::string& id) {
    Envelope env;
    env.message_id = id;
    env.timestamp = 1706000000000;
    env.anonymous_id = "anon";
    return env;
}

std::string as_string(const std::vector<uint8_t>& buf, size_t start = 0) {
    return std::string(buf.begin() + static_cast<std::ptrdiff_t>(start), buf.end());
}

} // namespace

TEST(EncodingTest, HexWriteKey) {
    std::string out;
    append_hex(out, KEY, sizeof(KEY));
    EXPECT_EQ(out, "a1b2c3d4e5f60718293a4b5c6d7e8f90");
}

TEST(EncodingTest, EmptyBatch) {
    BatchParams params;
    params.api_key = KEY;
    params.batch_id = 7;
    params.sent_at = 1706000000000;

    EXPECT_EQ(as_string(encode_batch(params)),
        R"({"batchId":7,"writeKey":"a1b2c3d4e5f60718293a4b5c6d7e8f90",)"
        R"("sentAt":"2024-01-23T08:53:20.000Z","batch":[]})");
}

TEST(EncodingTest, EventsInOrder) {
    std::vector<Event> events;
    events.emplace_back(TrackEvent(make_envelope("m1"), "First"));
    events.emplace_back(AliasEvent(make_envelope("m2"), "u2", "u1"));

    BatchParams params;
    params.api_key = KEY;
    params.batch_id = 1;
    params.events = events.data();
    params.event_count = events.size();

    std::string json = as_string(encode_batch(params));
    std::string first = to_value(events[0]).to_json();
    std::string second = to_value(events[1]).to_json();

    EXPECT_NE(json.find("\"batch\":[" + first + "," + second + "]}"), std::string::npos);
}

TEST(EncodingTest, AppendsAfterExistingBytes) {
    std::vector<uint8_t> buf = {'x', 'y'};
    BatchParams params;
    params.api_key = KEY;

    size_t start = encode_batch_into(buf, params);
    EXPECT_EQ(start, 2u);
    EXPECT_EQ(buf[start], '{');
    EXPECT_EQ(buf.back(), '}');
}

TEST(EncodingTest, MissingKeyEncodesEmpty) {
    BatchParams params;
    std::string json = as_string(encode_batch(params));
    EXPECT_NE(json.find("\"writeKey\":\"\""), std::string::npos);
}
