// bench/bench_common.hpp
// Shared benchmark scenarios and event builders.

#pragma once

#include "pulse/event.hpp"
#include "pulse/value.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pulse_bench {

struct BenchScenario {
    const char* name;
    size_t events_per_batch;
    size_t payload_size;

    size_t total_bytes() const { return events_per_batch * payload_size; }
};

constexpr BenchScenario SCENARIOS[] = {
    {"realtime_small", 10, 100},
    {"typical", 100, 200},
    {"high_volume", 500, 200},
    {"large_events", 100, 1000},
};

constexpr size_t SCENARIO_COUNT = sizeof(SCENARIOS) / sizeof(SCENARIOS[0]);

// Properties object whose JSON form is roughly `size` bytes.
inline pulse::Value generate_properties(size_t size) {
    pulse::Members members = {
        {"url", "/dashboard/analytics/overview"},
        {"screen_width", 1920},
        {"returning", true},
    };
    std::string base = pulse::Value::object(members).to_json();
    if (base.size() + 10 < size) {
        members.emplace_back("data", std::string(size - base.size() - 10, 'x'));
    }
    return pulse::Value::object(std::move(members));
}

inline pulse::Event make_track(size_t payload_size) {
    pulse::Envelope env;
    env.message_id = "0b6f2a7c-3d4e-4f5a-8b9c-0d1e2f3a4b5c";
    env.timestamp = 1700000000000;
    env.anonymous_id = "5e6f7a8b-9c0d-4e1f-a2b3-c4d5e6f7a8b9";
    env.user_id = "user_bench_123";
    return pulse::TrackEvent(env, "Page Viewed", generate_properties(payload_size));
}

inline std::vector<pulse::Event> make_batch(size_t count, size_t payload_size) {
    std::vector<pulse::Event> events;
    events.reserve(count);
    for (size_t i = 0; i < count; i++) {
        events.push_back(make_track(payload_size));
    }
    return events;
}

} // namespace pulse_bench
