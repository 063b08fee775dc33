// Full PulseConfig builder — all available options with defaults.
//
//   cmake -B build -DPULSE_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/pulse_config

#include "pulse/pulse.hpp"
#include <chrono>
#include <iostream>

int main() {
    auto config = pulse::PulseConfig::builder("feed1e11feed1e11feed1e11feed1e11")
        .endpoint("ingest.pulse.dev:50000")                       // default: ingest.pulse.dev:50000
        .batch_size(100)                                          // default: 100 events per batch
        .flush_interval(std::chrono::milliseconds(10000))         // default: 10s between flushes
        .max_retries(3)                                           // default: 3 retry attempts
        .close_timeout(std::chrono::milliseconds(5000))           // default: 5s graceful shutdown
        .network_timeout(std::chrono::milliseconds(30000))        // default: 30s TCP timeout
        .anonymous_id("3f1c2b9e-0d4a-4c55-9e61-7a8b9c0d1e2f")     // default: generated per client
        .on_error([](const pulse::PulseError& e, bool fatal) {    // default: errors are silent
            std::cerr << "[Pulse] " << (fatal ? "fatal " : "") << e.what() << std::endl;
        })
        .build();

    auto client = pulse::Pulse::create(std::move(config));

    client->track("Test");
    client->close();
}
