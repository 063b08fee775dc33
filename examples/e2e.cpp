// examples/e2e.cpp
// End-to-end smoke test — sends every API method to a real collector.
//
// Start your Pulse collector, then:
//
//   cmake -B build -DPULSE_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/pulse_e2e
//
// Override endpoint:
//
//   PULSE_ENDPOINT=ingest.pulse.dev:50000 ./build/pulse_e2e
//
// Then verify on the collector that all events arrived.

#include "pulse/pulse.hpp"
#include <cstdlib>
#include <iostream>
#include <string>

static const char* API_KEY = "feed1e11feed1e11feed1e11feed1e11";
static const char* USER    = "e2e_user_cpp";

namespace e2e {

struct Plan {
    std::string name;
    int seats = 0;
    bool annual = false;
};

pulse::Value to_value(const Plan& p) {
    return pulse::Value::object({{"plan", p.name}, {"seats", p.seats}, {"annual", p.annual}});
}

} // namespace e2e

static void send(const char* label) {
    std::cout << "  -> " << label << std::endl;
}

int main() {
    std::string endpoint = "localhost:50000";
    if (const char* env = std::getenv("PULSE_ENDPOINT")) {
        endpoint = env;
    }

    std::cout << std::endl;
    std::cout << "  Pulse C++ SDK — E2E smoke test" << std::endl;
    std::cout << "  Endpoint: " << endpoint << std::endl;
    std::cout << std::endl;

    int calls = 0;
    try {
        auto client = pulse::Pulse::create(
            pulse::PulseConfig::builder(API_KEY)
                .endpoint(endpoint)
                .batch_size(10)
                .enrichment([](pulse::Event event, pulse::Pulse&) -> std::optional<pulse::Event> {
                    if (auto* t = std::get_if<pulse::TrackEvent>(&event)) {
                        if (!t->properties()) {
                            return t->with_properties(pulse::Value::object({{"sdk", "cpp"}}));
                        }
                    }
                    return event;
                })
                .on_error([](const pulse::PulseError& err, bool fatal) {
                    std::cerr << "  !! " << (fatal ? "[fatal] " : "") << err.what() << std::endl;
                })
                .build()
        );

        // -- Track --
        send("track with Properties");
        client->track("Page Viewed",
            pulse::Properties{
                {"url", std::string("/home")},
                {"referrer", std::string("google")},
                {"screen", std::string("1920x1080")},
            });
        calls++;

        send("track with typed payload");
        client->track("Plan Selected", e2e::Plan{"pro", 5, true});
        calls++;

        send("track with no properties (enriched with sdk)");
        client->track("App Opened");
        calls++;

        send("track with caller message id");
        client->track(pulse::MessageId{"e2e-order-001"}, "Order Completed",
            pulse::Properties{{"total", 49.99}, {"currency", std::string("USD")}});
        calls++;

        // -- Identify --
        send("identify");
        client->identify(USER,
            pulse::Properties{
                {"name", std::string("E2E Test User")},
                {"email", std::string("e2e@pulse.dev")},
                {"created_at", std::string("2025-01-01T00:00:00Z")},
            });
        calls++;

        send("identify traits only");
        client->identify(e2e::Plan{"enterprise", 50, true});
        calls++;

        // -- Screen --
        send("screen");
        client->screen("Dashboard", std::string("Analytics"),
            pulse::Properties{{"widgets", 12}});
        calls++;

        // -- Group --
        send("group");
        client->group("org_cpp_sdk",
            pulse::Properties{
                {"name", std::string("Pulse Engineering")},
                {"plan", std::string("enterprise")},
                {"seats", 50},
            });
        calls++;

        // -- Alias --
        send("alias");
        client->alias("e2e_user_cpp_merged");
        calls++;

        // -- Identity reset --
        send("reset_identity");
        client->reset_identity();

        send("track after reset (new anonymous id)");
        client->track("Post Reset", pulse::Properties{{"step", std::string("verify_reset")}});
        calls++;

        // -- Flush & close --
        send("flush");
        client->flush();
        std::cout << "  .. flush ok" << std::endl;

        send("close");
        client->close();
        std::cout << "  .. close ok" << std::endl;

    } catch (const pulse::PulseError& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }

    std::cout << std::endl;
    std::cout << "  Done — " << calls << " calls sent. Verify on the collector." << std::endl;
    std::cout << std::endl;

    return 0;
}
