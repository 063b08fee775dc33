// Pulse SDK — track, identify, screen, group, alias.
//
//   cmake -B build -DPULSE_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/pulse_events

#include "pulse/pulse.hpp"

#include <iostream>
#include <string>

namespace shop {

struct Order {
    std::string id;
    double total = 0.0;
    int items = 0;
};

pulse::Value to_value(const Order& o) {
    return pulse::Value::object({
        {"orderId", o.id},
        {"total", o.total},
        {"items", o.items},
    });
}

} // namespace shop

int main() {
    auto client = pulse::Pulse::create(
        pulse::PulseConfig::builder("feed1e11feed1e11feed1e11feed1e11")
            .endpoint("localhost:50000")
            .on_error([](const pulse::PulseError& e, bool fatal) {
                std::cerr << (fatal ? "[pulse] fatal: " : "[pulse] ") << e.what() << std::endl;
            })
            .build()
    );

    // Untyped properties
    client->track("Page Viewed",
        pulse::Properties{{"url", std::string("/home")}, {"referrer", std::string("google")}});

    // Typed properties
    client->track("Order Completed", shop::Order{"order_456", 49.99, 2});

    // Identify, then update traits alone
    client->identify("user_123", pulse::Properties{{"name", std::string("Jane")}});
    client->identify(pulse::Properties{{"plan", std::string("pro")}});

    client->screen("Checkout", std::string("Store"));
    client->group("org_1", pulse::Properties{{"seats", 25}});
    client->alias("user_123@example.com");

    client->close();
}
