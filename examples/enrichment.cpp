// Enrichments — pipeline-wide and call-scoped event transforms.
//
//   cmake -B build -DPULSE_BUILD_EXAMPLES=ON && cmake --build build
//   ./build/pulse_enrichment

#include "pulse/pulse.hpp"

#include <iostream>
#include <string>

// Copy of `track` with one more property.
static pulse::TrackEvent with_property(const pulse::TrackEvent& track, std::string key,
                                       pulse::Value value) {
    pulse::Members props;
    if (track.properties()) props = track.properties()->as_object();
    props.emplace_back(std::move(key), std::move(value));
    return track.with_properties(pulse::Value::object(std::move(props)));
}

// Prints events instead of sending them.
class PrintPipeline : public pulse::Pipeline {
public:
    void process(pulse::Event event) override {
        std::cout << pulse::to_value(event).to_json() << std::endl;
    }
};

int main() {
    auto client = pulse::Pulse::create(
        pulse::PulseConfig::builder("feed1e11feed1e11feed1e11feed1e11")
            .pipeline(std::make_shared<PrintPipeline>())
            // Stamp every track event with the app version.
            .enrichment([](pulse::Event event, pulse::Pulse&) -> std::optional<pulse::Event> {
                auto* track = std::get_if<pulse::TrackEvent>(&event);
                if (!track) return event;
                return with_property(*track, "appVersion", "2.4.1");
            })
            .build()
    );

    // Drop internal test traffic.
    client->add([](pulse::Event event, pulse::Pulse& c) -> std::optional<pulse::Event> {
        auto user = c.user_id();
        if (user && user->rfind("test_", 0) == 0) return std::nullopt;
        return event;
    });

    client->track("App Opened");

    // Call-scoped: only this event is tagged.
    pulse::Enrichments tag_campaign{
        [](pulse::Event event, pulse::Pulse&) -> std::optional<pulse::Event> {
            return with_property(std::get<pulse::TrackEvent>(event), "campaign", "spring");
        },
    };
    client->track("Promo Clicked", tag_campaign);

    // Both events below belong to a test user and are dropped.
    client->identify("test_user");
    client->track("Dropped");

    client->close();
}
