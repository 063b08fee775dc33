// src/enrichment.cpp
// Enrichment chain implementation.

#include "pulse/enrichment.hpp"
#include "pulse/error.hpp"

#include <mutex>

namespace pulse {

namespace {

// Returns false when the event was dropped.
bool run(const Enrichment& enrichment, std::optional<Event>& event, Pulse& client) {
    if (!enrichment) return true;

    EventType type = type_of(*event);
    std::optional<Event> next = enrichment(std::move(*event), client);
    if (!next) {
        event.reset();
        return false;
    }
    if (type_of(*next) != type) {
        throw PulseError::invalid_event("type",
            std::string("changed by enrichment from ") + to_string(type) +
            " to " + to_string(type_of(*next)));
    }
    event = std::move(next);
    return true;
}

} // namespace

EnrichmentChain::EnrichmentChain(Enrichments enrichments)
    : enrichments_(std::move(enrichments)) {}

void EnrichmentChain::add(Enrichment enrichment) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    enrichments_.push_back(std::move(enrichment));
}

void EnrichmentChain::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    enrichments_.clear();
}

size_t EnrichmentChain::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return enrichments_.size();
}

std::optional<Event> EnrichmentChain::apply(Event event, const Enrichments* call_scoped,
                                            Pulse& client) const {
    Enrichments pipeline_wide;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        pipeline_wide = enrichments_;
    }

    std::optional<Event> current(std::move(event));
    for (const auto& enrichment : pipeline_wide) {
        if (!run(enrichment, current, client)) return std::nullopt;
    }
    if (call_scoped) {
        for (const auto& enrichment : *call_scoped) {
            if (!run(enrichment, current, client)) return std::nullopt;
        }
    }
    return current;
}

} // namespace pulse
