// include/pulse/enrichment.hpp
// Ordered event transformations applied before hand-off to the pipeline.

#pragma once

#include "event.hpp"

#include <functional>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace pulse {

class Pulse;

// Receives the event and the client that dispatched it. Returns the
// (possibly replaced) event of the same kind, or std::nullopt to drop it.
//
// An enrichment must not call back into the dispatching client's track/
// identify/screen/group/alias methods; doing so throws std::logic_error.
// Dispatching to a different client is allowed.
using Enrichment = std::function<std::optional<Event>(Event event, Pulse& client)>;
using Enrichments = std::vector<Enrichment>;

// Pipeline-wide enrichments plus per-call application.
class EnrichmentChain {
public:
    EnrichmentChain() = default;
    explicit EnrichmentChain(Enrichments enrichments);

    EnrichmentChain(const EnrichmentChain&) = delete;
    EnrichmentChain& operator=(const EnrichmentChain&) = delete;

    // Register a pipeline-wide enrichment; runs after those already added.
    void add(Enrichment enrichment);
    void clear();
    size_t size() const;

    // Run pipeline-wide enrichments, then `call_scoped` (may be null), each
    // in registration order. Stops at the first drop and returns nullopt.
    // No lock is held while an enrichment runs.
    //
    // Throws PulseError(InvalidEvent) if an enrichment changes the event kind.
    std::optional<Event> apply(Event event, const Enrichments* call_scoped, Pulse& client) const;

private:
    mutable std::shared_mutex mutex_;
    Enrichments enrichments_;
};

} // namespace pulse
