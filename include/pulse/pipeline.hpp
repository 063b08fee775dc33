// include/pulse/pipeline.hpp
// Delivery pipeline contract — where dispatched events leave the client.

#pragma once

#include "event.hpp"

namespace pulse {

// Receives fully enriched events. process() may queue but must not block
// the caller beyond that. Called concurrently from any dispatching thread;
// events from one thread arrive in the order they were dispatched.
//
// When no pipeline is configured the client uses a background worker that
// batches events and sends them to the configured endpoint.
class Pipeline {
public:
    virtual ~Pipeline() = default;

    virtual void process(Event event) = 0;

    // Deliver everything queued so far; blocks until done or timed out.
    virtual void flush() {}

    // Flush and release resources. No process() calls follow.
    virtual void close() {}
};

} // namespace pulse
