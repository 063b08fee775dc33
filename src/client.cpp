// src/client.cpp
// Pulse client implementation — argument normalization and dispatch.

#include "pulse/client.hpp"
#include "clock.hpp"
#include "validation.hpp"
#include "worker.hpp"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <cstring>
#include <random>
#include <stdexcept>
#include <vector>

namespace pulse {

// Generate a v4 UUID in canonical lowercase form.
static std::string generate_uuid() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    uint8_t bytes[16];
    uint64_t a = dist(gen);
    uint64_t b = dist(gen);
    std::memcpy(bytes, &a, 8);
    std::memcpy(bytes + 8, &b, 8);

    // Set version 4 and variant bits
    bytes[6] = (bytes[6] & 0x0F) | 0x40; // version 4
    bytes[8] = (bytes[8] & 0x3F) | 0x80; // variant 1

    char out[37];
    std::snprintf(out, sizeof(out),
        "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
        bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string(out, 36);
}

namespace {

// Clients whose enrichment chain is running on this thread, innermost last.
// Dispatching to one of them would recurse into its chain; other clients
// are unaffected.
thread_local std::vector<const Pulse*> enriching;

struct EnrichmentScope {
    explicit EnrichmentScope(const Pulse* client) { enriching.push_back(client); }
    ~EnrichmentScope() { enriching.pop_back(); }
};

void check_not_reentered(const Pulse* client) {
    if (std::find(enriching.begin(), enriching.end(), client) != enriching.end()) {
        throw std::logic_error("pulse: event dispatched from inside its own enrichment");
    }
}

} // namespace

// ---

struct Pulse::Inner {
    IdentityStore identity;
    EnrichmentChain chain;
    std::shared_ptr<Pipeline> pipeline;
    PulseConfig::ErrorCallback on_error;
    std::atomic<bool> closed{false};

    explicit Inner(const PulseConfig& config)
        : identity(config.anonymous_id().empty() ? generate_uuid() : config.anonymous_id()),
          chain(config.enrichments()),
          pipeline(config.pipeline()),
          on_error(config.on_error()) {
        if (!pipeline) {
            pipeline = std::make_shared<Worker>(config);
        }
    }

    void report_error(const PulseError& err, bool fatal) const {
        if (on_error) {
            on_error(err, fatal);
        }
    }

    bool reject_if_closed() const {
        if (closed.load(std::memory_order_acquire)) {
            report_error(PulseError::closed(), false);
            return true;
        }
        return false;
    }

    // Serialize a call-site payload into `out`. Returns false when the call
    // must be abandoned: a typed payload failed and was reported as fatal.
    // An untyped failure is reported as non-fatal and leaves `out` empty.
    bool resolve(const detail::Input& input, const char* field, std::optional<Value>& out) const {
        out.reset();
        if (input.shape == detail::Input::Shape::Absent) return true;

        bool typed = input.shape == detail::Input::Shape::Typed;
        try {
            Value value = input.serialize();
            if (value.is_null()) return true;
            if (!value.is_object()) {
                throw PulseError::serialization(std::string(field) +
                    " must serialize to an object, got " + to_string(value.type()));
            }
            out = std::move(value);
            return true;
        } catch (const PulseError& e) {
            report_error(e, typed);
        } catch (const std::exception& e) {
            // A user to_value() threw something of its own.
            report_error(PulseError::serialization(e.what()), typed);
        }
        return !typed;
    }

    Envelope envelope(const IdentityState& state, const std::string* message_id = nullptr) const {
        Envelope env;
        env.message_id = (message_id && !message_id->empty()) ? *message_id : generate_uuid();
        env.timestamp = now_ms();
        env.anonymous_id = state.anonymous_id;
        env.user_id = state.user_id;
        return env;
    }

    // Run the enrichment chain and hand the survivor to the pipeline.
    void finish(Event event, const Enrichments* enrichments, Pulse& client) {
        std::optional<Event> out;
        {
            EnrichmentScope scope(&client);
            out = chain.apply(std::move(event), enrichments, client);
        }
        if (!out) return;
        pipeline->process(std::move(*out));
    }
};

Pulse::Pulse(PulseConfig config) : inner_(std::make_unique<Inner>(config)) {}

Pulse::~Pulse() = default;

std::unique_ptr<Pulse> Pulse::create(PulseConfig config) {
    return std::unique_ptr<Pulse>(new Pulse(std::move(config)));
}

// --- Construction paths (one per event kind) ---

void Pulse::emit_track(const std::string* message_id, const std::string& name,
                       const detail::Input& properties, const Enrichments* enrichments) {
    check_not_reentered(this);
    if (inner_->reject_if_closed()) return;

    try {
        if (!validation::check_event_name(name)) {
            throw PulseError::invalid_event("event", "is required");
        }

        std::optional<Value> props;
        if (!inner_->resolve(properties, "properties", props)) return;

        TrackEvent event(inner_->envelope(inner_->identity.snapshot(), message_id),
                         name, std::move(props));
        inner_->finish(std::move(event), enrichments, *this);
    } catch (const PulseError& e) {
        inner_->report_error(e, false);
    }
}

void Pulse::emit_identify(IdentifyForm form, const std::string* user_id,
                          const detail::Input& traits_input, const Enrichments* enrichments) {
    check_not_reentered(this);
    if (inner_->reject_if_closed()) return;

    try {
        std::optional<Value> traits;
        if (!inner_->resolve(traits_input, "traits", traits)) return;

        // The store is written before the envelope snapshot, so the event
        // reflects the post-write identity.
        std::optional<IdentityAction> action;
        switch (form) {
            case IdentifyForm::UserId:
                action = SetUserId{*user_id};
                break;
            case IdentifyForm::Traits:
                if (traits) action = SetTraits{*traits};
                break;
            case IdentifyForm::UserIdAndTraits:
                action = SetUserIdAndTraits{*user_id, traits};
                break;
        }
        IdentityState state = action ? inner_->identity.apply(*action).after
                                     : inner_->identity.snapshot();

        std::optional<std::string> event_user_id;
        if (user_id) event_user_id = *user_id;

        IdentifyEvent event(inner_->envelope(state), std::move(event_user_id), std::move(traits));
        inner_->finish(std::move(event), enrichments, *this);
    } catch (const PulseError& e) {
        inner_->report_error(e, false);
    }
}

void Pulse::emit_screen(const std::string& title, const std::optional<std::string>& category,
                        const detail::Input& properties, const Enrichments* enrichments) {
    check_not_reentered(this);
    if (inner_->reject_if_closed()) return;

    try {
        std::optional<Value> props;
        if (!inner_->resolve(properties, "properties", props)) return;

        ScreenEvent event(inner_->envelope(inner_->identity.snapshot()),
                          title, category, std::move(props));
        inner_->finish(std::move(event), enrichments, *this);
    } catch (const PulseError& e) {
        inner_->report_error(e, false);
    }
}

void Pulse::emit_group(const std::string& group_id, const detail::Input& traits_input,
                       const Enrichments* enrichments) {
    check_not_reentered(this);
    if (inner_->reject_if_closed()) return;

    try {
        if (!validation::check_group_id(group_id)) {
            throw PulseError::invalid_event("groupId", "is required");
        }

        std::optional<Value> traits;
        if (!inner_->resolve(traits_input, "traits", traits)) return;

        GroupEvent event(inner_->envelope(inner_->identity.snapshot()),
                         group_id, std::move(traits));
        inner_->finish(std::move(event), enrichments, *this);
    } catch (const PulseError& e) {
        inner_->report_error(e, false);
    }
}

void Pulse::emit_alias(const std::string& new_id, const Enrichments* enrichments) {
    check_not_reentered(this);
    if (inner_->reject_if_closed()) return;

    try {
        if (!validation::check_alias_id(new_id)) {
            throw PulseError::invalid_event("userId", "is required");
        }

        // previousId is read in the same atomic step as the write.
        IdentityTransition t = inner_->identity.apply(SetUserId{new_id});
        std::string previous_id = t.before.user_id ? *t.before.user_id : t.before.anonymous_id;

        AliasEvent event(inner_->envelope(t.after), new_id, std::move(previous_id));
        inner_->finish(std::move(event), enrichments, *this);
    } catch (const PulseError& e) {
        inner_->report_error(e, false);
    }
}

// --- Track ---

void Pulse::track(const std::string& n) { emit_track(nullptr, n, detail::absent(), nullptr); }
void Pulse::track(const std::string& n, const Enrichments& e) { emit_track(nullptr, n, detail::absent(), &e); }
void Pulse::track(const std::string& n, const Properties& p) { emit_track(nullptr, n, detail::untyped(p), nullptr); }
void Pulse::track(const std::string& n, const std::optional<Properties>& p) { emit_track(nullptr, n, detail::untyped(p), nullptr); }
void Pulse::track(const std::string& n, const Properties& p, const Enrichments& e) { emit_track(nullptr, n, detail::untyped(p), &e); }
void Pulse::track(const std::string& n, const std::optional<Properties>& p, const Enrichments& e) { emit_track(nullptr, n, detail::untyped(p), &e); }

void Pulse::track(const MessageId& message_id, const std::string& name,
                  const std::optional<Properties>& properties) {
    emit_track(&message_id.value, name, detail::untyped(properties), nullptr);
}

// --- Identify ---

void Pulse::identify(const std::string& u) { emit_identify(IdentifyForm::UserId, &u, detail::absent(), nullptr); }
void Pulse::identify(const std::string& u, const Enrichments& e) { emit_identify(IdentifyForm::UserId, &u, detail::absent(), &e); }
void Pulse::identify(const std::string& u, const Properties& t) { emit_identify(IdentifyForm::UserIdAndTraits, &u, detail::untyped(t), nullptr); }
void Pulse::identify(const std::string& u, const std::optional<Properties>& t) { emit_identify(IdentifyForm::UserIdAndTraits, &u, detail::untyped(t), nullptr); }
void Pulse::identify(const std::string& u, const Properties& t, const Enrichments& e) { emit_identify(IdentifyForm::UserIdAndTraits, &u, detail::untyped(t), &e); }
void Pulse::identify(const std::string& u, const std::optional<Properties>& t, const Enrichments& e) { emit_identify(IdentifyForm::UserIdAndTraits, &u, detail::untyped(t), &e); }
void Pulse::identify(const Properties& t) { emit_identify(IdentifyForm::Traits, nullptr, detail::untyped(t), nullptr); }
void Pulse::identify(const Properties& t, const Enrichments& e) { emit_identify(IdentifyForm::Traits, nullptr, detail::untyped(t), &e); }

// --- Screen ---

void Pulse::screen(const std::string& t, const std::optional<std::string>& c) { emit_screen(t, c, detail::absent(), nullptr); }
void Pulse::screen(const std::string& t, const std::optional<std::string>& c, const Enrichments& e) { emit_screen(t, c, detail::absent(), &e); }
void Pulse::screen(const std::string& t, const std::optional<std::string>& c, const Properties& p) { emit_screen(t, c, detail::untyped(p), nullptr); }
void Pulse::screen(const std::string& t, const std::optional<std::string>& c, const std::optional<Properties>& p) { emit_screen(t, c, detail::untyped(p), nullptr); }
void Pulse::screen(const std::string& t, const std::optional<std::string>& c, const Properties& p, const Enrichments& e) { emit_screen(t, c, detail::untyped(p), &e); }
void Pulse::screen(const std::string& t, const std::optional<std::string>& c, const std::optional<Properties>& p, const Enrichments& e) { emit_screen(t, c, detail::untyped(p), &e); }

// --- Group ---

void Pulse::group(const std::string& g) { emit_group(g, detail::absent(), nullptr); }
void Pulse::group(const std::string& g, const Enrichments& e) { emit_group(g, detail::absent(), &e); }
void Pulse::group(const std::string& g, const Properties& t) { emit_group(g, detail::untyped(t), nullptr); }
void Pulse::group(const std::string& g, const std::optional<Properties>& t) { emit_group(g, detail::untyped(t), nullptr); }
void Pulse::group(const std::string& g, const Properties& t, const Enrichments& e) { emit_group(g, detail::untyped(t), &e); }
void Pulse::group(const std::string& g, const std::optional<Properties>& t, const Enrichments& e) { emit_group(g, detail::untyped(t), &e); }

// --- Alias ---

void Pulse::alias(const std::string& new_id) { emit_alias(new_id, nullptr); }
void Pulse::alias(const std::string& new_id, const Enrichments& e) { emit_alias(new_id, &e); }

// --- Enrichments ---

void Pulse::add(Enrichment enrichment) {
    inner_->chain.add(std::move(enrichment));
}

void Pulse::clear_enrichments() {
    inner_->chain.clear();
}

// --- Identity ---

IdentityState Pulse::identity() const {
    return inner_->identity.snapshot();
}

std::string Pulse::anonymous_id() const {
    return inner_->identity.snapshot().anonymous_id;
}

std::optional<std::string> Pulse::user_id() const {
    return inner_->identity.snapshot().user_id;
}

std::optional<Value> Pulse::traits() const {
    return inner_->identity.snapshot().traits;
}

void Pulse::reset_identity() {
    inner_->identity.reset(generate_uuid());
}

// --- Lifecycle ---

void Pulse::flush() {
    inner_->pipeline->flush();
}

void Pulse::close() {
    if (inner_->closed.exchange(true)) return;
    inner_->pipeline->close();
}

} // namespace pulse
