// src/event.cpp
// Event construction and wire representation.

#include "pulse/event.hpp"
#include "pulse/error.hpp"
#include "clock.hpp"
#include "validation.hpp"

namespace pulse {

const char* to_string(EventType type) noexcept {
    switch (type) {
        case EventType::Track:    return "track";
        case EventType::Identify: return "identify";
        case EventType::Screen:   return "screen";
        case EventType::Group:    return "group";
        case EventType::Alias:    return "alias";
    }
    return "unknown";
}

bool operator==(const Envelope& a, const Envelope& b) {
    return a.message_id == b.message_id
        && a.timestamp == b.timestamp
        && a.anonymous_id == b.anonymous_id
        && a.user_id == b.user_id
        && a.context == b.context
        && a.integrations == b.integrations;
}

// --- TrackEvent ---

TrackEvent::TrackEvent(Envelope envelope, std::string event, std::optional<Value> properties)
    : envelope_(std::move(envelope)), event_(std::move(event)),
      properties_(std::move(properties)) {
    if (!validation::check_event_name(event_)) {
        throw PulseError::invalid_event("event", "is required");
    }
    validation::require_payload("properties", properties_);
}

TrackEvent TrackEvent::with_properties(std::optional<Value> properties) const {
    return TrackEvent(envelope_, event_, std::move(properties));
}

TrackEvent TrackEvent::with_envelope(Envelope envelope) const {
    return TrackEvent(std::move(envelope), event_, properties_);
}

// --- IdentifyEvent ---

IdentifyEvent::IdentifyEvent(Envelope envelope, std::optional<std::string> user_id,
                             std::optional<Value> traits)
    : envelope_(std::move(envelope)), user_id_(std::move(user_id)),
      traits_(std::move(traits)) {
    validation::require_payload("traits", traits_);
}

IdentifyEvent IdentifyEvent::with_traits(std::optional<Value> traits) const {
    return IdentifyEvent(envelope_, user_id_, std::move(traits));
}

IdentifyEvent IdentifyEvent::with_envelope(Envelope envelope) const {
    return IdentifyEvent(std::move(envelope), user_id_, traits_);
}

// --- ScreenEvent ---

ScreenEvent::ScreenEvent(Envelope envelope, std::string title,
                         std::optional<std::string> category,
                         std::optional<Value> properties)
    : envelope_(std::move(envelope)), title_(std::move(title)),
      category_(std::move(category)), properties_(std::move(properties)) {
    validation::require_payload("properties", properties_);
}

ScreenEvent ScreenEvent::with_properties(std::optional<Value> properties) const {
    return ScreenEvent(envelope_, title_, category_, std::move(properties));
}

ScreenEvent ScreenEvent::with_envelope(Envelope envelope) const {
    return ScreenEvent(std::move(envelope), title_, category_, properties_);
}

// --- GroupEvent ---

GroupEvent::GroupEvent(Envelope envelope, std::string group_id, std::optional<Value> traits)
    : envelope_(std::move(envelope)), group_id_(std::move(group_id)),
      traits_(std::move(traits)) {
    if (!validation::check_group_id(group_id_)) {
        throw PulseError::invalid_event("groupId", "is required");
    }
    validation::require_payload("traits", traits_);
}

GroupEvent GroupEvent::with_traits(std::optional<Value> traits) const {
    return GroupEvent(envelope_, group_id_, std::move(traits));
}

GroupEvent GroupEvent::with_envelope(Envelope envelope) const {
    return GroupEvent(std::move(envelope), group_id_, traits_);
}

// --- AliasEvent ---

AliasEvent::AliasEvent(Envelope envelope, std::string user_id, std::string previous_id)
    : envelope_(std::move(envelope)), user_id_(std::move(user_id)),
      previous_id_(std::move(previous_id)) {
    if (!validation::check_alias_id(user_id_)) {
        throw PulseError::invalid_event("userId", "is required");
    }
}

AliasEvent AliasEvent::with_envelope(Envelope envelope) const {
    return AliasEvent(std::move(envelope), user_id_, previous_id_);
}

// --- Event ---

EventType type_of(const Event& event) noexcept {
    return std::visit([](const auto& e) { return std::decay_t<decltype(e)>::TYPE; }, event);
}

const Envelope& envelope_of(const Event& event) noexcept {
    return std::visit([](const auto& e) -> const Envelope& { return e.envelope(); }, event);
}

Event with_envelope(const Event& event, Envelope envelope) {
    return std::visit([&](const auto& e) -> Event { return e.with_envelope(std::move(envelope)); },
                      event);
}

namespace {

void add_optional(Members& out, const char* key, const std::optional<Value>& value) {
    if (value) out.emplace_back(key, *value);
}

void add_optional(Members& out, const char* key, const std::optional<std::string>& value) {
    if (value) out.emplace_back(key, *value);
}

struct VariantFields {
    Members& out;

    void operator()(const TrackEvent& e) const {
        out.emplace_back("event", e.event());
        add_optional(out, "properties", e.properties());
    }
    void operator()(const IdentifyEvent& e) const {
        // userId already comes from the envelope snapshot, which the
        // store update made equal to the identify call's id.
        if (e.user_id() && !e.envelope().user_id) {
            out.emplace_back("userId", *e.user_id());
        }
        add_optional(out, "traits", e.traits());
    }
    void operator()(const ScreenEvent& e) const {
        out.emplace_back("name", e.title());
        add_optional(out, "category", e.category());
        add_optional(out, "properties", e.properties());
    }
    void operator()(const GroupEvent& e) const {
        out.emplace_back("groupId", e.group_id());
        add_optional(out, "traits", e.traits());
    }
    void operator()(const AliasEvent& e) const {
        out.emplace_back("previousId", e.previous_id());
    }
};

} // namespace

Value to_value(const Event& event) {
    const Envelope& env = envelope_of(event);

    Members out;
    out.reserve(10);
    out.emplace_back("type", to_string(type_of(event)));
    out.emplace_back("messageId", env.message_id);
    out.emplace_back("timestamp", format_iso8601(env.timestamp));
    out.emplace_back("anonymousId", env.anonymous_id);

    // Alias carries the new id as userId regardless of the snapshot.
    if (const auto* alias = std::get_if<AliasEvent>(&event)) {
        out.emplace_back("userId", alias->user_id());
    } else {
        add_optional(out, "userId", env.user_id);
    }

    std::visit(VariantFields{out}, event);

    out.emplace_back("context", env.context);
    out.emplace_back("integrations", env.integrations);
    return Value::object(std::move(out));
}

} // namespace pulse
