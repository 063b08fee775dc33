// include/pulse/event.hpp
// Event envelope and the five event variants.

#pragma once

#include "value.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace pulse {

enum class EventType : uint8_t {
    Track    = 1,
    Identify = 2,
    Screen   = 3,
    Group    = 4,
    Alias    = 5,
};

// Wire tag: "track", "identify", "screen", "group", "alias".
const char* to_string(EventType type) noexcept;

// Fields shared by every event.
struct Envelope {
    std::string message_id;
    uint64_t timestamp = 0;                 // capture time, ms since epoch
    std::string anonymous_id;
    std::optional<std::string> user_id;
    Value context = Value::object({});      // filled by later pipeline stages
    Value integrations = Value::object({});
};

bool operator==(const Envelope& a, const Envelope& b);
inline bool operator!=(const Envelope& a, const Envelope& b) { return !(a == b); }

// Event variants are immutable values. Constructors throw
// PulseError(InvalidEvent) on an invalid shape; the with_* members return
// modified copies.

class TrackEvent {
public:
    static constexpr EventType TYPE = EventType::Track;

    TrackEvent(Envelope envelope, std::string event,
               std::optional<Value> properties = std::nullopt);

    const Envelope& envelope() const noexcept { return envelope_; }
    const std::string& event() const noexcept { return event_; }
    const std::optional<Value>& properties() const noexcept { return properties_; }

    TrackEvent with_properties(std::optional<Value> properties) const;
    TrackEvent with_envelope(Envelope envelope) const;

private:
    Envelope envelope_;
    std::string event_;
    std::optional<Value> properties_;
};

class IdentifyEvent {
public:
    static constexpr EventType TYPE = EventType::Identify;

    IdentifyEvent(Envelope envelope, std::optional<std::string> user_id,
                  std::optional<Value> traits = std::nullopt);

    const Envelope& envelope() const noexcept { return envelope_; }
    const std::optional<std::string>& user_id() const noexcept { return user_id_; }
    const std::optional<Value>& traits() const noexcept { return traits_; }

    IdentifyEvent with_traits(std::optional<Value> traits) const;
    IdentifyEvent with_envelope(Envelope envelope) const;

private:
    Envelope envelope_;
    std::optional<std::string> user_id_;
    std::optional<Value> traits_;
};

class ScreenEvent {
public:
    static constexpr EventType TYPE = EventType::Screen;

    ScreenEvent(Envelope envelope, std::string title,
                std::optional<std::string> category = std::nullopt,
                std::optional<Value> properties = std::nullopt);

    const Envelope& envelope() const noexcept { return envelope_; }
    const std::string& title() const noexcept { return title_; }
    const std::optional<std::string>& category() const noexcept { return category_; }
    const std::optional<Value>& properties() const noexcept { return properties_; }

    ScreenEvent with_properties(std::optional<Value> properties) const;
    ScreenEvent with_envelope(Envelope envelope) const;

private:
    Envelope envelope_;
    std::string title_;
    std::optional<std::string> category_;
    std::optional<Value> properties_;
};

class GroupEvent {
public:
    static constexpr EventType TYPE = EventType::Group;

    GroupEvent(Envelope envelope, std::string group_id,
               std::optional<Value> traits = std::nullopt);

    const Envelope& envelope() const noexcept { return envelope_; }
    const std::string& group_id() const noexcept { return group_id_; }
    const std::optional<Value>& traits() const noexcept { return traits_; }

    GroupEvent with_traits(std::optional<Value> traits) const;
    GroupEvent with_envelope(Envelope envelope) const;

private:
    Envelope envelope_;
    std::string group_id_;
    std::optional<Value> traits_;
};

class AliasEvent {
public:
    static constexpr EventType TYPE = EventType::Alias;

    // `user_id` is the new id; `previous_id` the one it replaces.
    AliasEvent(Envelope envelope, std::string user_id, std::string previous_id);

    const Envelope& envelope() const noexcept { return envelope_; }
    const std::string& user_id() const noexcept { return user_id_; }
    const std::string& previous_id() const noexcept { return previous_id_; }

    AliasEvent with_envelope(Envelope envelope) const;

private:
    Envelope envelope_;
    std::string user_id_;
    std::string previous_id_;
};

using Event = std::variant<TrackEvent, IdentifyEvent, ScreenEvent, GroupEvent, AliasEvent>;

EventType type_of(const Event& event) noexcept;
const Envelope& envelope_of(const Event& event) noexcept;

// Copy of `event` with its envelope replaced.
Event with_envelope(const Event& event, Envelope envelope);

// Wire representation:
//   {"type":"track","messageId":...,"timestamp":"<iso-8601>","anonymousId":...,
//    "userId":...,<variant fields>,"context":{},"integrations":{}}
Value to_value(const Event& event);

} // namespace pulse
