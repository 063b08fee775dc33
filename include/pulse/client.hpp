// include/pulse/client.hpp
// Pulse analytics client — event dispatch entry points.

#pragma once

#include "config.hpp"
#include "enrichment.hpp"
#include "error.hpp"
#include "event.hpp"
#include "identity.hpp"
#include "serialize.hpp"
#include "value.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

namespace pulse {

// Caller-assigned message id for track().
struct MessageId {
    std::string value;
};

namespace detail {

// A call-site payload after overload resolution. `serialize` captures the
// caller's argument by reference and is only invoked during that call.
struct Input {
    enum class Shape : uint8_t { Absent, Typed, Untyped };

    Shape shape = Shape::Absent;
    std::function<Value()> serialize;
};

inline Input absent() { return Input{}; }

template <typename P>
Input typed(const P& payload) {
    return Input{Input::Shape::Typed, [&payload] { return to_value(payload); }};
}

template <typename P>
Input typed(const std::optional<P>& payload) {
    if (!payload) return absent();
    return typed(*payload);
}

inline Input untyped(const Properties& properties) {
    return Input{Input::Shape::Untyped, [&properties] { return serialize(properties); }};
}

inline Input untyped(const std::optional<Properties>& properties) {
    if (!properties) return absent();
    return untyped(*properties);
}

// Anything with a to_value() conversion, except the argument types that
// have dedicated overloads.
template <typename T>
struct is_typed_payload : std::integral_constant<bool,
    !std::is_convertible<const T&, std::string>::value &&
    !std::is_same<T, Properties>::value &&
    !std::is_same<T, std::optional<Properties>>::value &&
    !std::is_same<T, Enrichments>::value &&
    !std::is_same<T, std::nullopt_t>::value &&
    !std::is_same<T, MessageId>::value> {};

template <typename T>
using TypedPayload = typename std::enable_if<is_typed_payload<T>::value, int>::type;

} // namespace detail

// The Pulse analytics client.
//
// Created via Pulse::create(config). Every dispatch method has three input
// shapes:
//
//   typed    any P with a to_value(const P&) conversion. If conversion
//            fails the error is reported as fatal and nothing is sent.
//   untyped  Properties (std::map<std::string, std::any>). If conversion
//            fails the error is reported as non-fatal and the event is
//            sent without the payload.
//   absent   the payload-less overload, or an empty std::optional.
//
// and an enriched form taking call-scoped Enrichments as the last argument.
// Dispatch methods never block on delivery and never throw, except for
// std::logic_error when called from inside one of this client's
// own enrichments.
//
// Example:
//   auto client = Pulse::create(PulseConfig::production("a1b2c3...f90"));
//   client->identify("user_123", Properties{{"plan", std::string("pro")}});
//   client->track("Page Viewed", Properties{{"url", std::string("/home")}});
//   client->close();
class Pulse {
public:
    // Create a new client. Throws PulseError on invalid configuration.
    static std::unique_ptr<Pulse> create(PulseConfig config);

    ~Pulse();

    Pulse(const Pulse&) = delete;
    Pulse& operator=(const Pulse&) = delete;

    // --- Track ---

    void track(const std::string& name);
    void track(const std::string& name, const Enrichments& enrichments);

    template <typename P, detail::TypedPayload<P> = 0>
    void track(const std::string& name, const P& properties) {
        emit_track(nullptr, name, detail::typed(properties), nullptr);
    }

    template <typename P, detail::TypedPayload<P> = 0>
    void track(const std::string& name, const P& properties, const Enrichments& enrichments) {
        emit_track(nullptr, name, detail::typed(properties), &enrichments);
    }

    void track(const std::string& name, const Properties& properties);
    void track(const std::string& name, const std::optional<Properties>& properties);
    void track(const std::string& name, const Properties& properties,
               const Enrichments& enrichments);
    void track(const std::string& name, const std::optional<Properties>& properties,
               const Enrichments& enrichments);

    void track(const MessageId& message_id, const std::string& name,
               const std::optional<Properties>& properties = std::nullopt);

    // --- Identify ---
    //
    // identify(user_id)          sets the user id, keeps stored traits.
    // identify(traits)           replaces stored traits, keeps the user id.
    // identify(user_id, traits)  sets the user id; replaces traits if given.

    void identify(const std::string& user_id);
    void identify(const std::string& user_id, const Enrichments& enrichments);

    template <typename T, detail::TypedPayload<T> = 0>
    void identify(const std::string& user_id, const T& traits) {
        emit_identify(IdentifyForm::UserIdAndTraits, &user_id, detail::typed(traits), nullptr);
    }

    template <typename T, detail::TypedPayload<T> = 0>
    void identify(const std::string& user_id, const T& traits, const Enrichments& enrichments) {
        emit_identify(IdentifyForm::UserIdAndTraits, &user_id, detail::typed(traits), &enrichments);
    }

    template <typename T, detail::TypedPayload<T> = 0>
    void identify(const T& traits) {
        emit_identify(IdentifyForm::Traits, nullptr, detail::typed(traits), nullptr);
    }

    template <typename T, detail::TypedPayload<T> = 0>
    void identify(const T& traits, const Enrichments& enrichments) {
        emit_identify(IdentifyForm::Traits, nullptr, detail::typed(traits), &enrichments);
    }

    void identify(const std::string& user_id, const Properties& traits);
    void identify(const std::string& user_id, const std::optional<Properties>& traits);
    void identify(const std::string& user_id, const Properties& traits,
                  const Enrichments& enrichments);
    void identify(const std::string& user_id, const std::optional<Properties>& traits,
                  const Enrichments& enrichments);
    void identify(const Properties& traits);
    void identify(const Properties& traits, const Enrichments& enrichments);

    // --- Screen ---

    void screen(const std::string& title,
                const std::optional<std::string>& category = std::nullopt);
    void screen(const std::string& title, const std::optional<std::string>& category,
                const Enrichments& enrichments);

    template <typename P, detail::TypedPayload<P> = 0>
    void screen(const std::string& title, const std::optional<std::string>& category,
                const P& properties) {
        emit_screen(title, category, detail::typed(properties), nullptr);
    }

    template <typename P, detail::TypedPayload<P> = 0>
    void screen(const std::string& title, const std::optional<std::string>& category,
                const P& properties, const Enrichments& enrichments) {
        emit_screen(title, category, detail::typed(properties), &enrichments);
    }

    void screen(const std::string& title, const std::optional<std::string>& category,
                const Properties& properties);
    void screen(const std::string& title, const std::optional<std::string>& category,
                const std::optional<Properties>& properties);
    void screen(const std::string& title, const std::optional<std::string>& category,
                const Properties& properties, const Enrichments& enrichments);
    void screen(const std::string& title, const std::optional<std::string>& category,
                const std::optional<Properties>& properties, const Enrichments& enrichments);

    // --- Group ---

    void group(const std::string& group_id);
    void group(const std::string& group_id, const Enrichments& enrichments);

    template <typename T, detail::TypedPayload<T> = 0>
    void group(const std::string& group_id, const T& traits) {
        emit_group(group_id, detail::typed(traits), nullptr);
    }

    template <typename T, detail::TypedPayload<T> = 0>
    void group(const std::string& group_id, const T& traits, const Enrichments& enrichments) {
        emit_group(group_id, detail::typed(traits), &enrichments);
    }

    void group(const std::string& group_id, const Properties& traits);
    void group(const std::string& group_id, const std::optional<Properties>& traits);
    void group(const std::string& group_id, const Properties& traits,
               const Enrichments& enrichments);
    void group(const std::string& group_id, const std::optional<Properties>& traits,
               const Enrichments& enrichments);

    // --- Alias ---

    // Replace the current user id with `new_id`. The event's previousId is
    // the id being replaced (the anonymous id if no user id was set).
    void alias(const std::string& new_id);
    void alias(const std::string& new_id, const Enrichments& enrichments);

    // --- Enrichments ---

    // Register a pipeline-wide enrichment, run before call-scoped ones.
    void add(Enrichment enrichment);
    void clear_enrichments();

    // --- Identity ---

    IdentityState identity() const;
    std::string anonymous_id() const;
    std::optional<std::string> user_id() const;
    std::optional<Value> traits() const;

    // Clear user id and traits and generate a new anonymous id.
    void reset_identity();

    // --- Lifecycle ---

    // Deliver all queued events, blocks until complete or close_timeout.
    void flush();

    // Flush and close the pipeline. Later dispatches report Closed.
    void close();

private:
    enum class IdentifyForm : uint8_t { UserId, Traits, UserIdAndTraits };

    explicit Pulse(PulseConfig config);

    void emit_track(const std::string* message_id, const std::string& name,
                    const detail::Input& properties, const Enrichments* enrichments);
    void emit_identify(IdentifyForm form, const std::string* user_id,
                       const detail::Input& traits, const Enrichments* enrichments);
    void emit_screen(const std::string& title, const std::optional<std::string>& category,
                     const detail::Input& properties, const Enrichments* enrichments);
    void emit_group(const std::string& group_id, const detail::Input& traits,
                    const Enrichments* enrichments);
    void emit_alias(const std::string& new_id, const Enrichments* enrichments);

    struct Inner;
    std::unique_ptr<Inner> inner_;
};

} // namespace pulse
