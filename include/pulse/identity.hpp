// include/pulse/identity.hpp
// Shared identity record and the actions that mutate it.

#pragma once

#include "value.hpp"

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <variant>

namespace pulse {

// Snapshot of who the client is reporting as.
struct IdentityState {
    std::string anonymous_id;               // never empty
    std::optional<std::string> user_id;
    std::optional<Value> traits;
    uint64_t version = 0;                   // bumped by every action and reset
};

// Set the user id, keep traits.
struct SetUserId {
    std::string user_id;
};

// Replace traits wholesale, keep the user id.
struct SetTraits {
    Value traits;
};

// Set the user id; replace traits only when present.
struct SetUserIdAndTraits {
    std::string user_id;
    std::optional<Value> traits;
};

using IdentityAction = std::variant<SetUserId, SetTraits, SetUserIdAndTraits>;

struct IdentityTransition {
    IdentityState before;
    IdentityState after;
};

// Single authoritative identity record.
//
// Every action is applied under an exclusive lock, so readers observe
// either the whole pre-action or the whole post-action state.
class IdentityStore {
public:
    // Throws PulseError(Configuration) if `anonymous_id` is empty.
    explicit IdentityStore(std::string anonymous_id);

    IdentityStore(const IdentityStore&) = delete;
    IdentityStore& operator=(const IdentityStore&) = delete;

    IdentityState snapshot() const;

    // Apply one action atomically. Actions never fail.
    IdentityTransition apply(const IdentityAction& action);

    // Clear user id and traits and install a new anonymous id. Throws
    // PulseError(Configuration) if `anonymous_id` is empty.
    IdentityState reset(std::string anonymous_id);

private:
    mutable std::shared_mutex mutex_;
    IdentityState state_;
};

} // namespace pulse
