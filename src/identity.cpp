// src/identity.cpp
// Identity store implementation.

#include "pulse/identity.hpp"
#include "pulse/error.hpp"

#include <mutex>

namespace pulse {

namespace {

struct ApplyAction {
    IdentityState& state;

    void operator()(const SetUserId& a) const {
        state.user_id = a.user_id;
    }
    void operator()(const SetTraits& a) const {
        state.traits = a.traits;
    }
    void operator()(const SetUserIdAndTraits& a) const {
        state.user_id = a.user_id;
        if (a.traits) state.traits = a.traits;
    }
};

} // namespace

IdentityStore::IdentityStore(std::string anonymous_id) {
    if (anonymous_id.empty()) {
        throw PulseError::configuration("anonymousId must not be empty");
    }
    state_.anonymous_id = std::move(anonymous_id);
}

IdentityState IdentityStore::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_;
}

IdentityTransition IdentityStore::apply(const IdentityAction& action) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    IdentityTransition t;
    t.before = state_;
    std::visit(ApplyAction{state_}, action);
    state_.version++;
    t.after = state_;
    return t;
}

IdentityState IdentityStore::reset(std::string anonymous_id) {
    if (anonymous_id.empty()) {
        throw PulseError::configuration("anonymousId must not be empty");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    state_.anonymous_id = std::move(anonymous_id);
    state_.user_id.reset();
    state_.traits.reset();
    state_.version++;
    return state_;
}

} // namespace pulse
