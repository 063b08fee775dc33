// include/pulse/error.hpp
// Simplified error handling — single class with kind enum.

#pragma once

#include <stdexcept>
#include <string>

namespace pulse {

enum class ErrorKind {
    Configuration,  // Invalid config at construction
    Serialization,  // Payload could not be converted to a Value
    InvalidEvent,   // Required event field missing (dropped, reported via callback)
    Network,        // Transport failure (retried)
    Closed          // Client already closed
};

inline const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Serialization: return "serialization";
        case ErrorKind::InvalidEvent:  return "invalid_event";
        case ErrorKind::Network:       return "network";
        case ErrorKind::Closed:        return "closed";
    }
    return "unknown";
}

class PulseError : public std::exception {
public:
    PulseError(ErrorKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    PulseError(ErrorKind kind, const std::string& field, const std::string& reason)
        : kind_(kind), message_("invalid event: " + field + " " + reason),
          field_(field), reason_(reason) {}

    const char* what() const noexcept override { return message_.c_str(); }
    ErrorKind kind() const noexcept { return kind_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& field() const noexcept { return field_; }
    const std::string& reason() const noexcept { return reason_; }

    static PulseError configuration(std::string msg) {
        return PulseError(ErrorKind::Configuration, "configuration error: " + msg);
    }

    static PulseError serialization(std::string msg) {
        return PulseError(ErrorKind::Serialization, "serialization error: " + msg);
    }

    static PulseError invalid_event(std::string field, std::string reason) {
        return PulseError(ErrorKind::InvalidEvent, field, reason);
    }

    static PulseError network(std::string msg) {
        return PulseError(ErrorKind::Network, "network error: " + msg);
    }

    static PulseError closed() {
        return PulseError(ErrorKind::Closed, "client is closed");
    }

private:
    ErrorKind kind_;
    std::string message_;
    std::string field_;
    std::string reason_;
};

} // namespace pulse
