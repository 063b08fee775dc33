// src/transport.hpp
// Length-prefixed frames over one lazily (re)connected TCP socket.

#pragma once

#include "pulse/error.hpp"
#include <chrono>
#include <cstdint>
#include <string>

struct addrinfo;

namespace pulse {

struct Endpoint {
    std::string host;
    uint16_t port = 0;
};

// Parse "host:port" (IPv6 hosts as "[::1]:port"). Throws
// PulseError(Configuration) on a malformed endpoint.
Endpoint parse_endpoint(const std::string& endpoint);

class TcpTransport {
public:
    TcpTransport(std::string endpoint, std::chrono::milliseconds timeout);
    ~TcpTransport();

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    // Write [4-byte big-endian length][payload]. Connects first if needed.
    // Returns false on any failure; the socket is then dropped and the next
    // call reconnects.
    bool send_frame(const uint8_t* data, size_t len);

    void close_connection();

    bool connected() const noexcept { return fd_ >= 0; }
    const std::string& endpoint() const noexcept { return endpoint_; }

private:
    // Throws PulseError(Network) when no resolved address accepts.
    void open();
    int dial(const struct addrinfo& addr) const;
    void tune(int fd) const;
    bool send_all(const uint8_t* data, size_t len);

    std::string endpoint_;
    Endpoint target_;
    std::chrono::milliseconds timeout_;
    int fd_ = -1;
};

} // namespace pulse
