// src/transport.cpp
// TCP transport.

#include "transport.hpp"

#include <cerrno>
#include <memory>
#include <stdexcept>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace pulse {

Endpoint parse_endpoint(const std::string& endpoint) {
    const auto sep = endpoint.rfind(':');
    if (sep == std::string::npos || sep == 0 || sep + 1 == endpoint.size()) {
        throw PulseError::configuration("endpoint must be host:port, got: " + endpoint);
    }

    Endpoint out;
    out.host = endpoint.substr(0, sep);
    if (out.host.size() > 2 && out.host.front() == '[' && out.host.back() == ']') {
        out.host = out.host.substr(1, out.host.size() - 2);
    }

    unsigned long port = 0;
    for (size_t i = sep + 1; i < endpoint.size(); i++) {
        char c = endpoint[i];
        if (c < '0' || c > '9') {
            throw PulseError::configuration("endpoint port is not a number: " + endpoint);
        }
        port = port * 10 + static_cast<unsigned long>(c - '0');
        if (port > 65535) break;
    }
    if (port == 0 || port > 65535) {
        throw PulseError::configuration("endpoint port must be 1-65535: " + endpoint);
    }
    out.port = static_cast<uint16_t>(port);
    return out;
}

TcpTransport::TcpTransport(std::string endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), target_(parse_endpoint(endpoint_)), timeout_(timeout) {}

TcpTransport::~TcpTransport() {
    close_connection();
}

void TcpTransport::close_connection() {
    if (fd_ < 0) return;
    ::close(fd_);
    fd_ = -1;
}

// Connect `addr` within timeout_. Returns a blocking fd or -1.
int TcpTransport::dial(const struct addrinfo& addr) const {
    int fd = ::socket(addr.ai_family, addr.ai_socktype, addr.ai_protocol);
    if (fd < 0) return -1;

    const int flags = ::fcntl(fd, F_GETFL, 0);
    bool ok = flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;

    if (ok && ::connect(fd, addr.ai_addr, addr.ai_addrlen) != 0) {
        ok = errno == EINPROGRESS;
        if (ok) {
            struct pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLOUT;
            int err = 0;
            socklen_t err_len = sizeof(err);
            ok = ::poll(&pfd, 1, static_cast<int>(timeout_.count())) > 0
                && ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &err_len) == 0
                && err == 0;
        }
    }

    if (!ok || ::fcntl(fd, F_SETFL, flags) != 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

void TcpTransport::tune(int fd) const {
    const int on = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on));
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));

    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout_.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout_.count() % 1000) * 1000);
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

void TcpTransport::open() {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    struct addrinfo* found = nullptr;
    const std::string port = std::to_string(target_.port);
    if (::getaddrinfo(target_.host.c_str(), port.c_str(), &hints, &found) != 0 || !found) {
        throw PulseError::network("cannot resolve " + target_.host);
    }
    std::unique_ptr<struct addrinfo, decltype(&::freeaddrinfo)> results(found, &::freeaddrinfo);

    for (const struct addrinfo* a = results.get(); a != nullptr; a = a->ai_next) {
        int fd = dial(*a);
        if (fd >= 0) {
            tune(fd);
            fd_ = fd;
            return;
        }
    }
    throw PulseError::network("cannot connect to " + endpoint_);
}

bool TcpTransport::send_all(const uint8_t* data, size_t len) {
    while (len > 0) {
        ssize_t n = ::send(fd_, data, len, MSG_NOSIGNAL);
        if (n <= 0) {
            close_connection();
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

bool TcpTransport::send_frame(const uint8_t* data, size_t len) {
    if (len > UINT32_MAX) return false;

    if (!connected()) {
        try {
            open();
        } catch (const PulseError&) {
            return false;
        }
    }

    const auto n = static_cast<uint32_t>(len);
    const uint8_t prefix[4] = {
        static_cast<uint8_t>(n >> 24), static_cast<uint8_t>(n >> 16),
        static_cast<uint8_t>(n >> 8), static_cast<uint8_t>(n),
    };
    return send_all(prefix, sizeof(prefix)) && send_all(data, len);
}

} // namespace pulse
