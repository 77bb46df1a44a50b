/**
 * @file udp_socket.cpp
 * @brief UdpSocket implementation using POSIX sockets.
 * @author Dimitris Kafetzis
 */

#include "network/udp_socket.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace hydramesh {

namespace {

/**
 * @brief Resolve an IPv4 literal or hostname into a sockaddr_in.
 */
Result<sockaddr_in> resolve(const Endpoint& endpoint) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(endpoint.port);

    if (::inet_pton(AF_INET, endpoint.host.c_str(), &addr.sin_addr) == 1) {
        return addr;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo* found = nullptr;

    int rc = ::getaddrinfo(endpoint.host.c_str(), nullptr, &hints, &found);
    if (rc != 0 || found == nullptr) {
        return Error{"Cannot resolve host '" + endpoint.host + "': " + ::gai_strerror(rc)};
    }
    addr.sin_addr = reinterpret_cast<const sockaddr_in*>(found->ai_addr)->sin_addr;
    ::freeaddrinfo(found);
    return addr;
}

Endpoint to_endpoint(const sockaddr_in& addr) {
    char ip_buf[INET_ADDRSTRLEN];
    ::inet_ntop(AF_INET, &addr.sin_addr, ip_buf, sizeof(ip_buf));
    return Endpoint{std::string(ip_buf), ntohs(addr.sin_port)};
}

}  // anonymous namespace

Result<Endpoint> parse_endpoint(const std::string& text) {
    auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
        return Error{"Expected host:port, got '" + text + "'"};
    }

    uint32_t port = 0;
    const char* first = text.data() + colon + 1;
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, port);
    if (ec != std::errc{} || ptr != last || port == 0 || port > 65535) {
        return Error{"Invalid port in '" + text + "'"};
    }

    return Endpoint{text.substr(0, colon), static_cast<uint16_t>(port)};
}

Result<Endpoint> resolve_endpoint(const Endpoint& endpoint) {
    auto addr = resolve(endpoint);
    if (!addr) return addr.error();
    return to_endpoint(*addr);
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

UdpSocket::~UdpSocket() {
    close();
}

Result<void> UdpSocket::bind(uint16_t port, const std::string& address) {
    if (fd_.load() >= 0) {
        return Error{"Socket already bound"};
    }

    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK, 0);
    if (fd < 0) {
        return Error{"Failed to create UDP socket: " + std::string(strerror(errno))};
    }

    int optval = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    auto local = resolve(Endpoint{address, port});
    if (!local) {
        ::close(fd);
        return local.error();
    }

    if (::bind(fd, reinterpret_cast<const sockaddr*>(&*local), sizeof(sockaddr_in)) < 0) {
        auto err = std::string(strerror(errno));
        ::close(fd);
        return Error{"Bind to " + address + ":" + std::to_string(port) + " failed: " + err};
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        local_port_ = ntohs(bound.sin_port);
    } else {
        local_port_ = port;
    }

    fd_.store(fd);
    return Result<void>{};
}

void UdpSocket::close() {
    int fd = fd_.exchange(-1);
    if (fd >= 0) {
        ::close(fd);
    }
}

// ─────────────────────────────────────────────
// I/O
// ─────────────────────────────────────────────

Result<void> UdpSocket::send_to(const Endpoint& destination, std::span<const uint8_t> data) {
    int fd = fd_.load();
    if (fd < 0) {
        return Error{"Socket not open"};
    }
    if (data.size() > MAX_DATAGRAM_SIZE) {
        return Error{"Datagram too large: " + std::to_string(data.size()) + " bytes"};
    }

    auto dest = resolve(destination);
    if (!dest) return dest.error();

    auto sent = ::sendto(fd, data.data(), data.size(), MSG_NOSIGNAL,
                         reinterpret_cast<const sockaddr*>(&*dest), sizeof(sockaddr_in));
    if (sent < 0) {
        return Error{"sendto " + destination.to_string() + " failed: " + std::string(strerror(errno))};
    }
    return Result<void>{};
}

Result<std::optional<Datagram>> UdpSocket::receive(uint32_t timeout_ms) {
    int fd = fd_.load();
    if (fd < 0) {
        return Error{"Socket not open"};
    }

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;

    int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
    if (ready < 0) {
        if (errno == EINTR) return std::optional<Datagram>{};
        return Error{"poll failed: " + std::string(strerror(errno))};
    }
    if (ready == 0) {
        return std::optional<Datagram>{};
    }

    std::vector<uint8_t> buffer(MAX_DATAGRAM_SIZE);
    sockaddr_in sender{};
    socklen_t addr_len = sizeof(sender);

    auto received = ::recvfrom(fd, buffer.data(), buffer.size(), 0,
                               reinterpret_cast<sockaddr*>(&sender), &addr_len);
    if (received < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return std::optional<Datagram>{};
        }
        // ICMP port-unreachable from an earlier send surfaces here on Linux.
        if (errno == ECONNREFUSED) {
            return std::optional<Datagram>{};
        }
        return Error{"recvfrom failed: " + std::string(strerror(errno))};
    }

    buffer.resize(static_cast<size_t>(received));
    return std::optional<Datagram>{Datagram{to_endpoint(sender), std::move(buffer)}};
}

}  // namespace hydramesh
