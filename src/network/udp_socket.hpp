/**
 * @file udp_socket.hpp
 * @brief Non-blocking UDP datagram socket with poll()-based receive timeouts.
 * @author Dimitris Kafetzis
 *
 * One datagram is one protocol message; there is no stream framing. Sends are
 * fire-and-forget: a successful send only means the kernel accepted the datagram.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace hydramesh {

/**
 * @brief A received datagram and the endpoint it came from.
 */
struct Datagram {
    Endpoint source;
    std::vector<uint8_t> data;
};

/**
 * @brief Parse "host:port" into an Endpoint.
 */
Result<Endpoint> parse_endpoint(const std::string& text);

/**
 * @brief Resolve a hostname once into a numeric IPv4 Endpoint.
 *
 * Sending to the returned endpoint skips name lookup. Literal addresses
 * come back unchanged.
 */
Result<Endpoint> resolve_endpoint(const Endpoint& endpoint);

class UdpSocket {
public:
    static constexpr size_t MAX_DATAGRAM_SIZE = 65535;

    UdpSocket() = default;
    ~UdpSocket();

    // Non-copyable
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    /// Bind to @p address:@p port. Port 0 lets the OS choose (see local_port()).
    Result<void> bind(uint16_t port, const std::string& address = "0.0.0.0");

    Result<void> send_to(const Endpoint& destination, std::span<const uint8_t> data);

    /**
     * @brief Wait up to @p timeout_ms for one datagram.
     *
     * Returns nullopt on timeout so callers can check their stop token.
     */
    Result<std::optional<Datagram>> receive(uint32_t timeout_ms);

    void close();

    [[nodiscard]] bool is_open() const noexcept { return fd_.load() >= 0; }
    [[nodiscard]] uint16_t local_port() const noexcept { return local_port_; }

private:
    std::atomic<int> fd_{-1};
    uint16_t local_port_{0};
};

}  // namespace hydramesh
