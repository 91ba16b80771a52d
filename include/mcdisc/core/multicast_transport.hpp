/**
 * @file multicast_transport.hpp
 * @brief The discovery multicast group as a datagram pipe.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#pragma once

#include "mcdisc/core/export.hpp"
#include "mcdisc/net/udp_socket.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace mcdisc {
namespace core {

/**
 * @struct MulticastConfig
 * @brief Where discovery traffic goes and how it is scoped.
 */
struct MCDISC_CORE_API MulticastConfig {
    std::string group;              ///< Multicast group address
    uint16_t port;                  ///< Multicast port, shared by all endpoints
    int ttl;                        ///< Multicast TTL (1 = local subnet)
    bool loopback;                  ///< Deliver to endpoints on this host too
    std::string interface_addr;     ///< Local interface for join/send (empty = default)

    MulticastConfig()
        : group("224.0.0.87")
        , port(8787)
        , ttl(1)
        , loopback(true)
    {}
};

/**
 * @class MulticastTransport
 * @brief Blocking send/receive on the discovery group.
 *
 * Usage:
 * @code
 * MulticastTransport transport(config);
 * if (!transport.open()) { ... }
 * transport.send(payload);
 * std::vector<uint8_t> buffer(MulticastTransport::kMaxDatagram);
 * int n = transport.receive(buffer, 100, sender);
 * transport.close();
 * @endcode
 */
class MCDISC_CORE_API MulticastTransport {
public:
    static constexpr size_t kMaxDatagram = 65536;

    explicit MulticastTransport(MulticastConfig config);

    /**
     * @brief Leaves the group and closes the socket.
     */
    ~MulticastTransport();

    MulticastTransport(const MulticastTransport&) = delete;
    MulticastTransport& operator=(const MulticastTransport&) = delete;

    /**
     * @brief Bind the group port and join the group.
     * @return False if any mandatory step failed; details are logged.
     */
    bool open();

    /**
     * @brief Send one datagram to the group.
     */
    bool send(const std::string& payload);

    /**
     * @brief Wait up to @p timeoutMs for one datagram.
     * @return Bytes received, 0 on timeout, -1 on error.
     */
    int receive(std::vector<uint8_t>& buffer, int timeoutMs, net::SocketAddress& sender);

    /**
     * @brief Leave the group and close the socket. Idempotent.
     */
    void close();

    bool isOpen() const { return joined_ && socket_.isValid(); }

    int lastError() const { return socket_.getLastError(); }

    const MulticastConfig& config() const { return config_; }

private:
    MulticastConfig config_;
    net::UdpSocket socket_;
    bool joined_ = false;
};

}  // namespace core
}  // namespace mcdisc
