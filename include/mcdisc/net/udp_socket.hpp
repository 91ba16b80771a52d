/**
 * @file udp_socket.hpp
 * @brief IPv4 UDP socket that can join the discovery multicast group.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#pragma once

#include "mcdisc/net/export.hpp"
#include "mcdisc/net/platform.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace mcdisc {
namespace net {

/**
 * @struct SocketAddress
 * @brief IP address and port pair.
 */
struct MCDISC_NET_API SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : ip("0.0.0.0"), port(0) {}
    SocketAddress(const std::string& ip_, uint16_t port_) : ip(ip_), port(port_) {}

    std::string toString() const { return ip + ":" + std::to_string(port); }

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }
};

/**
 * @class UdpSocket
 * @brief RAII UDP socket wrapper with multicast support.
 *
 * Usage:
 * @code
 * UdpSocket sock;
 * sock.setReuseAddress(true);
 * sock.bind(8787);
 * sock.joinMulticastGroup("224.0.0.87");
 *
 * std::vector<uint8_t> buffer(1500);
 * SocketAddress sender;
 * int received = sock.receiveFrom(buffer.data(), buffer.size(), 100, sender);
 *
 * sock.sendTo(SocketAddress("224.0.0.87", 8787), data.data(), data.size());
 * @endcode
 */
class MCDISC_NET_API UdpSocket {
public:
    /**
     * @brief Create an unbound UDP socket.
     * Check isValid() afterwards; creation failures are logged.
     */
    UdpSocket();

    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }

    /**
     * @brief Bind the socket to a local port.
     * @param port The port to bind to (0 for auto-assign).
     * @param address The local address to bind to (default: any).
     * @return True on success.
     */
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    /**
     * @brief Set the default destination of the socket.
     *
     * No traffic is generated. Used to let the routing table pick the
     * outgoing interface, see getLocalAddress().
     */
    bool connect(const SocketAddress& remote);

    uint16_t getLocalPort() const;

    /**
     * @brief Local address the socket is bound or routed to.
     * @return Dotted-decimal address, or an empty string on failure.
     */
    std::string getLocalAddress() const;

    /**
     * @brief Enable address reuse (SO_REUSEADDR, and SO_REUSEPORT where available).
     * Call before bind().
     */
    bool setReuseAddress(bool enable);

    /**
     * @brief Set the multicast TTL (time-to-live / hop limit).
     * @param ttl TTL value (1 = local subnet only).
     */
    bool setMulticastTTL(int ttl);

    /**
     * @brief Enable/disable multicast loopback.
     * When enabled, the sender also receives its own multicast packets.
     */
    bool setMulticastLoopback(bool enable);

    /**
     * @brief Set the outgoing interface for multicast packets.
     * @param interfaceAddress IP address of the local interface.
     */
    bool setMulticastInterface(const std::string& interfaceAddress);

    /**
     * @brief Join a multicast group.
     * @param groupAddress Multicast group IP (e.g., "224.0.0.87").
     * @param interfaceAddress Local interface IP (empty = default).
     */
    bool joinMulticastGroup(const std::string& groupAddress,
                            const std::string& interfaceAddress = "");

    bool leaveMulticastGroup(const std::string& groupAddress,
                             const std::string& interfaceAddress = "");

    /**
     * @brief Send data to an address.
     * @return Number of bytes sent, or -1 on error.
     */
    int sendTo(const SocketAddress& dest, const void* data, size_t length);

    /**
     * @brief Receive data with timeout.
     * @param buffer Buffer to receive into.
     * @param bufferSize Size of the buffer.
     * @param timeoutMs Timeout in milliseconds (0 = non-blocking, -1 = infinite).
     * @param sender Output: address of the sender.
     * @return Number of bytes received, 0 on timeout, -1 on error.
     */
    int receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                    SocketAddress& sender);

    void close();

    int getLastError() const { return lastError_; }

private:
    SocketHandle socket_;
    int lastError_;

    bool localName(SocketAddress& out) const;
    bool setIpOption(int name, const void* value, size_t size);
    bool changeMembership(int option, const std::string& groupAddress,
                          const std::string& interfaceAddress);
    int waitReadable(int timeoutMs);
    void setLastError();
};

}  // namespace net
}  // namespace mcdisc
