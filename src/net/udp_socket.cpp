/**
 * @file udp_socket.cpp
 * @brief IPv4 datagram socket used by the discovery transport.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#include "mcdisc/net/udp_socket.hpp"
#include "mcdisc/utils/logger.hpp"

namespace mcdisc {
namespace net {

namespace {

#ifdef _WIN32
using OptionPtr = const char*;
using IoLength = int;
#else
using OptionPtr = const void*;
using IoLength = size_t;
#endif

template<typename T>
bool applyOption(SocketHandle socket, int level, int name, const T& value) {
    return ::setsockopt(socket, level, name, reinterpret_cast<OptionPtr>(&value),
                        sizeof(value)) == 0;
}

// Empty or "0.0.0.0" selects INADDR_ANY
bool toInAddr(const std::string& text, struct in_addr& out) {
    if (text.empty() || text == "0.0.0.0") {
        out.s_addr = htonl(INADDR_ANY);
        return true;
    }
    return inet_pton(AF_INET, text.c_str(), &out) == 1;
}

bool toSockaddr(const std::string& ip, uint16_t port, struct sockaddr_in& out) {
    out = sockaddr_in{};
    out.sin_family = AF_INET;
    out.sin_port = htons(port);
    return toInAddr(ip, out.sin_addr);
}

SocketAddress fromSockaddr(const struct sockaddr_in& in) {
    SocketAddress result;
    char text[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &in.sin_addr, text, sizeof(text)) != nullptr) {
        result.ip = text;
    } else {
        result.ip.clear();
    }
    result.port = ntohs(in.sin_port);
    return result;
}

struct sockaddr* asGeneric(struct sockaddr_in& addr) {
    return reinterpret_cast<struct sockaddr*>(&addr);
}

}  // namespace

UdpSocket::UdpSocket()
    : socket_(INVALID_SOCKET_HANDLE)
    , lastError_(0)
{
    if (!ensureSocketsInitialized()) {
        setLastError();
        LOG_ERROR("UdpSocket", "Socket library initialization failed: error {}", lastError_);
        return;
    }

    socket_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (socket_ == INVALID_SOCKET_HANDLE) {
        setLastError();
        LOG_ERROR("UdpSocket", "Failed to create socket: error {}", lastError_);
    }
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : socket_(other.socket_)
    , lastError_(other.lastError_)
{
    other.socket_ = INVALID_SOCKET_HANDLE;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        lastError_ = other.lastError_;
        other.socket_ = INVALID_SOCKET_HANDLE;
    }
    return *this;
}

bool UdpSocket::bind(uint16_t port, const std::string& address) {
    struct sockaddr_in addr;
    if (!isValid() || !toSockaddr(address, port, addr)) {
        LOG_ERROR("UdpSocket", "Cannot bind to {}:{}", address, port);
        return false;
    }

    if (::bind(socket_, asGeneric(addr), sizeof(addr)) != 0) {
        setLastError();
        LOG_ERROR("UdpSocket", "Failed to bind to {}:{} - error {}", address, port, lastError_);
        return false;
    }

    LOG_DEBUG("UdpSocket", "Bound to {}:{}", address, port);
    return true;
}

bool UdpSocket::connect(const SocketAddress& remote) {
    struct sockaddr_in addr;
    if (!isValid() || remote.ip.empty() || !toSockaddr(remote.ip, remote.port, addr)) {
        return false;
    }

    if (::connect(socket_, asGeneric(addr), sizeof(addr)) != 0) {
        setLastError();
        LOG_DEBUG("UdpSocket", "No route to {} - error {}", remote.toString(), lastError_);
        return false;
    }
    return true;
}

bool UdpSocket::localName(SocketAddress& out) const {
    if (!isValid()) {
        return false;
    }

    struct sockaddr_in addr{};
    socklen_t length = sizeof(addr);
    if (::getsockname(socket_, asGeneric(addr), &length) != 0) {
        return false;
    }
    out = fromSockaddr(addr);
    return true;
}

uint16_t UdpSocket::getLocalPort() const {
    SocketAddress local;
    return localName(local) ? local.port : 0;
}

std::string UdpSocket::getLocalAddress() const {
    SocketAddress local;
    return localName(local) ? local.ip : std::string();
}

bool UdpSocket::setReuseAddress(bool enable) {
    const int flag = enable ? 1 : 0;
    if (!isValid()) {
        return false;
    }
    if (!applyOption(socket_, SOL_SOCKET, SO_REUSEADDR, flag)) {
        setLastError();
        return false;
    }

#ifdef SO_REUSEPORT
    // Several endpoints on one host share the discovery port
    if (!applyOption(socket_, SOL_SOCKET, SO_REUSEPORT, flag)) {
        setLastError();
        LOG_WARN("UdpSocket", "Failed to set SO_REUSEPORT: error {}", lastError_);
    }
#endif
    return true;
}

bool UdpSocket::setMulticastTTL(int ttl) {
    const unsigned char hops = static_cast<unsigned char>(ttl);
    return setIpOption(IP_MULTICAST_TTL, &hops, sizeof(hops));
}

bool UdpSocket::setMulticastLoopback(bool enable) {
    const unsigned char loop = enable ? 1 : 0;
    return setIpOption(IP_MULTICAST_LOOP, &loop, sizeof(loop));
}

bool UdpSocket::setMulticastInterface(const std::string& interfaceAddress) {
    struct in_addr local{};
    if (!toInAddr(interfaceAddress, local)) {
        LOG_ERROR("UdpSocket", "Invalid interface address: {}", interfaceAddress);
        return false;
    }
    return setIpOption(IP_MULTICAST_IF, &local, sizeof(local));
}

bool UdpSocket::joinMulticastGroup(const std::string& groupAddress,
                                   const std::string& interfaceAddress) {
    if (!changeMembership(IP_ADD_MEMBERSHIP, groupAddress, interfaceAddress)) {
        LOG_ERROR("UdpSocket", "Failed to join multicast group {}: error {}",
                  groupAddress, lastError_);
        return false;
    }
    LOG_DEBUG("UdpSocket", "Joined multicast group {}", groupAddress);
    return true;
}

bool UdpSocket::leaveMulticastGroup(const std::string& groupAddress,
                                    const std::string& interfaceAddress) {
    if (!changeMembership(IP_DROP_MEMBERSHIP, groupAddress, interfaceAddress)) {
        return false;
    }
    LOG_DEBUG("UdpSocket", "Left multicast group {}", groupAddress);
    return true;
}

int UdpSocket::sendTo(const SocketAddress& dest, const void* data, size_t length) {
    struct sockaddr_in addr;
    if (!isValid()) {
        return -1;
    }
    if (dest.ip.empty() || !toSockaddr(dest.ip, dest.port, addr)) {
        LOG_ERROR("UdpSocket", "Invalid destination address: {}", dest.ip);
        return -1;
    }

    const auto sent = ::sendto(socket_, static_cast<const char*>(data),
                               static_cast<IoLength>(length), 0, asGeneric(addr), sizeof(addr));
    if (sent < 0) {
        setLastError();
        return -1;
    }
    return static_cast<int>(sent);
}

int UdpSocket::receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                           SocketAddress& sender) {
    if (!isValid()) {
        return -1;
    }

    if (timeoutMs >= 0) {
        const int ready = waitReadable(timeoutMs);
        if (ready <= 0) {
            return ready;
        }
    }

    struct sockaddr_in from{};
    socklen_t fromLength = sizeof(from);
    const auto received = ::recvfrom(socket_, static_cast<char*>(buffer),
                                     static_cast<IoLength>(bufferSize), 0,
                                     asGeneric(from), &fromLength);
    if (received < 0) {
        setLastError();
        return -1;
    }

    sender = fromSockaddr(from);
    return static_cast<int>(received);
}

void UdpSocket::close() {
    if (isValid()) {
        closeSocketHandle(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
}

bool UdpSocket::setIpOption(int name, const void* value, size_t size) {
    if (!isValid()) {
        return false;
    }
    if (::setsockopt(socket_, IPPROTO_IP, name, reinterpret_cast<OptionPtr>(value),
                     static_cast<socklen_t>(size)) != 0) {
        setLastError();
        return false;
    }
    return true;
}

bool UdpSocket::changeMembership(int option, const std::string& groupAddress,
                                 const std::string& interfaceAddress) {
    struct ip_mreq membership{};
    if (groupAddress.empty() ||
        inet_pton(AF_INET, groupAddress.c_str(), &membership.imr_multiaddr) != 1) {
        LOG_ERROR("UdpSocket", "Invalid multicast group address: {}", groupAddress);
        return false;
    }
    if (!toInAddr(interfaceAddress, membership.imr_interface)) {
        LOG_ERROR("UdpSocket", "Invalid interface address: {}", interfaceAddress);
        return false;
    }
    return setIpOption(option, &membership, sizeof(membership));
}

// 1 when readable, 0 on timeout or signal, -1 on error
int UdpSocket::waitReadable(int timeoutMs) {
    fd_set readable;
    FD_ZERO(&readable);
    FD_SET(socket_, &readable);

    struct timeval wait;
    wait.tv_sec = timeoutMs / 1000;
    wait.tv_usec = (timeoutMs % 1000) * 1000;

#ifdef _WIN32
    const int result = ::select(0, &readable, nullptr, nullptr, &wait);
#else
    const int result = ::select(socket_ + 1, &readable, nullptr, nullptr, &wait);
#endif
    if (result >= 0) {
        return result > 0 ? 1 : 0;
    }

    setLastError();
#ifndef _WIN32
    if (lastError_ == EINTR) {
        return 0;
    }
#endif
    return -1;
}

void UdpSocket::setLastError() {
    lastError_ = getLastSocketError();
}

}  // namespace net
}  // namespace mcdisc
