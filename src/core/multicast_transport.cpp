/**
 * @file multicast_transport.cpp
 * @brief MulticastTransport implementation.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#include "mcdisc/core/multicast_transport.hpp"
#include "mcdisc/utils/logger.hpp"

namespace mcdisc {
namespace core {

MulticastTransport::MulticastTransport(MulticastConfig config)
    : config_(std::move(config))
{}

MulticastTransport::~MulticastTransport() {
    close();
}

bool MulticastTransport::open() {
    if (!socket_.isValid()) {
        LOG_ERROR("Transport", "Socket not valid");
        return false;
    }

    if (!socket_.setReuseAddress(true)) {
        LOG_ERROR("Transport", "Failed to set SO_REUSEADDR: error {}", socket_.getLastError());
        return false;
    }

    if (!socket_.bind(config_.port)) {
        LOG_ERROR("Transport", "Failed to bind to port {}", config_.port);
        return false;
    }

    if (!socket_.joinMulticastGroup(config_.group, config_.interface_addr)) {
        LOG_ERROR("Transport", "Failed to join multicast group {}", config_.group);
        return false;
    }
    joined_ = true;

    if (!config_.interface_addr.empty() &&
        !socket_.setMulticastInterface(config_.interface_addr)) {
        LOG_WARN("Transport", "Failed to set multicast interface {}", config_.interface_addr);
    }

    if (!socket_.setMulticastTTL(config_.ttl)) {
        LOG_WARN("Transport", "Failed to set multicast TTL");
    }

    if (!socket_.setMulticastLoopback(config_.loopback)) {
        LOG_WARN("Transport", "Failed to set multicast loopback");
    }

    LOG_DEBUG("Transport", "Listening on {}:{}", config_.group, config_.port);
    return true;
}

bool MulticastTransport::send(const std::string& payload) {
    net::SocketAddress dest(config_.group, config_.port);
    int sent = socket_.sendTo(dest, payload.data(), payload.size());

    if (sent < 0) {
        LOG_ERROR("Transport", "Failed to send to {}: error {}",
                  dest.toString(), socket_.getLastError());
        return false;
    }

    LOG_TRACE("Transport", "Sent {} bytes to {}", sent, dest.toString());
    return true;
}

int MulticastTransport::receive(std::vector<uint8_t>& buffer, int timeoutMs,
                                net::SocketAddress& sender) {
    if (buffer.size() < kMaxDatagram) {
        buffer.resize(kMaxDatagram);
    }
    return socket_.receiveFrom(buffer.data(), buffer.size(), timeoutMs, sender);
}

void MulticastTransport::close() {
    if (joined_) {
        if (!socket_.leaveMulticastGroup(config_.group, config_.interface_addr)) {
            LOG_DEBUG("Transport", "Leaving group {} failed: error {}",
                      config_.group, socket_.getLastError());
        }
        joined_ = false;
    }
    socket_.close();
}

}  // namespace core
}  // namespace mcdisc
