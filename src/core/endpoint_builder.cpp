/**
 * @file endpoint_builder.cpp
 * @brief EndpointBuilder implementation.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#include "mcdisc/core/endpoint_builder.hpp"
#include "mcdisc/core/async_endpoint.hpp"
#include "mcdisc/core/errors.hpp"
#include "mcdisc/core/sync_endpoint.hpp"
#include "mcdisc/net/address.hpp"
#include "mcdisc/utils/logger.hpp"

namespace mcdisc {
namespace core {

namespace {

void requireUtf8(const std::string& text, const char* what) {
    if (!isValidUtf8(text)) {
        throw DiscoveryError(ErrorCode::INVALID_NAME, std::string(what) + " is not valid UTF-8");
    }
}

}  // namespace

EndpointBuilder::EndpointBuilder(std::string name)
    : name_(std::move(name))
{
    requireUtf8(name_, "Endpoint name");
}

EndpointBuilder& EndpointBuilder::address(const std::string& address) {
    if (!net::isValidIpAddress(address)) {
        throw DiscoveryError(ErrorCode::INVALID_ADDRESS, "Not an IP address: '" + address + "'");
    }
    address_ = address;
    return *this;
}

EndpointBuilder& EndpointBuilder::host(const ServiceKind& kind, uint16_t port) {
    requireUtf8(kind, "Service kind");
    for (const auto& role : roles_) {
        const auto* hosting = std::get_if<Hosting>(&role);
        if (!hosting) {
            continue;
        }
        if (hosting->kind == kind) {
            throw DiscoveryError(ErrorCode::DUPLICATE_SERVICE,
                                 "Service '" + kind + "' is already hosted");
        }
        if (hosting->port == port) {
            throw DiscoveryError(ErrorCode::DUPLICATE_SERVICE,
                                 "Port " + std::to_string(port) + " is already used by '" +
                                 hosting->kind + "'");
        }
    }
    roles_.emplace_back(Hosting{kind, port});
    return *this;
}

EndpointBuilder& EndpointBuilder::search(const ServiceKind& kind) {
    requireUtf8(kind, "Service kind");
    const Searching searching{kind};
    for (const auto& role : roles_) {
        if (const auto* existing = std::get_if<Searching>(&role)) {
            if (*existing == searching) {
                return *this;
            }
        }
    }
    roles_.emplace_back(searching);
    return *this;
}

EndpointBuilder& EndpointBuilder::options(const EndpointOptions& options) {
    options_ = options;
    return *this;
}

Announcement EndpointBuilder::announcement() const {
    Announcement local;
    local.identity.name = name_;
    local.roles = roles_;

    if (address_) {
        local.identity.address = *address_;
        return local;
    }

    auto resolved = net::resolveLocalAddress();
    if (!resolved) {
        throw DiscoveryError(ErrorCode::ADDRESS_RESOLUTION,
                             "Could not determine a local address for '" + name_ + "'");
    }
    LOG_DEBUG("Builder", "Resolved local address {} for {}", *resolved, name_);
    local.identity.address = *resolved;
    return local;
}

std::unique_ptr<SyncEndpoint> EndpointBuilder::buildSync() const {
    return std::make_unique<SyncEndpoint>(announcement(), options_);
}

std::shared_ptr<AsyncEndpoint> EndpointBuilder::buildAsync(boost::asio::io_context& io) const {
    return AsyncEndpoint::create(io, announcement(), options_);
}

}  // namespace core
}  // namespace mcdisc
