/**
 * @file endpoint_builder.hpp
 * @brief Fluent construction of discovery endpoints.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#pragma once

#include "mcdisc/core/endpoint_options.hpp"
#include "mcdisc/core/export.hpp"
#include "mcdisc/core/service.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace boost {
namespace asio {
class io_context;
}  // namespace asio
}  // namespace boost

namespace mcdisc {
namespace core {

class SyncEndpoint;
class AsyncEndpoint;

/**
 * @class EndpointBuilder
 * @brief Collects identity, roles and options, then creates an endpoint.
 *
 * Usage:
 * @code
 * auto endpoint = EndpointBuilder("greeter")
 *                     .host("hello", 4112)
 *                     .search("time")
 *                     .buildSync();
 * @endcode
 *
 * All errors are reported as DiscoveryError.
 */
class MCDISC_CORE_API EndpointBuilder {
public:
    /**
     * @throws DiscoveryError (INVALID_NAME) if @p name is not valid UTF-8.
     */
    explicit EndpointBuilder(std::string name);

    /**
     * @brief Use @p address instead of resolving the local address.
     * @throws DiscoveryError (INVALID_ADDRESS) if it is not an IPv4/IPv6 literal.
     */
    EndpointBuilder& address(const std::string& address);

    /**
     * @brief Offer @p kind on @p port.
     * @throws DiscoveryError (DUPLICATE_SERVICE) if the kind or the port is already hosted,
     *         (INVALID_NAME) if @p kind is not valid UTF-8.
     */
    EndpointBuilder& host(const ServiceKind& kind, uint16_t port);

    /**
     * @brief Look for hosts of @p kind. Repeated kinds are ignored.
     * @throws DiscoveryError (INVALID_NAME) if @p kind is not valid UTF-8.
     */
    EndpointBuilder& search(const ServiceKind& kind);

    EndpointBuilder& options(const EndpointOptions& options);

    EndpointOptions& options() { return options_; }
    const EndpointOptions& options() const { return options_; }

    /**
     * @brief The announcement the endpoint will send.
     * @throws DiscoveryError (ADDRESS_RESOLUTION) if no address was given
     *         and none could be resolved.
     */
    Announcement announcement() const;

    /**
     * @throws DiscoveryError on resolution or transport failure.
     */
    std::unique_ptr<SyncEndpoint> buildSync() const;

    /**
     * @throws DiscoveryError on resolution or transport failure.
     */
    std::shared_ptr<AsyncEndpoint> buildAsync(boost::asio::io_context& io) const;

private:
    std::string name_;
    std::optional<std::string> address_;
    std::vector<ServiceRole> roles_;
    EndpointOptions options_;
};

}  // namespace core
}  // namespace mcdisc
