/**
 * @file address.hpp
 * @brief IP address validation and local address discovery.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#pragma once

#include "mcdisc/net/export.hpp"

#include <optional>
#include <string>

namespace mcdisc {
namespace net {

/**
 * @brief True if @p text is a textual IPv4 or IPv6 address.
 */
MCDISC_NET_API bool isValidIpAddress(const std::string& text);

/**
 * @brief True if @p text is an IPv4 address in 224.0.0.0/4.
 */
MCDISC_NET_API bool isMulticastAddress(const std::string& text);

/**
 * @brief Determine the address other machines on the LAN can reach us at.
 *
 * First asks the routing table which source address would be used to reach
 * a public address (a connected UDP socket, nothing is sent). Falls back to
 * the first non-loopback IPv4 interface address.
 *
 * @return Dotted-decimal address, or nullopt if no usable address exists.
 */
MCDISC_NET_API std::optional<std::string> resolveLocalAddress();

}  // namespace net
}  // namespace mcdisc
