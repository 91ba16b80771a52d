/**
 * @file service.hpp
 * @brief Service descriptor model shared by every discovery component.
 *
 * An endpoint is described by an Identity (name + reachable address) and a
 * list of roles: services it hosts on a port, and services it searches for.
 * The whole description is what goes on the wire as an Announcement.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#pragma once

#include "mcdisc/core/export.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace mcdisc {
namespace core {

/// Service category name, compared by exact (case-sensitive) match.
using ServiceKind = std::string;

/**
 * @struct Hosting
 * @brief "I offer @c kind on @c port".
 */
struct MCDISC_CORE_API Hosting {
    ServiceKind kind;
    uint16_t port = 0;

    bool operator==(const Hosting& other) const {
        return kind == other.kind && port == other.port;
    }
    bool operator!=(const Hosting& other) const { return !(*this == other); }
};

/**
 * @struct Searching
 * @brief "I want @c kind".
 */
struct MCDISC_CORE_API Searching {
    ServiceKind kind;

    bool operator==(const Searching& other) const { return kind == other.kind; }
    bool operator!=(const Searching& other) const { return !(*this == other); }
};

using ServiceRole = std::variant<Hosting, Searching>;

MCDISC_CORE_API const ServiceKind& roleKind(const ServiceRole& role);

/**
 * @brief True if @p text is well-formed UTF-8. Names and kinds travel as
 *        JSON strings, which cannot carry anything else.
 */
MCDISC_CORE_API bool isValidUtf8(const std::string& text);

/**
 * @struct Identity
 * @brief Human-readable endpoint name and the address it is reachable on.
 */
struct MCDISC_CORE_API Identity {
    std::string name;
    std::string address;    ///< Textual IP address

    bool operator==(const Identity& other) const {
        return name == other.name && address == other.address;
    }
    bool operator!=(const Identity& other) const { return !(*this == other); }

    /// "name@address"
    std::string toString() const { return name + "@" + address; }
};

/**
 * @struct Announcement
 * @brief Everything an endpoint is and wants. One per datagram.
 */
struct MCDISC_CORE_API Announcement {
    Identity identity;
    std::vector<ServiceRole> roles;

    bool operator==(const Announcement& other) const {
        return identity == other.identity && roles == other.roles;
    }
    bool operator!=(const Announcement& other) const { return !(*this == other); }

    bool hosts(const ServiceKind& kind) const;
    bool searches(const ServiceKind& kind) const;
};

/**
 * @struct DiscoveryResult
 * @brief A remote endpoint hosting a service we are searching for.
 */
struct MCDISC_CORE_API DiscoveryResult {
    ServiceKind kind;
    Identity hosted_by;
    uint16_t port = 0;

    bool operator==(const DiscoveryResult& other) const {
        return kind == other.kind && hosted_by == other.hosted_by && port == other.port;
    }
    bool operator!=(const DiscoveryResult& other) const { return !(*this == other); }

    /// "address:port", bracketed for IPv6
    std::string endpoint() const;
};

MCDISC_CORE_API std::ostream& operator<<(std::ostream& os, const ServiceRole& role);
MCDISC_CORE_API std::ostream& operator<<(std::ostream& os, const Identity& identity);
MCDISC_CORE_API std::ostream& operator<<(std::ostream& os, const DiscoveryResult& result);

}  // namespace core
}  // namespace mcdisc
