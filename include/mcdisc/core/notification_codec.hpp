/**
 * @file notification_codec.hpp
 * @brief JSON wire encoding of announcements.
 *
 * The schema lives in proto/mcdisc/proto/announcement.proto; the JSON text is
 * produced and parsed with protobuf's JSON mapping. Decoding is strict and
 * never throws: anything that is not a complete, well-formed announcement
 * comes back as nullopt.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#pragma once

#include "mcdisc/core/export.hpp"
#include "mcdisc/core/service.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace mcdisc {
namespace core {

class MCDISC_CORE_API NotificationCodec {
public:
    /**
     * @brief Serialize an announcement to its JSON wire form.
     * @return The datagram payload, or nullopt if serialization failed.
     */
    static std::optional<std::string> encode(const Announcement& announcement);

    /**
     * @brief Parse a datagram payload.
     *
     * Rejected payloads:
     * - not a JSON object, or containing unknown fields
     * - missing "name", "addr" or "services"
     * - "addr" that is not an IP address
     * - a service entry that is neither {"Host":{...}} nor {"Search":{...}}
     * - a Host without "kind" or "port", a port above 65535
     * - a Search without "kind"
     */
    static std::optional<Announcement> decode(const std::string& payload);

    static std::optional<Announcement> decode(const void* data, size_t length) {
        return decode(std::string(static_cast<const char*>(data), length));
    }
};

}  // namespace core
}  // namespace mcdisc
