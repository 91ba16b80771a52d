/**
 * @file service.cpp
 * @brief Service descriptor helpers.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#include "mcdisc/core/service.hpp"

#include <algorithm>

namespace mcdisc {
namespace core {

const ServiceKind& roleKind(const ServiceRole& role) {
    return std::visit([](const auto& r) -> const ServiceKind& { return r.kind; }, role);
}

bool isValidUtf8(const std::string& text) {
    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        size_t length = 0;
        uint32_t code = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code = lead & 0x07;
        } else {
            return false;
        }

        if (i + length > text.size()) {
            return false;
        }
        for (size_t k = 1; k < length; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code = (code << 6) | (next & 0x3F);
        }

        // Overlong forms, surrogates and values past U+10FFFF
        static const uint32_t kMinimum[] = {0, 0, 0x80, 0x800, 0x10000};
        if (code < kMinimum[length] || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
            return false;
        }
        i += length;
    }
    return true;
}

bool Announcement::hosts(const ServiceKind& kind) const {
    return std::any_of(roles.begin(), roles.end(), [&kind](const ServiceRole& role) {
        const auto* hosting = std::get_if<Hosting>(&role);
        return hosting != nullptr && hosting->kind == kind;
    });
}

bool Announcement::searches(const ServiceKind& kind) const {
    return std::any_of(roles.begin(), roles.end(), [&kind](const ServiceRole& role) {
        const auto* searching = std::get_if<Searching>(&role);
        return searching != nullptr && searching->kind == kind;
    });
}

std::string DiscoveryResult::endpoint() const {
    if (hosted_by.address.find(':') != std::string::npos) {
        return "[" + hosted_by.address + "]:" + std::to_string(port);
    }
    return hosted_by.address + ":" + std::to_string(port);
}

std::ostream& operator<<(std::ostream& os, const ServiceRole& role) {
    if (const auto* hosting = std::get_if<Hosting>(&role)) {
        return os << "host(" << hosting->kind << ":" << hosting->port << ")";
    }
    return os << "search(" << roleKind(role) << ")";
}

std::ostream& operator<<(std::ostream& os, const Identity& identity) {
    return os << identity.toString();
}

std::ostream& operator<<(std::ostream& os, const DiscoveryResult& result) {
    return os << result.kind << " hosted by " << result.hosted_by.name
              << " at " << result.endpoint();
}

}  // namespace core
}  // namespace mcdisc
