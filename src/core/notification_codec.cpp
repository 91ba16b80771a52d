/**
 * @file notification_codec.cpp
 * @brief NotificationCodec implementation.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#include "mcdisc/core/notification_codec.hpp"
#include "mcdisc/net/address.hpp"
#include "mcdisc/utils/logger.hpp"

#include "mcdisc/proto/announcement.pb.h"

#include <google/protobuf/io/tokenizer.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <limits>

namespace mcdisc {
namespace core {

namespace pb = google::protobuf;

namespace {

constexpr uint32_t kMaxPort = std::numeric_limits<uint16_t>::max();

class SilentErrors : public pb::io::ErrorCollector {
public:
    void AddError(int line, pb::io::ColumnNumber column, const std::string& message) override {
        LOG_TRACE("Codec", "Tokenizer error at {}:{}: {}", line, column, message);
    }
};

// Struct keeps numbers as doubles, so 80 and 80.0 look the same there.
// Every "port" key must be followed by an integer literal in the raw text.
bool portsAreIntegerLiterals(const std::string& payload) {
    pb::io::ArrayInputStream input(payload.data(), static_cast<int>(payload.size()));
    SilentErrors errors;
    pb::io::Tokenizer tokenizer(&input, &errors);

    bool portKey = false;
    bool expectValue = false;
    while (tokenizer.Next()) {
        const auto& token = tokenizer.current();
        if (expectValue) {
            if (token.type != pb::io::Tokenizer::TYPE_INTEGER) {
                return false;
            }
            expectValue = false;
            portKey = false;
            continue;
        }
        if (portKey && token.type == pb::io::Tokenizer::TYPE_SYMBOL && token.text == ":") {
            expectValue = true;
            continue;
        }

        portKey = false;
        if (token.type == pb::io::Tokenizer::TYPE_STRING) {
            std::string text;
            pb::io::Tokenizer::ParseString(token.text, &text);
            portKey = text == "port";
        }
    }
    return !expectValue;
}

bool isWholePort(const pb::Value& value) {
    if (value.kind_case() != pb::Value::kNumberValue) {
        return false;
    }
    const double number = value.number_value();
    return number >= 0 && number <= kMaxPort && std::floor(number) == number;
}

// One key, "Host" or "Search", holding an object. A Host port, when present,
// is a whole JSON number. The typed parser also accepts the lowercase proto
// field names and quoted integers, so both are ruled out here.
bool isWireServiceEntry(const pb::Value& entry) {
    if (entry.kind_case() != pb::Value::kStructValue) {
        return false;
    }
    const auto& roles = entry.struct_value().fields();
    if (roles.size() != 1) {
        return false;
    }

    const auto& role = *roles.begin();
    if ((role.first != "Host" && role.first != "Search") ||
        role.second.kind_case() != pb::Value::kStructValue) {
        return false;
    }
    if (role.first == "Search") {
        return true;
    }

    const auto& hostFields = role.second.struct_value().fields();
    auto port = hostFields.find(std::string("port"));
    return port == hostFields.end() || isWholePort(port->second);
}

// proto3 cannot tell an absent repeated field from an empty one, so the
// required top-level keys are checked on the generic JSON tree first.
bool hasRequiredShape(const std::string& payload) {
    pb::Struct tree;
    if (!pb::util::JsonStringToMessage(payload, &tree).ok()) {
        return false;
    }

    const auto& fields = tree.fields();
    for (const char* key : {"name", "addr"}) {
        auto it = fields.find(std::string(key));
        if (it == fields.end() || it->second.kind_case() != pb::Value::kStringValue) {
            return false;
        }
    }

    auto services = fields.find(std::string("services"));
    if (services == fields.end() || services->second.kind_case() != pb::Value::kListValue) {
        return false;
    }

    for (const auto& entry : services->second.list_value().values()) {
        if (!isWireServiceEntry(entry)) {
            return false;
        }
    }
    return portsAreIntegerLiterals(payload);
}

std::optional<ServiceRole> toRole(const wire::ServiceEntry& entry) {
    switch (entry.role_case()) {
        case wire::ServiceEntry::kHost: {
            const auto& host = entry.host();
            if (!host.has_kind() || !host.has_port() || host.port() > kMaxPort) {
                return std::nullopt;
            }
            return ServiceRole(Hosting{host.kind(), static_cast<uint16_t>(host.port())});
        }
        case wire::ServiceEntry::kSearch: {
            const auto& search = entry.search();
            if (!search.has_kind()) {
                return std::nullopt;
            }
            return ServiceRole(Searching{search.kind()});
        }
        default:
            return std::nullopt;
    }
}

}  // namespace

std::optional<std::string> NotificationCodec::encode(const Announcement& announcement) {
    // protobuf would print an invalid string as ""
    bool printable = isValidUtf8(announcement.identity.name);
    for (const auto& role : announcement.roles) {
        printable = printable && isValidUtf8(roleKind(role));
    }
    if (!printable) {
        LOG_ERROR("Codec", "Cannot encode announcement for {}: name or kind is not UTF-8",
                  announcement.identity.address);
        return std::nullopt;
    }

    wire::Announcement message;
    message.set_name(announcement.identity.name);
    message.set_addr(announcement.identity.address);

    for (const auto& role : announcement.roles) {
        auto* entry = message.add_services();
        if (const auto* hosting = std::get_if<Hosting>(&role)) {
            entry->mutable_host()->set_kind(hosting->kind);
            entry->mutable_host()->set_port(hosting->port);
        } else {
            entry->mutable_search()->set_kind(roleKind(role));
        }
    }

    pb::util::JsonPrintOptions options;
    options.always_print_primitive_fields = true;

    std::string json;
    auto status = pb::util::MessageToJsonString(message, &json, options);
    if (!status.ok()) {
        LOG_ERROR("Codec", "Failed to encode announcement for {}: {}",
                  announcement.identity.toString(), status.ToString());
        return std::nullopt;
    }
    return json;
}

std::optional<Announcement> NotificationCodec::decode(const std::string& payload) {
    if (!hasRequiredShape(payload)) {
        LOG_TRACE("Codec", "Discarding payload without announcement shape ({} bytes)",
                  payload.size());
        return std::nullopt;
    }

    wire::Announcement message;
    auto status = pb::util::JsonStringToMessage(payload, &message);
    if (!status.ok()) {
        LOG_TRACE("Codec", "Discarding malformed announcement: {}", status.ToString());
        return std::nullopt;
    }

    if (!net::isValidIpAddress(message.addr())) {
        LOG_TRACE("Codec", "Discarding announcement with bad address '{}'", message.addr());
        return std::nullopt;
    }

    Announcement announcement;
    announcement.identity.name = message.name();
    announcement.identity.address = message.addr();
    announcement.roles.reserve(static_cast<size_t>(message.services_size()));

    for (const auto& entry : message.services()) {
        auto role = toRole(entry);
        if (!role) {
            LOG_TRACE("Codec", "Discarding announcement from {} with invalid service entry",
                      message.name());
            return std::nullopt;
        }
        announcement.roles.push_back(std::move(*role));
    }

    return announcement;
}

}  // namespace core
}  // namespace mcdisc
