/**
 * @file errors.hpp
 * @brief Error and outcome types surfaced to endpoint users.
 *
 * Build-time problems are thrown as DiscoveryError. Lookups never throw:
 * they report a FindStatus instead.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#pragma once

#include "mcdisc/core/export.hpp"
#include "mcdisc/core/service.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace mcdisc {
namespace core {

enum class ErrorCode {
    DUPLICATE_SERVICE,      ///< Kind or port already hosted by this endpoint
    INVALID_ADDRESS,        ///< Address given to the builder is not an IP address
    INVALID_NAME,           ///< Endpoint name or service kind is not valid UTF-8
    ADDRESS_RESOLUTION,     ///< No local address could be determined
    TRANSPORT               ///< Socket setup or initial announcement failed
};

MCDISC_CORE_API const char* errorCodeToString(ErrorCode code);

/**
 * @class DiscoveryError
 * @brief Raised when an endpoint cannot be built.
 */
class MCDISC_CORE_API DiscoveryError : public std::runtime_error {
public:
    DiscoveryError(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code)
    {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

/**
 * @brief Outcome of a service lookup.
 */
enum class FindStatus {
    FOUND,          ///< A result was delivered
    NO_ENDPOINT,    ///< The endpoint stopped and nothing matching is buffered
    TIMED_OUT       ///< The caller's deadline elapsed first
};

inline const char* findStatusToString(FindStatus status) {
    switch (status) {
        case FindStatus::FOUND: return "found";
        case FindStatus::NO_ENDPOINT: return "no endpoint";
        case FindStatus::TIMED_OUT: return "timed out";
        default: return "unknown";
    }
}

struct FindResult {
    FindStatus status = FindStatus::NO_ENDPOINT;
    std::optional<DiscoveryResult> service;

    bool found() const { return status == FindStatus::FOUND; }

    static FindResult of(DiscoveryResult result) {
        return FindResult{FindStatus::FOUND, std::move(result)};
    }
    static FindResult noEndpoint() { return FindResult{FindStatus::NO_ENDPOINT, std::nullopt}; }
    static FindResult timedOut() { return FindResult{FindStatus::TIMED_OUT, std::nullopt}; }
};

}  // namespace core
}  // namespace mcdisc
