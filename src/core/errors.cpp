/**
 * @file errors.cpp
 * @brief Error code names.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#include "mcdisc/core/errors.hpp"

namespace mcdisc {
namespace core {

const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::DUPLICATE_SERVICE: return "duplicate service";
        case ErrorCode::INVALID_ADDRESS: return "invalid address";
        case ErrorCode::INVALID_NAME: return "invalid name";
        case ErrorCode::ADDRESS_RESOLUTION: return "address resolution";
        case ErrorCode::TRANSPORT: return "transport";
        default: return "unknown";
    }
}

}  // namespace core
}  // namespace mcdisc
