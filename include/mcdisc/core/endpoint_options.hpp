/**
 * @file endpoint_options.hpp
 * @brief Tunables shared by the sync and async endpoints.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#pragma once

#include "mcdisc/core/export.hpp"
#include "mcdisc/core/multicast_transport.hpp"

#include <cstddef>

namespace mcdisc {
namespace core {

struct MCDISC_CORE_API EndpointOptions {
    MulticastConfig multicast;      ///< Discovery group and socket options
    int receive_poll_ms;            ///< Sync worker: stop-flag check interval
    int reannounce_holdoff_ms;      ///< Per-peer re-announce suppression window (0 = off)
    size_t result_capacity;         ///< Buffered results before the oldest is dropped (0 = unlimited)

    EndpointOptions()
        : receive_poll_ms(100)
        , reannounce_holdoff_ms(1000)
        , result_capacity(64)
    {}
};

}  // namespace core
}  // namespace mcdisc
