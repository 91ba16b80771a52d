/**
 * @file protocol_engine.hpp
 * @brief Announce/observe/re-announce decision logic.
 *
 * The engine looks at one incoming announcement against the local endpoint
 * state and decides:
 * - which discovery results to report (our searches matched by their hosts)
 * - whether to re-send our own announcement (their searches matched by our hosts)
 *
 * evaluate() is pure. The runner applies the outcome with commit() once the
 * results have been handed on.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#pragma once

#include "mcdisc/core/export.hpp"
#include "mcdisc/core/service.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace mcdisc {
namespace core {

/**
 * @struct ReportKey
 * @brief Identifies a discovery result for deduplication.
 */
struct MCDISC_CORE_API ReportKey {
    ServiceKind kind;
    std::string address;
    uint16_t port = 0;

    static ReportKey of(const DiscoveryResult& result) {
        return ReportKey{result.kind, result.hosted_by.address, result.port};
    }

    bool operator<(const ReportKey& other) const {
        return std::tie(kind, address, port) < std::tie(other.kind, other.address, other.port);
    }
    bool operator==(const ReportKey& other) const {
        return kind == other.kind && address == other.address && port == other.port;
    }
};

/**
 * @class EndpointState
 * @brief Everything the runner remembers about the network.
 *
 * Owned by exactly one DiscoveryRunner and only touched from its worker.
 */
class MCDISC_CORE_API EndpointState {
public:
    using Clock = std::chrono::steady_clock;

    explicit EndpointState(Announcement local)
        : local_(std::move(local))
    {}

    const Announcement& local() const { return local_; }
    const Identity& identity() const { return local_.identity; }

    bool isReported(const ReportKey& key) const { return reported_.count(key) != 0; }
    void markReported(ReportKey key) { reported_.insert(std::move(key)); }
    size_t reportedCount() const { return reported_.size(); }

    /**
     * @brief When @p peer last caused us to re-announce, if ever.
     */
    bool lastReannounceFor(const Identity& peer, Clock::time_point& when) const;
    void recordReannounce(const Identity& peer, Clock::time_point when);

private:
    Announcement local_;
    std::set<ReportKey> reported_;
    std::map<std::string, Clock::time_point> reannounced_;  // keyed by Identity::toString()
};

/**
 * @struct EngineAction
 * @brief What to do about one incoming announcement.
 */
struct MCDISC_CORE_API EngineAction {
    std::vector<DiscoveryResult> reports;   ///< New results, already deduplicated
    bool reannounce = false;                ///< Send our announcement once
    bool self = false;                      ///< Packet was our own, ignored

    bool empty() const { return reports.empty() && !reannounce; }
};

/**
 * @class ProtocolEngine
 * @brief Stateless matcher between a local and a remote announcement.
 */
class MCDISC_CORE_API ProtocolEngine {
public:
    /**
     * @param reannounceHoldoff Ignore further matching searches from a peer for
     *        this long after it made us re-announce. Zero disables the hold-off.
     */
    explicit ProtocolEngine(std::chrono::milliseconds reannounceHoldoff =
                                std::chrono::milliseconds(1000))
        : holdoff_(reannounceHoldoff)
    {}

    /**
     * @brief Decide the action for @p incoming. Does not modify @p state.
     */
    EngineAction evaluate(const EndpointState& state,
                          const Announcement& incoming,
                          EndpointState::Clock::time_point now) const;

    /**
     * @brief Record the effects of @p action so later evaluations see them.
     */
    void commit(EndpointState& state,
                const Announcement& incoming,
                const EngineAction& action,
                EndpointState::Clock::time_point now) const;

    /**
     * @brief Same name and same address as the local endpoint.
     */
    static bool isSelf(const Identity& local, const Identity& incoming) {
        return local == incoming;
    }

    std::chrono::milliseconds reannounceHoldoff() const { return holdoff_; }

private:
    std::chrono::milliseconds holdoff_;
};

}  // namespace core
}  // namespace mcdisc
