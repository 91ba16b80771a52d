/**
 * @file protocol_engine.cpp
 * @brief ProtocolEngine implementation.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#include "mcdisc/core/protocol_engine.hpp"

namespace mcdisc {
namespace core {

bool EndpointState::lastReannounceFor(const Identity& peer, Clock::time_point& when) const {
    auto it = reannounced_.find(peer.toString());
    if (it == reannounced_.end()) {
        return false;
    }
    when = it->second;
    return true;
}

void EndpointState::recordReannounce(const Identity& peer, Clock::time_point when) {
    reannounced_[peer.toString()] = when;
}

EngineAction ProtocolEngine::evaluate(const EndpointState& state,
                                      const Announcement& incoming,
                                      EndpointState::Clock::time_point now) const {
    EngineAction action;
    const Announcement& local = state.local();

    if (isSelf(local.identity, incoming.identity)) {
        action.self = true;
        return action;
    }

    // Our searches against their hosts
    std::set<ReportKey> pending;
    for (const auto& role : local.roles) {
        const auto* searching = std::get_if<Searching>(&role);
        if (searching == nullptr) {
            continue;
        }

        for (const auto& remote : incoming.roles) {
            const auto* hosting = std::get_if<Hosting>(&remote);
            if (hosting == nullptr || hosting->kind != searching->kind) {
                continue;
            }

            DiscoveryResult result{hosting->kind, incoming.identity, hosting->port};
            ReportKey key = ReportKey::of(result);
            if (state.isReported(key) || !pending.insert(key).second) {
                continue;
            }
            action.reports.push_back(std::move(result));
        }
    }

    // Their searches against our hosts
    bool wanted = false;
    for (const auto& remote : incoming.roles) {
        const auto* searching = std::get_if<Searching>(&remote);
        if (searching != nullptr && local.hosts(searching->kind)) {
            wanted = true;
            break;
        }
    }

    if (wanted) {
        EndpointState::Clock::time_point last;
        bool heldOff = holdoff_.count() > 0 &&
                       state.lastReannounceFor(incoming.identity, last) &&
                       now - last < holdoff_;
        action.reannounce = !heldOff;
    }

    return action;
}

void ProtocolEngine::commit(EndpointState& state,
                            const Announcement& incoming,
                            const EngineAction& action,
                            EndpointState::Clock::time_point now) const {
    for (const auto& result : action.reports) {
        state.markReported(ReportKey::of(result));
    }
    if (action.reannounce) {
        state.recordReannounce(incoming.identity, now);
    }
}

}  // namespace core
}  // namespace mcdisc
