/**
 * @file discovery_runner.cpp
 * @brief DiscoveryRunner implementation.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#include "mcdisc/core/discovery_runner.hpp"
#include "mcdisc/core/notification_codec.hpp"
#include "mcdisc/utils/logger.hpp"

namespace mcdisc {
namespace core {

const char* runnerStateToString(RunnerState state) {
    switch (state) {
        case RunnerState::STARTING: return "starting";
        case RunnerState::RUNNING: return "running";
        case RunnerState::STOPPING: return "stopping";
        case RunnerState::STOPPED: return "stopped";
        default: return "unknown";
    }
}

DiscoveryRunner::DiscoveryRunner(Announcement local,
                                 RunnerBackend& backend,
                                 std::chrono::milliseconds reannounceHoldoff)
    : state_data_(std::move(local))
    , engine_(reannounceHoldoff)
    , backend_(backend)
{}

bool DiscoveryRunner::start() {
    if (state_.load() != RunnerState::STARTING) {
        LOG_WARN("Runner", "Runner for {} already started", state_data_.identity().toString());
        return false;
    }

    for (const auto& role : state_data_.local().roles) {
        if (const auto* hosting = std::get_if<Hosting>(&role)) {
            LOG_DEBUG("Runner", "Hosting service '{}' on port {}", hosting->kind, hosting->port);
        } else {
            LOG_DEBUG("Runner", "Searching for service '{}'", roleKind(role));
        }
    }

    auto payload = NotificationCodec::encode(state_data_.local());
    if (!payload) {
        return false;
    }
    payload_ = std::move(*payload);

    if (!announce("joining")) {
        return false;
    }

    state_.store(RunnerState::RUNNING);
    LOG_INFO("Runner", "Endpoint {} announced with {} service(s)",
             state_data_.identity().toString(), state_data_.local().roles.size());
    return true;
}

void DiscoveryRunner::handleDatagram(const void* data, size_t length) {
    if (state_.load() != RunnerState::RUNNING) {
        return;
    }

    stats_.packets_received++;

    auto incoming = NotificationCodec::decode(data, length);
    if (!incoming) {
        stats_.decode_failures++;
        return;
    }

    handleAnnouncement(*incoming);
}

void DiscoveryRunner::handleAnnouncement(const Announcement& incoming) {
    if (state_.load() != RunnerState::RUNNING) {
        return;
    }

    const auto now = Clock::now();
    EngineAction action = engine_.evaluate(state_data_, incoming, now);

    if (action.self) {
        stats_.self_packets++;
        return;
    }

    engine_.commit(state_data_, incoming, action, now);

    if (action.reannounce) {
        LOG_TRACE("Runner", "Peer {} wants one of our services", incoming.identity.toString());
        if (announce("peer search")) {
            stats_.reannouncements++;
        }
    }

    for (const auto& result : action.reports) {
        LOG_DEBUG("Runner", "Found service '{}' hosted by {} at {}",
                  result.kind, result.hosted_by.name, result.endpoint());
        stats_.results_reported++;
        backend_.publish(result);
    }
}

void DiscoveryRunner::stop() {
    RunnerState current = state_.load();
    while (current == RunnerState::STARTING || current == RunnerState::RUNNING) {
        if (state_.compare_exchange_weak(current, RunnerState::STOPPING)) {
            LOG_DEBUG("Runner", "Stopping endpoint {}", state_data_.identity().toString());
            return;
        }
    }
}

void DiscoveryRunner::finish() {
    stop();
    if (state_.exchange(RunnerState::STOPPED) != RunnerState::STOPPED) {
        LOG_DEBUG("Runner", "Endpoint {} stopped ({} received, {} reported, {} re-announced)",
                  state_data_.identity().toString(), stats_.packets_received,
                  stats_.results_reported, stats_.reannouncements);
    }
}

bool DiscoveryRunner::announce(const char* reason) {
    if (!backend_.sendAnnouncement(payload_)) {
        stats_.send_failures++;
        LOG_ERROR("Runner", "Failed to send announcement ({})", reason);
        return false;
    }
    LOG_TRACE("Runner", "Sent announcement ({}, {} bytes)", reason, payload_.size());
    return true;
}

}  // namespace core
}  // namespace mcdisc
