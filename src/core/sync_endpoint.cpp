/**
 * @file sync_endpoint.cpp
 * @brief SyncEndpoint implementation.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#include "mcdisc/core/sync_endpoint.hpp"
#include "mcdisc/utils/logger.hpp"

#include <vector>

namespace mcdisc {
namespace core {

namespace {

// A negative poll interval would block the worker in receive for good
EndpointOptions clampOptions(EndpointOptions options) {
    if (options.receive_poll_ms < 1) {
        LOG_WARN("SyncEndpoint", "receive_poll_ms {} is not positive, using 1",
                 options.receive_poll_ms);
        options.receive_poll_ms = 1;
    }
    return options;
}

}  // namespace

SyncEndpoint::SyncEndpoint(Announcement local, const EndpointOptions& options)
    : options_(clampOptions(options))
    , transport_(options.multicast)
    , channel_(options.result_capacity)
    , runner_(std::move(local), *this, std::chrono::milliseconds(options.reannounce_holdoff_ms))
{
    if (!transport_.open()) {
        throw DiscoveryError(ErrorCode::TRANSPORT,
                             "Failed to join discovery group " + options_.multicast.group +
                             ":" + std::to_string(options_.multicast.port));
    }

    if (!runner_.start()) {
        transport_.close();
        throw DiscoveryError(ErrorCode::TRANSPORT, "Failed to send initial announcement");
    }

    worker_ = std::thread(&SyncEndpoint::workerLoop, this);
}

SyncEndpoint::~SyncEndpoint() {
    shutdown();
}

FindResult SyncEndpoint::findService(const ServiceKind& kind, Timeout timeout) {
    DiscoveryResult result;
    PopStatus status = channel_.popIf(
        [&kind](const DiscoveryResult& candidate) { return candidate.kind == kind; },
        result, timeout);
    return toFindResult(status, result);
}

FindResult SyncEndpoint::findAnyService(Timeout timeout) {
    DiscoveryResult result;
    PopStatus status = channel_.pop(result, timeout);
    return toFindResult(status, result);
}

std::optional<DiscoveryResult> SyncEndpoint::tryFindService() {
    return channel_.tryPop();
}

void SyncEndpoint::shutdown() {
    std::lock_guard<std::mutex> lock(shutdownMutex_);

    stopRequested_.store(true);
    runner_.stop();

    if (worker_.joinable()) {
        worker_.join();
    }

    transport_.close();
    runner_.finish();
    channel_.close();
}

RunnerStats SyncEndpoint::stats() const {
    std::lock_guard<std::mutex> lock(runnerMutex_);
    return runner_.stats();
}

bool SyncEndpoint::sendAnnouncement(const std::string& payload) {
    return transport_.send(payload);
}

void SyncEndpoint::publish(const DiscoveryResult& result) {
    switch (channel_.push(result)) {
        case PushResult::DROPPED_OLDEST:
            LOG_WARN("SyncEndpoint", "Result buffer full, dropped oldest result");
            break;
        case PushResult::CLOSED:
            LOG_TRACE("SyncEndpoint", "Result for '{}' arrived after shutdown", result.kind);
            break;
        default:
            break;
    }
}

void SyncEndpoint::workerLoop() {
    LOG_DEBUG("SyncEndpoint", "Worker started for {}", identity().toString());

    std::vector<uint8_t> buffer(MulticastTransport::kMaxDatagram);

    while (!stopRequested_.load()) {
        net::SocketAddress sender;
        int received = transport_.receive(buffer, options_.receive_poll_ms, sender);

        if (received > 0) {
            LOG_TRACE("SyncEndpoint", "Received {} bytes from {}", received, sender.toString());
            std::lock_guard<std::mutex> lock(runnerMutex_);
            runner_.handleDatagram(buffer.data(), static_cast<size_t>(received));
        } else if (received < 0 && !stopRequested_.load()) {
            LOG_ERROR("SyncEndpoint", "Receive failed: error {}", transport_.lastError());
            std::this_thread::sleep_for(std::chrono::milliseconds(options_.receive_poll_ms));
        }
    }

    LOG_DEBUG("SyncEndpoint", "Worker stopped for {}", identity().toString());
}

FindResult SyncEndpoint::toFindResult(PopStatus status, DiscoveryResult& result) {
    switch (status) {
        case PopStatus::OK:
            return FindResult::of(std::move(result));
        case PopStatus::TIMED_OUT:
            return FindResult::timedOut();
        case PopStatus::CLOSED:
        default:
            return FindResult::noEndpoint();
    }
}

}  // namespace core
}  // namespace mcdisc
