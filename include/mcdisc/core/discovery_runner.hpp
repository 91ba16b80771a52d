/**
 * @file discovery_runner.hpp
 * @brief Per-endpoint discovery state machine.
 *
 * The runner holds the endpoint state and applies the protocol engine to
 * every received datagram. It does not own a thread or a socket: a backend
 * (SyncEndpoint with a worker thread, AsyncEndpoint on a Boost.Asio strand)
 * feeds it datagrams and provides the two effects it needs.
 *
 * Lifecycle:
 * @code
 *   STARTING --start()--> RUNNING --stop()--> STOPPING --finish()--> STOPPED
 * @endcode
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#pragma once

#include "mcdisc/core/export.hpp"
#include "mcdisc/core/protocol_engine.hpp"
#include "mcdisc/core/service.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace mcdisc {
namespace core {

enum class RunnerState {
    STARTING,
    RUNNING,
    STOPPING,
    STOPPED
};

MCDISC_CORE_API const char* runnerStateToString(RunnerState state);

/**
 * @class RunnerBackend
 * @brief Effects a backend performs on the runner's behalf.
 *
 * Both calls happen on the backend's worker (thread or strand).
 */
class MCDISC_CORE_API RunnerBackend {
public:
    virtual ~RunnerBackend() = default;

    /**
     * @brief Put @p payload on the discovery group.
     * @return False if the datagram could not be sent.
     */
    virtual bool sendAnnouncement(const std::string& payload) = 0;

    /**
     * @brief Hand a result to the caller side. Must not block.
     */
    virtual void publish(const DiscoveryResult& result) = 0;
};

/**
 * @brief Counters kept by the runner.
 */
struct RunnerStats {
    uint64_t packets_received = 0;
    uint64_t decode_failures = 0;
    uint64_t self_packets = 0;
    uint64_t results_reported = 0;
    uint64_t reannouncements = 0;
    uint64_t send_failures = 0;
};

/**
 * @class DiscoveryRunner
 * @brief Drives the announce/observe/re-announce protocol for one endpoint.
 */
class MCDISC_CORE_API DiscoveryRunner {
public:
    using Clock = EndpointState::Clock;

    /**
     * @param local Our identity and roles, fixed for the endpoint's lifetime.
     * @param backend Effect provider; must outlive the runner.
     * @param reannounceHoldoff See ProtocolEngine.
     */
    DiscoveryRunner(Announcement local,
                    RunnerBackend& backend,
                    std::chrono::milliseconds reannounceHoldoff = std::chrono::milliseconds(1000));

    DiscoveryRunner(const DiscoveryRunner&) = delete;
    DiscoveryRunner& operator=(const DiscoveryRunner&) = delete;

    /**
     * @brief Encode our announcement and send it for the first time.
     * @return False if encoding or the initial send failed; the state stays STARTING.
     */
    bool start();

    /**
     * @brief Process one datagram from the group.
     *
     * Undecodable payloads are counted and dropped. Ignored unless RUNNING.
     */
    void handleDatagram(const void* data, size_t length);

    /**
     * @brief Process an already decoded announcement.
     */
    void handleAnnouncement(const Announcement& incoming);

    /**
     * @brief Stop reacting to datagrams (RUNNING or STARTING -> STOPPING).
     */
    void stop();

    /**
     * @brief Mark the transport released (-> STOPPED).
     */
    void finish();

    RunnerState state() const { return state_.load(); }
    bool isRunning() const { return state_.load() == RunnerState::RUNNING; }

    const EndpointState& endpointState() const { return state_data_; }
    const Announcement& local() const { return state_data_.local(); }
    const RunnerStats& stats() const { return stats_; }

private:
    bool announce(const char* reason);

    EndpointState state_data_;
    ProtocolEngine engine_;
    RunnerBackend& backend_;
    std::string payload_;
    std::atomic<RunnerState> state_{RunnerState::STARTING};
    RunnerStats stats_;
};

}  // namespace core
}  // namespace mcdisc
