/**
 * @file sync_endpoint.hpp
 * @brief Blocking discovery endpoint backed by a worker thread.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#pragma once

#include "mcdisc/core/discovery_runner.hpp"
#include "mcdisc/core/endpoint_options.hpp"
#include "mcdisc/core/errors.hpp"
#include "mcdisc/core/export.hpp"
#include "mcdisc/core/multicast_transport.hpp"
#include "mcdisc/core/result_channel.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <iterator>
#include <mutex>
#include <optional>
#include <thread>

namespace mcdisc {
namespace core {

/**
 * @class ServiceStream
 * @brief Lazy, blocking sequence of discovery results.
 *
 * Each step waits for the next result. The sequence ends when the endpoint
 * shuts down. Results taken by the stream are not seen by find calls.
 *
 * @code
 * for (const auto& service : endpoint->findAllServices()) {
 *     std::cout << service << "\n";
 * }
 * @endcode
 */
class MCDISC_CORE_API ServiceStream {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = DiscoveryResult;
        using difference_type = std::ptrdiff_t;
        using pointer = const DiscoveryResult*;
        using reference = const DiscoveryResult&;

        iterator() = default;

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            current_ = stream_ ? stream_->next() : std::nullopt;
            if (!current_) {
                stream_ = nullptr;
            }
            return *this;
        }

        bool operator==(const iterator& other) const { return stream_ == other.stream_; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        friend class ServiceStream;
        explicit iterator(ServiceStream* stream) : stream_(stream) { ++*this; }

        ServiceStream* stream_ = nullptr;
        std::optional<DiscoveryResult> current_;
    };

    explicit ServiceStream(ResultChannel<DiscoveryResult>& channel)
        : channel_(&channel)
    {}

    /**
     * @brief Wait for the next result.
     * @return nullopt once the endpoint has shut down (or on timeout).
     */
    std::optional<DiscoveryResult> next(ResultChannel<DiscoveryResult>::Timeout timeout = std::nullopt) {
        DiscoveryResult result;
        if (channel_->pop(result, timeout) != PopStatus::OK) {
            return std::nullopt;
        }
        return result;
    }

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    ResultChannel<DiscoveryResult>* channel_;
};

/**
 * @class SyncEndpoint
 * @brief Discovery endpoint with a blocking lookup API.
 *
 * Construction joins the discovery group and sends the first announcement
 * from the calling thread, then starts one worker thread that owns the
 * socket and reacts to peers. Results reach callers through a bounded
 * channel.
 *
 * Destruction (or shutdown()) stops the worker, leaves the group and closes
 * the socket before returning.
 *
 * Usage:
 * @code
 * auto endpoint = EndpointBuilder("client").search("hello").buildSync();
 * FindResult found = endpoint->findService("hello", std::chrono::seconds(5));
 * if (found.found()) {
 *     connectTo(found.service->endpoint());
 * }
 * @endcode
 */
class MCDISC_CORE_API SyncEndpoint : private RunnerBackend {
public:
    using Timeout = ResultChannel<DiscoveryResult>::Timeout;

    /**
     * @throws DiscoveryError (TRANSPORT) if the group cannot be joined or the
     *         first announcement cannot be sent.
     */
    SyncEndpoint(Announcement local, const EndpointOptions& options = EndpointOptions());

    ~SyncEndpoint() override;

    SyncEndpoint(const SyncEndpoint&) = delete;
    SyncEndpoint& operator=(const SyncEndpoint&) = delete;

    /**
     * @brief Wait for a host of @p kind.
     *
     * Results of other kinds stay buffered. Returns immediately if a matching
     * result is already buffered.
     */
    FindResult findService(const ServiceKind& kind, Timeout timeout = std::nullopt);

    /**
     * @brief Wait for the next result of any kind.
     */
    FindResult findAnyService(Timeout timeout = std::nullopt);

    /**
     * @brief Next buffered result, without waiting.
     */
    std::optional<DiscoveryResult> tryFindService();

    /**
     * @brief Every result as it arrives, until shutdown.
     */
    ServiceStream findAllServices() { return ServiceStream(channel_); }

    /**
     * @brief Stop the worker and release the socket. Idempotent.
     *
     * Callers blocked in find calls wake up with FindStatus::NO_ENDPOINT.
     */
    void shutdown();

    bool isRunning() const { return runner_.isRunning(); }

    const Announcement& announcement() const { return runner_.local(); }
    const Identity& identity() const { return runner_.local().identity; }

    /**
     * @brief Snapshot of the runner counters, safe while the worker runs.
     */
    RunnerStats stats() const;

    ChannelStats channelStats() const { return channel_.getStats(); }

    /// Options in effect, after clamping (receive_poll_ms is at least 1).
    const EndpointOptions& options() const { return options_; }

private:
    bool sendAnnouncement(const std::string& payload) override;
    void publish(const DiscoveryResult& result) override;

    void workerLoop();

    static FindResult toFindResult(PopStatus status, DiscoveryResult& result);

    EndpointOptions options_;
    MulticastTransport transport_;
    ResultChannel<DiscoveryResult> channel_;
    DiscoveryRunner runner_;

    std::atomic<bool> stopRequested_{false};
    mutable std::mutex runnerMutex_;      // worker's datagram handling vs. stats()
    std::mutex shutdownMutex_;
    std::thread worker_;
};

}  // namespace core
}  // namespace mcdisc
