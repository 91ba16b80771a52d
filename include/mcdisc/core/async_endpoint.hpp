/**
 * @file async_endpoint.hpp
 * @brief Discovery endpoint driven by a Boost.Asio io_context.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#pragma once

#include "mcdisc/core/discovery_runner.hpp"
#include "mcdisc/core/endpoint_options.hpp"
#include "mcdisc/core/errors.hpp"
#include "mcdisc/core/export.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <list>
#include <memory>
#include <optional>
#include <vector>

namespace mcdisc {
namespace core {

/**
 * @class AsyncEndpoint
 * @brief Discovery endpoint whose work runs as handlers on the caller's io_context.
 *
 * All protocol work is serialized on a strand, so the io_context may be run
 * from any number of threads. Handlers are invoked from the io_context.
 *
 * Dropping the last shared_ptr closes the socket; pending lookups complete
 * with FindStatus::NO_ENDPOINT.
 *
 * Usage:
 * @code
 * boost::asio::io_context io;
 * auto endpoint = EndpointBuilder("client").search("hello").buildAsync(io);
 * endpoint->asyncFindService("hello", [&](FindResult result) {
 *     ...
 *     endpoint->shutdown();
 * }, std::chrono::seconds(5));
 * io.run();
 * @endcode
 */
class MCDISC_CORE_API AsyncEndpoint
    : public std::enable_shared_from_this<AsyncEndpoint>
    , private RunnerBackend {
    struct PrivateTag {};

public:
    using Timeout = std::optional<std::chrono::milliseconds>;
    using FindHandler = std::function<void(FindResult)>;

    /// Return false to end the subscription.
    using ResultHandler = std::function<bool(const DiscoveryResult&)>;
    using ClosedHandler = std::function<void()>;

    /**
     * @brief Join the group, send the first announcement and start receiving.
     * @throws DiscoveryError (TRANSPORT) on socket or send failure.
     */
    static std::shared_ptr<AsyncEndpoint> create(boost::asio::io_context& io,
                                                 Announcement local,
                                                 const EndpointOptions& options = EndpointOptions());

    AsyncEndpoint(boost::asio::io_context& io, Announcement local,
                  const EndpointOptions& options, PrivateTag);

    ~AsyncEndpoint() override;

    AsyncEndpoint(const AsyncEndpoint&) = delete;
    AsyncEndpoint& operator=(const AsyncEndpoint&) = delete;

    /**
     * @brief Complete @p handler with the next host of @p kind.
     */
    void asyncFindService(ServiceKind kind, FindHandler handler, Timeout timeout = std::nullopt);

    /**
     * @brief Complete @p handler with the next result of any kind.
     */
    void asyncFindAnyService(FindHandler handler, Timeout timeout = std::nullopt);

    /**
     * @brief Receive every result as it arrives.
     *
     * Buffered results are delivered first. @p on_closed runs once when the
     * endpoint shuts down, unless @p on_result ended the subscription.
     */
    void findAllServices(ResultHandler on_result, ClosedHandler on_closed = ClosedHandler());

    /**
     * @brief Stop, leave the group and close the socket. Idempotent.
     * @param on_stopped Runs on the strand once the socket is closed.
     */
    void shutdown(std::function<void()> on_stopped = std::function<void()>());

    bool isRunning() const { return runner_.isRunning(); }

    const Announcement& announcement() const { return runner_.local(); }
    const Identity& identity() const { return runner_.local().identity; }

private:
    struct Waiter {
        uint64_t id;
        std::optional<ServiceKind> kind;
        FindHandler handler;
        std::unique_ptr<boost::asio::steady_timer> timer;
    };

    struct Subscriber {
        uint64_t id;
        ResultHandler on_result;
        ClosedHandler on_closed;
    };

    void openSocket();
    void startReceive();
    void onReceive(const boost::system::error_code& ec, std::size_t bytes);

    bool sendAnnouncement(const std::string& payload) override;
    void publish(const DiscoveryResult& result) override;

    void addWaiter(std::optional<ServiceKind> kind, FindHandler handler, Timeout timeout);
    void expireWaiter(uint64_t id);
    void addSubscriber(ResultHandler on_result, ClosedHandler on_closed);
    bool deliverToSubscribers(const DiscoveryResult& result);
    void closeSocket();
    void closeOnStrand();

    static bool matches(const std::optional<ServiceKind>& kind, const DiscoveryResult& result) {
        return !kind || *kind == result.kind;
    }

    boost::asio::io_context& io_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint group_endpoint_;
    boost::asio::ip::udp::endpoint sender_;
    std::vector<char> buffer_;
    EndpointOptions options_;
    DiscoveryRunner runner_;

    // Strand-only state
    std::deque<DiscoveryResult> buffered_;
    std::list<Waiter> waiters_;
    std::vector<Subscriber> subscribers_;
    uint64_t next_id_ = 0;
    bool joined_ = false;
    bool closed_ = false;
};

}  // namespace core
}  // namespace mcdisc
