/**
 * @file async_endpoint.cpp
 * @brief AsyncEndpoint implementation.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#include "mcdisc/core/async_endpoint.hpp"
#include "mcdisc/core/multicast_transport.hpp"
#include "mcdisc/utils/logger.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/post.hpp>

namespace mcdisc {
namespace core {

namespace ip = boost::asio::ip;

std::shared_ptr<AsyncEndpoint> AsyncEndpoint::create(boost::asio::io_context& io,
                                                     Announcement local,
                                                     const EndpointOptions& options) {
    auto endpoint = std::make_shared<AsyncEndpoint>(io, std::move(local), options, PrivateTag{});
    endpoint->openSocket();

    if (!endpoint->runner_.start()) {
        throw DiscoveryError(ErrorCode::TRANSPORT, "Failed to send initial announcement");
    }

    auto self = endpoint;
    boost::asio::post(endpoint->strand_, [self]() { self->startReceive(); });
    return endpoint;
}

AsyncEndpoint::AsyncEndpoint(boost::asio::io_context& io, Announcement local,
                             const EndpointOptions& options, PrivateTag)
    : io_(io)
    , strand_(boost::asio::make_strand(io))
    , socket_(io)
    , buffer_(MulticastTransport::kMaxDatagram)
    , options_(options)
    , runner_(std::move(local), *this, std::chrono::milliseconds(options.reannounce_holdoff_ms))
{}

AsyncEndpoint::~AsyncEndpoint() {
    // No handler can be running here: each one holds a strong reference.
    if (!closed_) {
        closed_ = true;
        runner_.stop();
        closeSocket();
        runner_.finish();
    }

    for (auto& waiter : waiters_) {
        boost::asio::post(io_, [handler = std::move(waiter.handler)]() {
            handler(FindResult::noEndpoint());
        });
    }
    for (auto& subscriber : subscribers_) {
        if (subscriber.on_closed) {
            boost::asio::post(io_, std::move(subscriber.on_closed));
        }
    }
}

void AsyncEndpoint::asyncFindService(ServiceKind kind, FindHandler handler, Timeout timeout) {
    auto self = shared_from_this();
    boost::asio::post(strand_, [self, kind = std::move(kind), handler = std::move(handler), timeout]() mutable {
        self->addWaiter(std::move(kind), std::move(handler), timeout);
    });
}

void AsyncEndpoint::asyncFindAnyService(FindHandler handler, Timeout timeout) {
    auto self = shared_from_this();
    boost::asio::post(strand_, [self, handler = std::move(handler), timeout]() mutable {
        self->addWaiter(std::nullopt, std::move(handler), timeout);
    });
}

void AsyncEndpoint::findAllServices(ResultHandler on_result, ClosedHandler on_closed) {
    auto self = shared_from_this();
    boost::asio::post(strand_, [self, on_result = std::move(on_result), on_closed = std::move(on_closed)]() mutable {
        self->addSubscriber(std::move(on_result), std::move(on_closed));
    });
}

void AsyncEndpoint::shutdown(std::function<void()> on_stopped) {
    auto self = shared_from_this();
    boost::asio::post(strand_, [self, on_stopped = std::move(on_stopped)]() {
        self->closeOnStrand();
        if (on_stopped) {
            on_stopped();
        }
    });
}

void AsyncEndpoint::openSocket() {
    const MulticastConfig& config = options_.multicast;
    boost::system::error_code ec;

    auto fail = [this](const std::string& step, const boost::system::error_code& error) {
        LOG_ERROR("AsyncEndpoint", "{}: {}", step, error.message());
        closeSocket();
        throw DiscoveryError(ErrorCode::TRANSPORT, step + ": " + error.message());
    };

    const ip::address group = ip::make_address(config.group, ec);
    if (ec || !group.is_multicast()) {
        throw DiscoveryError(ErrorCode::TRANSPORT, "Invalid multicast group " + config.group);
    }

    socket_.open(group.is_v6() ? ip::udp::v6() : ip::udp::v4(), ec);
    if (ec) {
        fail("Failed to open socket", ec);
    }

    socket_.set_option(ip::udp::socket::reuse_address(true), ec);
    if (ec) {
        fail("Failed to set SO_REUSEADDR", ec);
    }

    const ip::address any = group.is_v6() ? ip::address(ip::address_v6::any())
                                          : ip::address(ip::address_v4::any());
    socket_.bind(ip::udp::endpoint(any, config.port), ec);
    if (ec) {
        fail("Failed to bind to port " + std::to_string(config.port), ec);
    }

    std::optional<ip::address_v4> outbound;
    if (!config.interface_addr.empty() && group.is_v4()) {
        outbound = ip::make_address_v4(config.interface_addr, ec);
        if (ec) {
            fail("Invalid interface address " + config.interface_addr, ec);
        }
    }

    if (outbound) {
        socket_.set_option(ip::multicast::join_group(group.to_v4(), *outbound), ec);
    } else {
        socket_.set_option(ip::multicast::join_group(group), ec);
    }
    if (ec) {
        fail("Failed to join multicast group " + config.group, ec);
    }
    joined_ = true;

    if (outbound) {
        socket_.set_option(ip::multicast::outbound_interface(*outbound), ec);
        if (ec) {
            LOG_WARN("AsyncEndpoint", "Failed to set multicast interface {}", config.interface_addr);
        }
    }

    socket_.set_option(ip::multicast::hops(config.ttl), ec);
    if (ec) {
        LOG_WARN("AsyncEndpoint", "Failed to set multicast TTL");
    }

    socket_.set_option(ip::multicast::enable_loopback(config.loopback), ec);
    if (ec) {
        LOG_WARN("AsyncEndpoint", "Failed to set multicast loopback");
    }

    group_endpoint_ = ip::udp::endpoint(group, config.port);
    LOG_DEBUG("AsyncEndpoint", "Listening on {}:{}", config.group, config.port);
}

void AsyncEndpoint::startReceive() {
    if (closed_) {
        return;
    }

    std::weak_ptr<AsyncEndpoint> weak = shared_from_this();
    socket_.async_receive_from(
        boost::asio::buffer(buffer_), sender_,
        boost::asio::bind_executor(strand_,
            [weak](const boost::system::error_code& ec, std::size_t bytes) {
                if (auto self = weak.lock()) {
                    self->onReceive(ec, bytes);
                }
            }));
}

void AsyncEndpoint::onReceive(const boost::system::error_code& ec, std::size_t bytes) {
    if (ec == boost::asio::error::operation_aborted || closed_) {
        return;
    }

    if (ec) {
        LOG_ERROR("AsyncEndpoint", "Receive failed: {}", ec.message());
    } else {
        LOG_TRACE("AsyncEndpoint", "Received {} bytes from {}",
                  bytes, sender_.address().to_string());
        runner_.handleDatagram(buffer_.data(), bytes);
    }

    startReceive();
}

bool AsyncEndpoint::sendAnnouncement(const std::string& payload) {
    boost::system::error_code ec;
    socket_.send_to(boost::asio::buffer(payload), group_endpoint_, 0, ec);
    if (ec) {
        LOG_ERROR("AsyncEndpoint", "Failed to send to {}: {}",
                  group_endpoint_.address().to_string(), ec.message());
        return false;
    }
    return true;
}

void AsyncEndpoint::publish(const DiscoveryResult& result) {
    for (auto it = waiters_.begin(); it != waiters_.end(); ++it) {
        if (matches(it->kind, result)) {
            FindHandler handler = std::move(it->handler);
            waiters_.erase(it);
            handler(FindResult::of(result));
            return;
        }
    }

    if (deliverToSubscribers(result)) {
        return;
    }

    buffered_.push_back(result);
    if (options_.result_capacity > 0 && buffered_.size() > options_.result_capacity) {
        buffered_.pop_front();
        LOG_WARN("AsyncEndpoint", "Result buffer full, dropped oldest result");
    }
}

void AsyncEndpoint::addWaiter(std::optional<ServiceKind> kind, FindHandler handler, Timeout timeout) {
    for (auto it = buffered_.begin(); it != buffered_.end(); ++it) {
        if (matches(kind, *it)) {
            DiscoveryResult result = std::move(*it);
            buffered_.erase(it);
            handler(FindResult::of(std::move(result)));
            return;
        }
    }

    if (closed_) {
        handler(FindResult::noEndpoint());
        return;
    }

    Waiter waiter{++next_id_, std::move(kind), std::move(handler), nullptr};

    if (timeout) {
        waiter.timer = std::make_unique<boost::asio::steady_timer>(strand_, *timeout);
        std::weak_ptr<AsyncEndpoint> weak = shared_from_this();
        const uint64_t id = waiter.id;
        waiter.timer->async_wait([weak, id](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            if (auto self = weak.lock()) {
                self->expireWaiter(id);
            }
        });
    }

    waiters_.push_back(std::move(waiter));
}

void AsyncEndpoint::expireWaiter(uint64_t id) {
    for (auto it = waiters_.begin(); it != waiters_.end(); ++it) {
        if (it->id == id) {
            FindHandler handler = std::move(it->handler);
            waiters_.erase(it);
            handler(FindResult::timedOut());
            return;
        }
    }
}

void AsyncEndpoint::addSubscriber(ResultHandler on_result, ClosedHandler on_closed) {
    while (!buffered_.empty()) {
        DiscoveryResult result = std::move(buffered_.front());
        buffered_.pop_front();
        if (!on_result(result)) {
            return;
        }
    }

    if (closed_) {
        if (on_closed) {
            on_closed();
        }
        return;
    }

    subscribers_.push_back(Subscriber{++next_id_, std::move(on_result), std::move(on_closed)});
}

bool AsyncEndpoint::deliverToSubscribers(const DiscoveryResult& result) {
    if (subscribers_.empty()) {
        return false;
    }

    for (auto it = subscribers_.begin(); it != subscribers_.end();) {
        if (!it->on_result(result)) {
            LOG_DEBUG("AsyncEndpoint", "Subscription {} ended by handler", it->id);
            it = subscribers_.erase(it);
        } else {
            ++it;
        }
    }
    return true;
}

void AsyncEndpoint::closeSocket() {
    boost::system::error_code ec;

    if (joined_) {
        socket_.set_option(ip::multicast::leave_group(group_endpoint_.address()), ec);
        if (ec) {
            LOG_DEBUG("AsyncEndpoint", "Leaving group failed: {}", ec.message());
        }
        joined_ = false;
    }

    if (socket_.is_open()) {
        socket_.close(ec);
        if (ec) {
            LOG_WARN("AsyncEndpoint", "Socket close failed: {}", ec.message());
        }
    }
}

void AsyncEndpoint::closeOnStrand() {
    if (closed_) {
        return;
    }
    closed_ = true;

    runner_.stop();
    closeSocket();
    runner_.finish();

    std::list<Waiter> waiters;
    waiters.swap(waiters_);
    for (auto& waiter : waiters) {
        if (waiter.timer) {
            waiter.timer->cancel();
        }
        waiter.handler(FindResult::noEndpoint());
    }

    std::vector<Subscriber> subscribers;
    subscribers.swap(subscribers_);
    for (auto& subscriber : subscribers) {
        if (subscriber.on_closed) {
            subscriber.on_closed();
        }
    }
}

}  // namespace core
}  // namespace mcdisc
