/**
 * @file main.cpp
 * @brief mcdiscd entry point
 *
 * Runs one discovery endpoint from the command line:
 * - hosts only: announce and answer searches until interrupted
 * - with --search: print the first host of each kind, then exit
 * - with --all: print every result until interrupted or timed out
 *
 * Exit codes: 0 all searches answered, 1 error, 2 timed out.
 */

#include <mcdisc/core/async_endpoint.hpp>
#include <mcdisc/core/endpoint_builder.hpp>
#include <mcdisc/core/errors.hpp>
#include <mcdisc/core/sync_endpoint.hpp>
#include <mcdisc/daemon/config.hpp>
#include <mcdisc/utils/logger.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

using namespace mcdisc;
using namespace mcdisc::daemon;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitTimedOut = 2;

constexpr std::chrono::milliseconds kPollInterval(100);

// Global shutdown flag
std::atomic<bool> g_shutdown{false};

void signalHandler(int) {
    g_shutdown.store(true);
}

core::EndpointBuilder makeBuilder(const Config& config) {
    core::EndpointBuilder builder(config.name);
    if (!config.address.empty()) {
        builder.address(config.address);
    }
    for (const auto& host : config.hosts) {
        builder.host(host.kind, host.port);
    }
    for (const auto& kind : config.searches) {
        builder.search(kind);
    }

    core::EndpointOptions& options = builder.options();
    options.multicast.group = config.mcast_addr;
    options.multicast.port = config.mcast_port;
    options.multicast.ttl = config.ttl;
    return builder;
}

std::optional<std::chrono::steady_clock::time_point> deadlineFor(const Config& config) {
    if (config.timeout_ms <= 0) {
        return std::nullopt;
    }
    return std::chrono::steady_clock::now() + std::chrono::milliseconds(config.timeout_ms);
}

bool expired(const std::optional<std::chrono::steady_clock::time_point>& deadline) {
    return deadline && std::chrono::steady_clock::now() >= *deadline;
}

void printResult(const core::DiscoveryResult& result) {
    std::cout << result.kind << " " << result.hosted_by.name << " " << result.endpoint() << std::endl;
}

int runSync(const Config& config) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    auto endpoint = makeBuilder(config).buildSync();
    LOG_INFO("Daemon", "Endpoint {} running", endpoint->identity().toString());

    const auto deadline = deadlineFor(config);
    int exit_code = kExitOk;

    if (config.find_all) {
        core::ServiceStream stream = endpoint->findAllServices();
        while (!g_shutdown.load() && !expired(deadline)) {
            if (auto result = stream.next(kPollInterval)) {
                printResult(*result);
            }
        }
    } else if (!config.searches.empty()) {
        for (const auto& kind : config.searches) {
            core::FindResult found = core::FindResult::timedOut();
            while (!g_shutdown.load() && !expired(deadline)) {
                found = endpoint->findService(kind, kPollInterval);
                if (found.status != core::FindStatus::TIMED_OUT) {
                    break;
                }
            }
            if (!found.found()) {
                LOG_WARN("Daemon", "No host of '{}' found ({})", kind, core::findStatusToString(found.status));
                exit_code = kExitTimedOut;
                break;
            }
            printResult(*found.service);
        }
    } else {
        while (!g_shutdown.load() && !expired(deadline)) {
            std::this_thread::sleep_for(kPollInterval);
        }
    }

    LOG_INFO("Daemon", "Shutting down...");
    endpoint->shutdown();
    return exit_code;
}

int runAsync(const Config& config) {
    boost::asio::io_context io;
    auto endpoint = makeBuilder(config).buildAsync(io);
    LOG_INFO("Daemon", "Endpoint {} running", endpoint->identity().toString());

    int exit_code = kExitOk;

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    boost::asio::steady_timer deadline(io);

    auto stop = [&]() {
        signals.cancel();
        deadline.cancel();
        endpoint->shutdown();
    };

    signals.async_wait([&](const boost::system::error_code& ec, int signal) {
        if (!ec) {
            LOG_INFO("Daemon", "Received signal {}", signal);
            stop();
        }
    });

    if (config.timeout_ms > 0 && (config.find_all || config.searches.empty())) {
        deadline.expires_after(std::chrono::milliseconds(config.timeout_ms));
        deadline.async_wait([&](const boost::system::error_code& ec) {
            if (!ec) {
                stop();
            }
        });
    }

    core::AsyncEndpoint::Timeout find_timeout;
    if (config.timeout_ms > 0) {
        find_timeout = std::chrono::milliseconds(config.timeout_ms);
    }

    if (config.find_all) {
        endpoint->findAllServices([](const core::DiscoveryResult& result) {
            printResult(result);
            return true;
        });
    } else if (!config.searches.empty()) {
        auto remaining = std::make_shared<size_t>(config.searches.size());
        for (const auto& kind : config.searches) {
            endpoint->asyncFindService(kind, [&, remaining, kind](core::FindResult found) {
                if (found.found()) {
                    printResult(*found.service);
                } else {
                    LOG_WARN("Daemon", "No host of '{}' found ({})", kind, core::findStatusToString(found.status));
                    exit_code = kExitTimedOut;
                }
                if (--*remaining == 0) {
                    stop();
                }
            }, find_timeout);
        }
    }

    io.run();
    LOG_INFO("Daemon", "Endpoint stopped");
    return exit_code;
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config = parseArgs(argc, argv);

    if (config.help) {
        if (!config.error.empty()) {
            std::cerr << "Error: " << config.error << "\n\n";
        }
        printUsage(argv[0]);
        return config.error.empty() ? kExitOk : kExitError;
    }

    auto& logger = utils::Logger::instance();
    logger.setLevel(utils::logLevelFromString(config.log_level));

    LOG_INFO("Daemon", "mcdiscd starting ({} hosted, {} searched)",
             config.hosts.size(), config.searches.size());
    LOG_INFO("Daemon", "Discovery: {}:{}", config.mcast_addr, config.mcast_port);

    try {
        return config.use_async ? runAsync(config) : runSync(config);
    } catch (const core::DiscoveryError& e) {
        LOG_ERROR("Daemon", "{} ({})", e.what(), core::errorCodeToString(e.code()));
        return kExitError;
    } catch (const std::exception& e) {
        LOG_ERROR("Daemon", "Fatal error: {}", e.what());
        return kExitError;
    }
}
