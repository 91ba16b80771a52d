/**
 * @file config.hpp
 * @brief mcdiscd configuration and CLI parsing
 */

#pragma once

#include "mcdisc/net/address.hpp"

#include <cstdint>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcdisc {
namespace daemon {

/**
 * @brief A "--host kind:port" argument
 */
struct HostSpec {
    std::string kind;
    uint16_t port = 0;
};

/**
 * @brief Daemon configuration structure
 */
struct Config {
    std::string name = "mcdiscd";
    std::string address;                    ///< Empty = resolve the local address
    std::vector<HostSpec> hosts;
    std::vector<std::string> searches;

    std::string mcast_addr = "224.0.0.87";
    uint16_t mcast_port = 8787;
    int ttl = 1;

    int64_t timeout_ms = 0;                 ///< 0 = wait until interrupted
    bool find_all = false;                  ///< Stream every result instead of one per search
    bool use_async = false;                 ///< Run on an io_context instead of a worker thread

    std::string log_level = "INFO";
    bool help = false;
    std::string error;                      ///< Set when parsing failed
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "mcdiscd - Local service discovery over UDP multicast\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --name <name>         Endpoint name (default: mcdiscd)\n"
              << "  --addr <ip>           Advertised address (default: resolved local address)\n"
              << "  --host <kind:port>    Host a service (repeatable)\n"
              << "  --search <kind>       Search for a service (repeatable)\n"
              << "  --mcast-addr <addr>   Discovery group (default: 224.0.0.87)\n"
              << "  --mcast-port <port>   Discovery port (default: 8787)\n"
              << "  --ttl <n>             Multicast TTL (default: 1)\n"
              << "  --timeout-ms <ms>     Give up after this long, 0 = never (default: 0)\n"
              << "  --all                 Print every result until interrupted or timed out\n"
              << "  --async               Use the Boost.Asio endpoint\n"
              << "  --log-level <level>   TRACE, DEBUG, INFO, WARN, ERROR, OFF (default: INFO)\n"
              << "\n  --help                Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --name greeter --host hello:4112\n"
              << "  " << program_name << " --name client --search hello --timeout-ms 5000\n";
}

/**
 * @brief Parse "kind:port"
 * @return False if the kind is empty or the port is not in 1..65535
 */
inline bool parseHostSpec(const std::string& text, HostSpec& spec) {
    const auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
        return false;
    }

    const std::string port_text = text.substr(colon + 1);
    if (port_text.find_first_not_of("0123456789") != std::string::npos || port_text.size() > 5) {
        return false;
    }

    const unsigned long port = std::stoul(port_text);
    if (port == 0 || port > 65535) {
        return false;
    }

    spec.kind = text.substr(0, colon);
    spec.port = static_cast<uint16_t>(port);
    return true;
}

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration; on failure help is set and error describes why
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    auto fail = [&config](const std::string& message) {
        config.error = message;
        config.help = true;
        return config;
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Flags without a value
        if (std::strcmp(arg, "--all") == 0) {
            config.find_all = true;
            continue;
        }
        if (std::strcmp(arg, "--async") == 0) {
            config.use_async = true;
            continue;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            return fail(std::string("Option ") + arg + " requires a value");
        }

        const char* value = argv[++i];

        try {
            if (std::strcmp(arg, "--name") == 0) {
                config.name = value;
            } else if (std::strcmp(arg, "--addr") == 0) {
                config.address = value;
            } else if (std::strcmp(arg, "--host") == 0) {
                HostSpec spec;
                if (!parseHostSpec(value, spec)) {
                    return fail(std::string("Invalid --host '") + value + "', expected kind:port");
                }
                config.hosts.push_back(spec);
            } else if (std::strcmp(arg, "--search") == 0) {
                config.searches.emplace_back(value);
            } else if (std::strcmp(arg, "--mcast-addr") == 0) {
                if (!net::isMulticastAddress(value)) {
                    return fail(std::string("Invalid --mcast-addr ") + value + ", expected 224.0.0.0/4");
                }
                config.mcast_addr = value;
            } else if (std::strcmp(arg, "--mcast-port") == 0) {
                const int port = std::stoi(value);
                if (port <= 0 || port > 65535) {
                    return fail(std::string("Invalid --mcast-port ") + value);
                }
                config.mcast_port = static_cast<uint16_t>(port);
            } else if (std::strcmp(arg, "--ttl") == 0) {
                config.ttl = std::stoi(value);
            } else if (std::strcmp(arg, "--timeout-ms") == 0) {
                config.timeout_ms = std::stoll(value);
                if (config.timeout_ms < 0) {
                    return fail(std::string("Invalid --timeout-ms ") + value);
                }
            } else if (std::strcmp(arg, "--log-level") == 0) {
                config.log_level = value;
            } else {
                return fail(std::string("Unknown option ") + arg);
            }
        } catch (const std::logic_error&) {
            // std::stoi family: invalid_argument / out_of_range
            return fail(std::string("Invalid value for ") + arg + ": " + value);
        }
    }

    return config;
}

}  // namespace daemon
}  // namespace mcdisc
