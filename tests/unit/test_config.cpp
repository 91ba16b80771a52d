/**
 * @file test_config.cpp
 * @brief Unit tests for mcdiscd configuration and CLI parsing
 *
 * Tests cover:
 * - Default configuration values
 * - CLI argument parsing
 * - Repeatable --host / --search
 * - Error handling
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <mcdisc/daemon/config.hpp>

#include <string>
#include <vector>

using namespace mcdisc::daemon;

class ConfigTest : public ::testing::Test {
protected:
    // Helper to create argc/argv from vector of strings
    std::pair<int, std::vector<char*>> makeArgs(const std::vector<std::string>& args) {
        argv_storage_.clear();
        argv_storage_.reserve(args.size());

        for (const auto& arg : args) {
            argv_storage_.push_back(std::vector<char>(arg.begin(), arg.end()));
            argv_storage_.back().push_back('\0');
        }

        argv_ptrs_.clear();
        for (auto& storage : argv_storage_) {
            argv_ptrs_.push_back(storage.data());
        }

        return {static_cast<int>(argv_ptrs_.size()), argv_ptrs_};
    }

    Config parse(const std::vector<std::string>& args) {
        auto [argc, argv] = makeArgs(args);
        return parseArgs(argc, argv.data());
    }

private:
    std::vector<std::vector<char>> argv_storage_;
    std::vector<char*> argv_ptrs_;
};

// =============================================================================
// Default Values
// =============================================================================

TEST_F(ConfigTest, DefaultValues) {
    Config config;

    EXPECT_EQ(config.name, "mcdiscd");
    EXPECT_TRUE(config.address.empty());
    EXPECT_TRUE(config.hosts.empty());
    EXPECT_TRUE(config.searches.empty());
    EXPECT_EQ(config.mcast_addr, "224.0.0.87");
    EXPECT_EQ(config.mcast_port, 8787);
    EXPECT_EQ(config.ttl, 1);
    EXPECT_EQ(config.timeout_ms, 0);
    EXPECT_FALSE(config.find_all);
    EXPECT_FALSE(config.use_async);
    EXPECT_EQ(config.log_level, "INFO");
    EXPECT_FALSE(config.help);
    EXPECT_TRUE(config.error.empty());
}

TEST_F(ConfigTest, NoArguments) {
    Config config = parse({"mcdiscd"});

    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.name, "mcdiscd");
}

// =============================================================================
// Options
// =============================================================================

TEST_F(ConfigTest, AllOptions) {
    Config config = parse({
        "mcdiscd",
        "--name", "greeter",
        "--addr", "10.0.0.4",
        "--mcast-addr", "239.1.2.3",
        "--mcast-port", "9999",
        "--ttl", "4",
        "--timeout-ms", "2500",
        "--log-level", "DEBUG",
        "--all",
        "--async"
    });

    EXPECT_FALSE(config.help);
    EXPECT_EQ(config.name, "greeter");
    EXPECT_EQ(config.address, "10.0.0.4");
    EXPECT_EQ(config.mcast_addr, "239.1.2.3");
    EXPECT_EQ(config.mcast_port, 9999);
    EXPECT_EQ(config.ttl, 4);
    EXPECT_EQ(config.timeout_ms, 2500);
    EXPECT_EQ(config.log_level, "DEBUG");
    EXPECT_TRUE(config.find_all);
    EXPECT_TRUE(config.use_async);
}

TEST_F(ConfigTest, RepeatedHostAndSearch) {
    Config config = parse({
        "mcdiscd",
        "--host", "hello:4112",
        "--search", "time",
        "--host", "echo:7",
        "--search", "hello"
    });

    ASSERT_EQ(config.hosts.size(), 2u);
    EXPECT_EQ(config.hosts[0].kind, "hello");
    EXPECT_EQ(config.hosts[0].port, 4112);
    EXPECT_EQ(config.hosts[1].kind, "echo");
    EXPECT_EQ(config.hosts[1].port, 7);
    EXPECT_THAT(config.searches, ::testing::ElementsAre("time", "hello"));
}

TEST_F(ConfigTest, HostSpecKindMayContainColons) {
    HostSpec spec;
    ASSERT_TRUE(parseHostSpec("svc:v2:8080", spec));
    EXPECT_EQ(spec.kind, "svc:v2");
    EXPECT_EQ(spec.port, 8080);
}

TEST_F(ConfigTest, InvalidHostSpecs) {
    HostSpec spec;
    EXPECT_FALSE(parseHostSpec("hello", spec));
    EXPECT_FALSE(parseHostSpec(":4112", spec));
    EXPECT_FALSE(parseHostSpec("hello:", spec));
    EXPECT_FALSE(parseHostSpec("hello:abc", spec));
    EXPECT_FALSE(parseHostSpec("hello:0", spec));
    EXPECT_FALSE(parseHostSpec("hello:65536", spec));
    EXPECT_FALSE(parseHostSpec("hello:-1", spec));
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(ConfigTest, HelpFlag) {
    EXPECT_TRUE(parse({"mcdiscd", "--help"}).help);
    EXPECT_TRUE(parse({"mcdiscd", "-h"}).help);
    EXPECT_TRUE(parse({"mcdiscd", "--help"}).error.empty());
}

TEST_F(ConfigTest, MissingValue) {
    Config config = parse({"mcdiscd", "--name"});

    EXPECT_TRUE(config.help);
    EXPECT_THAT(config.error, ::testing::HasSubstr("requires a value"));
}

TEST_F(ConfigTest, UnknownOption) {
    Config config = parse({"mcdiscd", "--bogus", "1"});

    EXPECT_TRUE(config.help);
    EXPECT_THAT(config.error, ::testing::HasSubstr("Unknown option"));
}

TEST_F(ConfigTest, NonNumericValue) {
    Config config = parse({"mcdiscd", "--ttl", "abc"});

    EXPECT_TRUE(config.help);
    EXPECT_FALSE(config.error.empty());
}

TEST_F(ConfigTest, PortOutOfRange) {
    EXPECT_TRUE(parse({"mcdiscd", "--mcast-port", "70000"}).help);
    EXPECT_TRUE(parse({"mcdiscd", "--mcast-port", "0"}).help);
}

TEST_F(ConfigTest, BadHostSpec) {
    Config config = parse({"mcdiscd", "--host", "hello"});

    EXPECT_TRUE(config.help);
    EXPECT_THAT(config.error, ::testing::HasSubstr("kind:port"));
}

TEST_F(ConfigTest, NegativeTimeout) {
    EXPECT_TRUE(parse({"mcdiscd", "--timeout-ms", "-5"}).help);
}

TEST_F(ConfigTest, NonMulticastGroup) {
    Config config = parse({"mcdiscd", "--mcast-addr", "10.0.0.1"});

    EXPECT_TRUE(config.help);
    EXPECT_THAT(config.error, ::testing::HasSubstr("--mcast-addr"));
}
