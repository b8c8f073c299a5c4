#include <cstdlib>
#include <stdexcept>

#include <gtest/gtest.h>

#include "config.hpp"

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        clear();
    }

    void TearDown() override {
        clear();
    }

    static void clear() {
        for (const auto* name : {"HOST", "PORT", "DOCKER_HOST", "NEW_DOMAIN", "ENGINE_WORKERS", "KEEPALIVE_SECONDS", "LOG_LEVEL"}) {
            unsetenv(name);
        }
    }
};

TEST_F(ConfigTest, Defaults) {
    auto config = Config::fromEnvironment();
    EXPECT_EQ(config.host, "0.0.0.0");
    EXPECT_EQ(config.port, 8000);
    EXPECT_EQ(config.engineHost, "unix:///var/run/docker.sock");
    EXPECT_EQ(config.defaultTargetDomain, "localhost:5000");
    EXPECT_EQ(config.engineWorkers, 4u);
    EXPECT_EQ(config.keepAlive, std::chrono::seconds(30));
    EXPECT_EQ(config.logLevel, Retagger::LogLevel::INFO);
}

TEST_F(ConfigTest, ReadsEnvironment) {
    setenv("PORT", "9090", 1);
    setenv("DOCKER_HOST", "tcp://127.0.0.1:2375", 1);
    setenv("NEW_DOMAIN", "harbor.internal", 1);
    setenv("KEEPALIVE_SECONDS", "10", 1);
    setenv("LOG_LEVEL", "DEBUG", 1);

    auto config = Config::fromEnvironment();
    EXPECT_EQ(config.port, 9090);
    EXPECT_EQ(config.engineHost, "tcp://127.0.0.1:2375");
    EXPECT_EQ(config.defaultTargetDomain, "harbor.internal");
    EXPECT_EQ(config.keepAlive, std::chrono::seconds(10));
    EXPECT_EQ(config.logLevel, Retagger::LogLevel::DEBUG);
}

TEST_F(ConfigTest, EmptyValuesKeepDefaults) {
    setenv("NEW_DOMAIN", "", 1);
    EXPECT_EQ(Config::fromEnvironment().defaultTargetDomain, "localhost:5000");
}

TEST_F(ConfigTest, RejectsMalformedNumbers) {
    setenv("PORT", "eighty", 1);
    EXPECT_THROW(Config::fromEnvironment(), std::invalid_argument);

    setenv("PORT", "70000", 1);
    EXPECT_THROW(Config::fromEnvironment(), std::invalid_argument);

    setenv("PORT", "8080x", 1);
    EXPECT_THROW(Config::fromEnvironment(), std::invalid_argument);
}

TEST_F(ConfigTest, RejectsUnknownLogLevel) {
    setenv("LOG_LEVEL", "verbose", 1);
    EXPECT_THROW(Config::fromEnvironment(), std::invalid_argument);
}
