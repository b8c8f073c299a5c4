#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "lib/logger.hpp"

struct Config {
    std::string host = "0.0.0.0";
    unsigned short port = 8000;
    std::string engineHost = "unix:///var/run/docker.sock";
    std::string defaultTargetDomain = "localhost:5000";
    std::size_t engineWorkers = 4;
    std::chrono::seconds keepAlive{30};
    Retagger::LogLevel logLevel = Retagger::LogLevel::INFO;

    // Reads HOST, PORT, DOCKER_HOST, NEW_DOMAIN, ENGINE_WORKERS, KEEPALIVE_SECONDS, LOG_LEVEL.
    static Config fromEnvironment();
};
