#include "config.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace {
    const char* env(const char* name) {
        const char* value = std::getenv(name);
        return value == nullptr || *value == '\0' ? nullptr : value;
    }

    unsigned long numberFrom(const char* name, const char* value, unsigned long min, unsigned long max) {
        std::size_t consumed = 0;
        unsigned long number = 0;
        try {
            number = std::stoul(value, &consumed);
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string(name) + " is not a number: " + value);
        }
        if (value[consumed] != '\0' || number < min || number > max) {
            throw std::invalid_argument(std::string(name) + " is out of range: " + value);
        }
        return number;
    }
}

Config Config::fromEnvironment() {
    Config config;
    if (auto value = env("HOST")) config.host = value;
    if (auto value = env("PORT")) {
        config.port = static_cast<unsigned short>(numberFrom("PORT", value, 1, std::numeric_limits<unsigned short>::max()));
    }
    if (auto value = env("DOCKER_HOST")) config.engineHost = value;
    if (auto value = env("NEW_DOMAIN")) config.defaultTargetDomain = value;
    if (auto value = env("ENGINE_WORKERS")) config.engineWorkers = numberFrom("ENGINE_WORKERS", value, 1, 64);
    if (auto value = env("KEEPALIVE_SECONDS")) {
        config.keepAlive = std::chrono::seconds(numberFrom("KEEPALIVE_SECONDS", value, 1, 3600));
    }
    if (auto value = env("LOG_LEVEL")) config.logLevel = Retagger::parseLogLevel(value);
    return config;
}
