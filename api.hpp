#pragma once

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "lib/engineFacade.hpp"
#include "lib/progressBroadcaster.hpp"

/**
 * The HTTP endpoints, independent of the socket layer. Replies arrive through
 * the callback, possibly after the engine has been consulted on the worker pool.
 */
class Api {
public:
    using Reply = std::function<void(unsigned status, const nlohmann::json& body)>;

    Api(Retagger::EngineFacade& engine, Retagger::ProgressBroadcaster& broadcaster, const Config& config);

    void handle(const std::string& method, const std::string& target, const std::string& body, Reply reply);

    // POST /process-image. Starts a transfer and acknowledges right away.
    void processImage(const std::string& body, const Reply& reply);
    // GET /health
    void health(Reply reply);
    // GET /docker-status
    void engineStatus(Reply reply);
    // GET /images
    void images(Reply reply);

private:
    Retagger::EngineFacade& engine_;
    Retagger::ProgressBroadcaster& broadcaster_;
    const Config& config_;
};
