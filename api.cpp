#include "api.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include "lib/logger.hpp"
#include "transferPipeline.hpp"

using namespace Retagger;

namespace {
    double now() {
        return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
    }

    nlohmann::json detail(const std::string& text) {
        return {{"detail", text}};
    }
}

Api::Api(EngineFacade& engine, ProgressBroadcaster& broadcaster, const Config& config)
    : engine_(engine), broadcaster_(broadcaster), config_(config) {}

void Api::handle(const std::string& method, const std::string& target, const std::string& body, Reply reply) {
    const auto path = target.substr(0, target.find('?'));
    logMessage(method + " " + path, "http", LogLevel::DEBUG);

    if (path == "/process-image" && method == "POST") {
        processImage(body, reply);
    } else if (path == "/health" && method == "GET") {
        health(std::move(reply));
    } else if (path == "/docker-status" && method == "GET") {
        engineStatus(std::move(reply));
    } else if (path == "/images" && method == "GET") {
        images(std::move(reply));
    } else if (path == "/process-image" || path == "/health" || path == "/docker-status" || path == "/images") {
        reply(405, detail("Method Not Allowed"));
    } else {
        reply(404, detail("Not Found"));
    }
}

void Api::processImage(const std::string& body, const Reply& reply) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        reply(400, detail("Request body must be a JSON object"));
        return;
    }
    auto imageName = json.find("image_name");
    if (imageName == json.end() || !imageName->is_string()) {
        reply(422, detail("image_name must be a string"));
        return;
    }
    std::string targetDomain;
    auto domain = json.find("target_domain");
    if (domain != json.end() && !domain->is_null()) {
        if (!domain->is_string()) {
            reply(422, detail("target_domain must be a string"));
            return;
        }
        targetDomain = domain->get<std::string>();
    }

    auto request = TransferRequest{imageName->get<std::string>(), targetDomain}.resolved(config_.defaultTargetDomain);
    logMessage("Transfer requested: " + request.imageName + " -> " + request.targetDomain, "http", LogLevel::INFO);
    TransferPipeline::create(engine_, broadcaster_, request)->run();

    reply(200, {
        {"message", "Image processing started"},
        {"image_name", request.imageName},
        {"target_domain", request.targetDomain}
    });
}

void Api::health(Reply reply) {
    engine_.testConnectionAsync([this, reply = std::move(reply)](std::exception_ptr error, bool connected) {
        if (error) {
            reply(200, {
                {"status", "error"},
                {"docker", "unknown"},
                {"docker_info", "Health check failed: " + describeError(error)},
                {"timestamp", now()}
            });
            return;
        }
        engine_.connectionDiagnosticAsync([reply, connected](std::exception_ptr error, std::string diagnostic) {
            if (error) {
                diagnostic = "Health check failed: " + describeError(error);
            }
            reply(200, {
                {"status", error ? "error" : "ok"},
                {"docker", connected ? "healthy" : "unhealthy"},
                {"docker_info", diagnostic},
                {"timestamp", now()}
            });
        });
    });
}

void Api::engineStatus(Reply reply) {
    engine_.testConnectionAsync([this, reply = std::move(reply)](std::exception_ptr error, bool connected) {
        if (error) {
            reply(200, {
                {"connected", false},
                {"status", "error"},
                {"error", describeError(error)},
                {"message", "Error while checking the container engine"}
            });
            return;
        }
        if (!connected) {
            engine_.connectionDiagnosticAsync([reply](std::exception_ptr error, std::string diagnostic) {
                reply(200, {
                    {"connected", false},
                    {"status", "unhealthy"},
                    {"error", error ? describeError(error) : diagnostic},
                    {"message", "Container engine connection failed"}
                });
            });
            return;
        }
        engine_.infoAsync([reply](std::exception_ptr error, nlohmann::json info) {
            if (error) {
                reply(200, {
                    {"connected", true},
                    {"status", "healthy"},
                    {"info", nullptr},
                    {"message", "Container engine reachable, info unavailable: " + describeError(error)}
                });
                return;
            }
            reply(200, {
                {"connected", true},
                {"status", "healthy"},
                {"info", std::move(info)},
                {"message", "Container engine connection OK"}
            });
        });
    });
}

void Api::images(Reply reply) {
    engine_.listImagesAsync([reply = std::move(reply)](std::exception_ptr error, std::vector<ImageHandle> images) {
        if (error) {
            reply(503, detail("Cannot list images: " + describeError(error)));
            return;
        }
        auto list = nlohmann::json::array();
        for (const auto& image : images) {
            list.push_back({{"id", image.id}, {"short_id", image.shortId}, {"tags", image.tags}});
        }
        reply(200, list);
    });
}
