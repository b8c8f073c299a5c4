#ifndef RETAGGER_DOCKER_CLIENT_HPP
#define RETAGGER_DOCKER_CLIENT_HPP

#include <memory>
#include <string>
#include <vector>

#include "engineClient.hpp"

namespace Retagger {
    /**
     * Engine client speaking the Docker Engine HTTP API (also served by Podman).
     * host is "unix:///var/run/docker.sock", "tcp://host:port" or "http://host:port".
     */
    class DockerClient : public EngineClient {
    public:
        explicit DockerClient(const std::string& host);
        ~DockerClient() override;

        void ping() override;
        nlohmann::json info() override;
        std::vector<ImageHandle> listImages() override;
        ImageHandle pull(const std::string& reference) override;
        void tag(const ImageHandle& image, const std::string& repository, const std::string& tag) override;
        void push(const std::string& reference, const RecordHandler& onRecord) override;
        void remove(const std::string& reference, bool force) override;
        void cancel() override;

        ImageHandle inspect(const std::string& reference);

    private:
        struct Impl;
        std::unique_ptr<Impl> pimpl_;
    };

    EngineClientFactory dockerClientFactory(const std::string& host);
}

#endif // RETAGGER_DOCKER_CLIENT_HPP
