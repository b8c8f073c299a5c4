#include "dockerClient.hpp"

#include <atomic>
#include <chrono>
#include <utility>

#include <sys/socket.h>

#include <httplib.h>

#include "imageReference.hpp"
#include "logger.hpp"

namespace Retagger {
    namespace {
        // base64("{}"): anonymous credentials, the engine falls back to its own login state
        const char* const ANONYMOUS_AUTH = "e30=";
        const auto TRANSFER_TIMEOUT = std::chrono::hours(1);

        bool startsWith(const std::string& value, const std::string& prefix) {
            return value.compare(0, prefix.size(), prefix) == 0;
        }

        std::string describe(const httplib::Result& res) {
            if (!res) {
                return httplib::to_string(res.error());
            }
            return "HTTP " + std::to_string(res->status) + ": " + engineMessage(res->body);
        }

        std::string withQuery(const std::string& path, const httplib::Params& params) {
            return httplib::append_query_params(path, params);
        }

        ImageHandle handleFromJson(const nlohmann::json& json) {
            ImageHandle image;
            image.id = json.value("Id", "");
            image.shortId = ImageHandle::shorten(image.id);
            auto tags = json.find("RepoTags");
            if (tags != json.end() && tags->is_array()) {
                for (const auto& tag : *tags) {
                    if (tag.is_string()) image.tags.push_back(tag.get<std::string>());
                }
            }
            return image;
        }
    }

    struct DockerClient::Impl {
        httplib::Client cli_;
        std::string host_;
        std::atomic<bool> cancelled_{false};

        explicit Impl(const std::string& host) : cli_(endpointOf(host)), host_(host) {
            if (startsWith(host, "unix://")) {
                cli_.set_address_family(AF_UNIX);
            }
            cli_.set_read_timeout(TRANSFER_TIMEOUT);
        }

        void ensureActive() const {
            if (cancelled_) {
                throw EngineError(EngineErrc::Unreachable, "Request to " + host_ + " was cancelled");
            }
        }

        static std::string endpointOf(const std::string& host) {
            if (startsWith(host, "unix://")) return host.substr(7);
            if (startsWith(host, "tcp://")) return "http://" + host.substr(6);
            return host;
        }
    };

    DockerClient::DockerClient(const std::string& host) : pimpl_(std::make_unique<Impl>(host)) {}
    DockerClient::~DockerClient() = default;

    void DockerClient::ping() {
        pimpl_->ensureActive();
        auto res = pimpl_->cli_.Get("/_ping");
        if (!res) {
            throw EngineError(EngineErrc::Unreachable,
                              "Cannot reach container engine at " + pimpl_->host_ + ": " + describe(res));
        }
        if (res->status != 200) {
            throw EngineError(EngineErrc::PingFailed, describe(res));
        }
    }

    nlohmann::json DockerClient::info() {
        pimpl_->ensureActive();
        auto res = pimpl_->cli_.Get("/info");
        if (!res || res->status != 200) {
            throw EngineError(EngineErrc::InfoFailed, describe(res));
        }
        return nlohmann::json::parse(res->body);
    }

    std::vector<ImageHandle> DockerClient::listImages() {
        pimpl_->ensureActive();
        auto res = pimpl_->cli_.Get("/images/json");
        if (!res || res->status != 200) {
            throw EngineError(EngineErrc::ListFailed, describe(res));
        }
        std::vector<ImageHandle> images;
        for (const auto& entry : nlohmann::json::parse(res->body)) {
            images.push_back(handleFromJson(entry));
        }
        return images;
    }

    ImageHandle DockerClient::inspect(const std::string& reference) {
        pimpl_->ensureActive();
        auto res = pimpl_->cli_.Get("/images/" + reference + "/json");
        if (!res || res->status != 200) {
            throw EngineError(EngineErrc::PullFailed, "Cannot inspect " + reference + ": " + describe(res));
        }
        return handleFromJson(nlohmann::json::parse(res->body));
    }

    ImageHandle DockerClient::pull(const std::string& reference) {
        pimpl_->ensureActive();
        auto [name, tag] = splitNameAndTag(reference);
        std::string streamError;
        StatusStreamReader reader([&streamError](const StatusRecord& record) {
            if (record.error) {
                streamError = *record.error;
                return false;
            }
            return true;
        });

        std::string body;
        httplib::Headers headers{{"X-Registry-Auth", ANONYMOUS_AUTH}};
        auto res = pimpl_->cli_.Post(
            withQuery("/images/create", {{"fromImage", name}, {"tag", tag}}),
            headers,
            "",
            "application/json",
            [&reader, &body](const char* data, size_t data_length) {
                if (body.size() < 4096) body.append(data, data_length);
                return reader.feed(data, data_length);
            },
            nullptr
        );
        if (!streamError.empty()) {
            throw EngineError(EngineErrc::PullFailed, streamError);
        }
        if (!res) {
            throw EngineError(EngineErrc::PullFailed, describe(res));
        }
        if (res->status != 200) {
            throw EngineError(EngineErrc::PullFailed, "HTTP " + std::to_string(res->status) + ": " + engineMessage(body));
        }
        reader.finish();
        if (!streamError.empty()) {
            throw EngineError(EngineErrc::PullFailed, streamError);
        }

        logMessage("Pulled " + reference, "engine", LogLevel::DEBUG);
        return inspect(name + ":" + tag);
    }

    void DockerClient::tag(const ImageHandle& image, const std::string& repository, const std::string& tag) {
        pimpl_->ensureActive();
        auto res = pimpl_->cli_.Post(withQuery("/images/" + image.id + "/tag", {{"repo", repository}, {"tag", tag}}));
        if (!res || res->status != 201) {
            throw EngineError(EngineErrc::TagFailed, describe(res));
        }
    }

    void DockerClient::push(const std::string& reference, const RecordHandler& onRecord) {
        pimpl_->ensureActive();
        auto [name, tag] = splitNameAndTag(reference);
        StatusStreamReader reader(onRecord);

        std::string body;
        httplib::Headers headers{{"X-Registry-Auth", ANONYMOUS_AUTH}};
        auto res = pimpl_->cli_.Post(
            withQuery("/images/" + name + "/push", {{"tag", tag}}),
            headers,
            "",
            "application/json",
            [&reader, &body](const char* data, size_t data_length) {
                if (body.size() < 4096) body.append(data, data_length);
                return reader.feed(data, data_length);
            },
            nullptr
        );
        // The consumer abandoned the stream, the rest of the response is not needed
        if (reader.stopped()) {
            return;
        }
        if (!res) {
            throw EngineError(EngineErrc::PushFailed, describe(res));
        }
        if (res->status != 200) {
            throw EngineError(EngineErrc::PushFailed, "HTTP " + std::to_string(res->status) + ": " + engineMessage(body));
        }
        reader.finish();
    }

    void DockerClient::remove(const std::string& reference, bool force) {
        pimpl_->ensureActive();
        auto res = pimpl_->cli_.Delete(withQuery("/images/" + reference, {{"force", force ? "true" : "false"}}));
        if (!res || res->status != 200) {
            throw EngineError(EngineErrc::RemoveFailed, describe(res));
        }
    }

    void DockerClient::cancel() {
        pimpl_->cancelled_ = true;
        pimpl_->cli_.stop();
    }

    EngineClientFactory dockerClientFactory(const std::string& host) {
        return [host] { return std::make_unique<DockerClient>(host); };
    }
}
