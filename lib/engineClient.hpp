#ifndef RETAGGER_ENGINE_CLIENT_HPP
#define RETAGGER_ENGINE_CLIENT_HPP

#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "statusStream.hpp"

namespace Retagger {
    enum class EngineErrc {Unreachable, PingFailed, InfoFailed, ListFailed, PullFailed, TagFailed, PushFailed, RemoveFailed};

    const char* toString(EngineErrc code);

    // Failure reported by the container engine. detail() is the engine's text, unmodified.
    class EngineError : public std::runtime_error {
    public:
        EngineError(EngineErrc code, const std::string& detail);

        EngineErrc code() const { return code_; }
        const std::string& detail() const { return detail_; }

    private:
        EngineErrc code_;
        std::string detail_;
    };

    struct ImageHandle {
        std::string id;
        std::string shortId;
        std::vector<std::string> tags;

        static std::string shorten(const std::string& id);
    };

    /**
     * Blocking client of a container engine. One instance serves the calls of a
     * single facade operation and is then destroyed.
     */
    class EngineClient {
    public:
        using RecordHandler = std::function<bool(const StatusRecord&)>;

        virtual ~EngineClient() = default;

        virtual void ping() = 0;
        virtual nlohmann::json info() = 0;
        virtual std::vector<ImageHandle> listImages() = 0;
        virtual ImageHandle pull(const std::string& reference) = 0;
        virtual void tag(const ImageHandle& image, const std::string& repository, const std::string& tag) = 0;
        // Hands every record of the push stream to onRecord; false abandons the stream.
        virtual void push(const std::string& reference, const RecordHandler& onRecord) = 0;
        virtual void remove(const std::string& reference, bool force) = 0;

        // Called from another thread: aborts the request in flight and refuses new ones.
        virtual void cancel() {}
    };

    using EngineClientFactory = std::function<std::unique_ptr<EngineClient>()>;

    // what() of the stored exception.
    std::string describeError(std::exception_ptr error);
}

#endif // RETAGGER_ENGINE_CLIENT_HPP
