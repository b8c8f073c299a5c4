#ifndef RETAGGER_STATUS_STREAM_HPP
#define RETAGGER_STATUS_STREAM_HPP

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace Retagger {
    // One record of an engine progress stream (pull, push).
    struct StatusRecord {
        std::optional<std::string> status;
        std::optional<std::string> error;
        std::optional<std::string> id;
        std::optional<std::string> progress;

        static StatusRecord fromJson(const nlohmann::json& json);
    };

    /**
     * Splits a chunked body of newline-delimited JSON objects into records.
     * Chunks may cut a line anywhere; the partial line is kept until the next feed.
     * Once the handler returns false the reader is stopped and ignores further input.
     */
    class StatusStreamReader {
    public:
        using Handler = std::function<bool(const StatusRecord&)>;

        explicit StatusStreamReader(Handler handler);

        bool feed(const char* data, std::size_t length);
        // Dispatches a trailing line that had no newline.
        void finish();

        bool stopped() const { return stopped_; }

    private:
        bool dispatchLine(std::string line);

        Handler handler_;
        std::string pending_;
        bool stopped_ = false;
    };

    // Engine error bodies look like {"message": "..."}; falls back to the raw body.
    std::string engineMessage(const std::string& body);
}

#endif // RETAGGER_STATUS_STREAM_HPP
