#include "statusStream.hpp"

#include <utility>

#include <boost/algorithm/string/trim.hpp>

#include "logger.hpp"

namespace Retagger {
    namespace {
        std::optional<std::string> stringField(const nlohmann::json& json, const char* key) {
            auto it = json.find(key);
            if (it == json.end() || it->is_null()) {
                return std::nullopt;
            }
            if (it->is_string()) {
                return it->get<std::string>();
            }
            return it->dump();
        }
    }

    StatusRecord StatusRecord::fromJson(const nlohmann::json& json) {
        StatusRecord record;
        if (!json.is_object()) {
            return record;
        }
        record.status = stringField(json, "status");
        record.error = stringField(json, "error");
        if (!record.error) {
            auto detail = json.find("errorDetail");
            if (detail != json.end() && detail->is_object()) {
                record.error = stringField(*detail, "message");
            }
        }
        record.id = stringField(json, "id");
        record.progress = stringField(json, "progress");
        return record;
    }

    StatusStreamReader::StatusStreamReader(Handler handler) : handler_(std::move(handler)) {}

    bool StatusStreamReader::feed(const char* data, std::size_t length) {
        if (stopped_) {
            return false;
        }
        pending_.append(data, length);

        std::size_t start = 0;
        for (auto newline = pending_.find('\n'); newline != std::string::npos; newline = pending_.find('\n', start)) {
            auto line = pending_.substr(start, newline - start);
            start = newline + 1;
            if (!dispatchLine(std::move(line))) {
                pending_.clear();
                return false;
            }
        }
        pending_.erase(0, start);
        return true;
    }

    void StatusStreamReader::finish() {
        if (stopped_) {
            return;
        }
        auto rest = std::move(pending_);
        pending_.clear();
        dispatchLine(std::move(rest));
    }

    bool StatusStreamReader::dispatchLine(std::string line) {
        boost::algorithm::trim(line);
        if (line.empty()) {
            return true;
        }

        auto json = nlohmann::json::parse(line, nullptr, false);
        if (json.is_discarded()) {
            logMessage("Skipping malformed status line: " + line, "engine", LogLevel::WARN);
            return true;
        }

        if (!handler_(StatusRecord::fromJson(json))) {
            stopped_ = true;
        }
        return !stopped_;
    }

    std::string engineMessage(const std::string& body) {
        auto json = nlohmann::json::parse(body, nullptr, false);
        if (!json.is_discarded() && json.is_object()) {
            if (auto message = stringField(json, "message")) {
                return *message;
            }
        }
        return boost::algorithm::trim_copy(body);
    }
}
