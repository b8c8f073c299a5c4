#include "engineClient.hpp"

namespace Retagger {
    const char* toString(EngineErrc code) {
        switch (code) {
            case EngineErrc::Unreachable:  return "engine unreachable";
            case EngineErrc::PingFailed:   return "ping failed";
            case EngineErrc::InfoFailed:   return "info failed";
            case EngineErrc::ListFailed:   return "list failed";
            case EngineErrc::PullFailed:   return "pull failed";
            case EngineErrc::TagFailed:    return "tag failed";
            case EngineErrc::PushFailed:   return "push failed";
            case EngineErrc::RemoveFailed: return "remove failed";
        }
        return "engine error";
    }

    EngineError::EngineError(EngineErrc code, const std::string& detail)
        : std::runtime_error(detail), code_(code), detail_(detail) {}

    std::string ImageHandle::shorten(const std::string& id) {
        const std::string prefix = "sha256:";
        if (id.compare(0, prefix.size(), prefix) == 0) {
            return id.substr(0, prefix.size() + 12);
        }
        return id.substr(0, 12);
    }

    std::string describeError(std::exception_ptr error) {
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            return e.what();
        } catch (...) {
            return "unknown error";
        }
    }
}
