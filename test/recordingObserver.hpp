#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "lib/progressBroadcaster.hpp"

namespace Retagger::test {
    class RecordingObserver : public ProgressObserver {
    public:
        void deliver(const ProgressEvent& event) override {
            events.push_back(event);
        }

        std::vector<std::string> messages() const {
            std::vector<std::string> result;
            for (const auto& event : events) result.push_back(event.message);
            return result;
        }

        std::vector<int> progress() const {
            std::vector<int> result;
            for (const auto& event : events) result.push_back(event.progress);
            return result;
        }

        std::vector<ProgressEvent> events;
    };

    class ClosedObserver : public ProgressObserver {
    public:
        void deliver(const ProgressEvent&) override {
            ++attempts;
            throw std::runtime_error("WebSocket channel is closed");
        }

        int attempts = 0;
    };

    // Fails with a value that is not a std::exception.
    class ThrowingObserver : public ProgressObserver {
    public:
        void deliver(const ProgressEvent&) override {
            ++attempts;
            throw 42;
        }

        int attempts = 0;
    };
}
