#include "progressBroadcaster.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <vector>

#include <nlohmann/json.hpp>

#include "logger.hpp"

namespace Retagger {
    ProgressEvent ProgressEvent::now(const std::string& message, int progress) {
        const auto sinceEpoch = std::chrono::system_clock::now().time_since_epoch();
        return {message, std::clamp(progress, 0, 100), std::chrono::duration<double>(sinceEpoch).count()};
    }

    std::string ProgressEvent::toJson() const {
        nlohmann::json json = {
            {"message", message},
            {"progress", progress},
            {"timestamp", timestamp}
        };
        return json.dump();
    }

    void ProgressBroadcaster::subscribe(ProgressObserver* observer) {
        std::lock_guard<std::mutex> lock(observersMutex_);
        if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end()) {
            observers_.push_back(observer);
        }
    }

    void ProgressBroadcaster::unsubscribe(ProgressObserver* observer) {
        std::lock_guard<std::mutex> lock(observersMutex_);
        observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
    }

    void ProgressBroadcaster::publish(const ProgressEvent& event) {
        std::vector<ProgressObserver*> snapshot;
        {
            std::lock_guard<std::mutex> lock(observersMutex_);
            snapshot = observers_;
        }

        logMessage(event.message, "progress", LogLevel::DEBUG);
        for (auto* observer : snapshot) {
            {
                // Skip observers that left while earlier ones were being served
                std::lock_guard<std::mutex> lock(observersMutex_);
                if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end()) continue;
            }
            try {
                observer->deliver(event);
            } catch (const std::exception& e) {
                logMessage(std::string("Dropping event for an observer: ") + e.what(), "progress", LogLevel::DEBUG);
            } catch (...) {
                logMessage("Dropping event for an observer: unknown error", "progress", LogLevel::DEBUG);
            }
        }
    }

    void ProgressBroadcaster::publish(const std::string& message, int progress) {
        publish(ProgressEvent::now(message, progress));
    }

    std::size_t ProgressBroadcaster::size() const {
        std::lock_guard<std::mutex> lock(observersMutex_);
        return observers_.size();
    }
}
