#ifndef RETAGGER_PROGRESS_BROADCASTER_HPP
#define RETAGGER_PROGRESS_BROADCASTER_HPP

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace Retagger {
    struct ProgressEvent {
        std::string message;
        int progress = 0;
        double timestamp = 0.0;

        // Stamps the event with the current time, progress is clamped to [0, 100].
        static ProgressEvent now(const std::string& message, int progress);

        std::string toJson() const;
    };

    class ProgressObserver {
    public:
        virtual ~ProgressObserver() = default;

        // May throw when the channel is gone.
        virtual void deliver(const ProgressEvent& event) = 0;
    };

    /**
     * Fans progress events out to the currently subscribed observers.
     * Observers are not owned; an observer unsubscribes itself before it dies.
     * Events reach observers in subscription order.
     * A failing observer never affects the others or the publisher.
     */
    class ProgressBroadcaster {
    public:
        void subscribe(ProgressObserver* observer);
        void unsubscribe(ProgressObserver* observer);

        void publish(const ProgressEvent& event);
        void publish(const std::string& message, int progress);

        std::size_t size() const;

    private:
        mutable std::mutex observersMutex_;
        std::vector<ProgressObserver*> observers_;
    };
}

#endif // RETAGGER_PROGRESS_BROADCASTER_HPP
