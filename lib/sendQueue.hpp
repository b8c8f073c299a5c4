#ifndef RETAGGER_SEND_QUEUE_HPP
#define RETAGGER_SEND_QUEUE_HPP

#include <cstddef>
#include <deque>
#include <string>

namespace Retagger {
    /**
     * Outgoing messages of one channel that allows a single write at a time.
     * front() is the message being written and stays put until pop(). When the
     * queue is full the oldest waiting message is dropped, never the one in flight.
     */
    class SendQueue {
    public:
        static constexpr std::size_t DEFAULT_LIMIT = 64;

        explicit SendQueue(std::size_t limit = DEFAULT_LIMIT);

        // True when the caller has to start writing front().
        bool push(std::string message);
        const std::string& front() const { return inFlight_; }
        // Removes the written front entry; true when another one is waiting.
        bool pop();
        void clear();

        bool empty() const { return !writing_; }
        std::size_t size() const { return (writing_ ? 1 : 0) + waiting_.size(); }
        std::size_t dropped() const { return dropped_; }

    private:
        std::string inFlight_;
        bool writing_ = false;
        std::deque<std::string> waiting_;
        std::size_t limit_;
        std::size_t dropped_ = 0;
    };
}

#endif // RETAGGER_SEND_QUEUE_HPP
