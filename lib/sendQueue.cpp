#include "sendQueue.hpp"

#include <algorithm>
#include <utility>

namespace Retagger {
    SendQueue::SendQueue(std::size_t limit) : limit_(std::max<std::size_t>(limit, 2)) {}

    bool SendQueue::push(std::string message) {
        if (!writing_) {
            inFlight_ = std::move(message);
            writing_ = true;
            return true;
        }
        if (waiting_.size() + 1 >= limit_) {
            waiting_.pop_front();
            ++dropped_;
        }
        waiting_.push_back(std::move(message));
        return false;
    }

    bool SendQueue::pop() {
        if (waiting_.empty()) {
            inFlight_.clear();
            writing_ = false;
            return false;
        }
        inFlight_ = std::move(waiting_.front());
        waiting_.pop_front();
        return true;
    }

    void SendQueue::clear() {
        inFlight_.clear();
        waiting_.clear();
        writing_ = false;
    }
}
