// vi:noai:sw=4
// Copyright © 2015 David Bryant
// Copyright © 2026 The stdinpoll Authors

#ifndef SUPPORT__QUEUE__HXX
#define SUPPORT__QUEUE__HXX

#include "stdinpoll/support/pattern.hxx"
#include "stdinpoll/support/pipe.hxx"
#include "stdinpoll/support/debug.hxx"

#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <memory>
#include <chrono>
#include <ostream>

// Outcome of polling the consumer end.
enum class PollStatus {
    DATA,           // an item was removed
    EMPTY,          // producer alive, nothing buffered (or deadline passed)
    DISCONNECTED    // producer finalised and everything drained; permanent
};

inline std::ostream & operator<<(std::ostream & ost, PollStatus status) {
    switch (status) {
        case PollStatus::DATA:
            return ost << "data";
        case PollStatus::EMPTY:
            return ost << "empty";
        case PollStatus::DISCONNECTED:
            return ost << "disconnected";
    }

    return ost << "<bad-status>";
}

// Unbounded, ordered hand-off between one producer thread and one consumer
// thread. The producer finalises when it has nothing more to add; the
// consumer closes when it no longer wants anything.
template <typename T>
class Queue : private Uncopyable {
public:
    using Status = PollStatus;

    // These functions are called by the producer:

    // Returns false, and discards t, if the consumer has closed.
    bool add(T && t) {
        std::unique_lock<std::mutex> lock(_mutex);
        ASSERT(!_finalised, << "Add after finalised.");
        if (_closed) {
            return false;
        }
        _queue.push(std::move(t));
        if (_ready) { _ready->raise(); }
        _condition.notify_one();
        return true;
    }

    void finalise() {
        std::unique_lock<std::mutex> lock(_mutex);
        if (!_finalised) {
            _finalised = true;
            if (_ready) { _ready->raise(); }
            _condition.notify_all();
        }
    }

    bool isClosed() const {
        std::unique_lock<std::mutex> lock(_mutex);
        return _closed;
    }

    // These functions are called by the consumer:

    // Blocks. Empty once finalised and drained.
    std::optional<T> remove() {
        std::unique_lock<std::mutex> lock(_mutex);
        _condition.wait(lock, [this]() { return _finalised || !_queue.empty(); });

        T t;
        if (take(t) == Status::DATA) {
            return t;
        }
        else {
            return std::nullopt;
        }
    }

    // Never blocks on the producer beyond the queue's own lock.
    Status tryRemove(T & t) {
        std::unique_lock<std::mutex> lock(_mutex);
        return take(t);
    }

    // EMPTY means the deadline passed first.
    template <typename Clock, typename Duration>
    Status removeUntil(T & t, const std::chrono::time_point<Clock, Duration> & deadline) {
        std::unique_lock<std::mutex> lock(_mutex);
        _condition.wait_until(lock, deadline, [this]() { return _finalised || !_queue.empty(); });
        return take(t);
    }

    void close() {
        std::unique_lock<std::mutex> lock(_mutex);
        _closed = true;
        std::queue<T>().swap(_queue);
    }

    // A descriptor that polls readable exactly while tryRemove() would not
    // return EMPTY.
    int readyFd() {
        std::unique_lock<std::mutex> lock(_mutex);
        if (!_ready) {
            _ready = std::make_unique<Pipe>(Pipe::Mode::NON_BLOCKING);
            updateReady();
        }
        return _ready->readFd();
    }

private:
    // Lock must be held.
    Status take(T & t) {
        if (_queue.empty()) {
            return _finalised ? Status::DISCONNECTED : Status::EMPTY;
        }

        t = std::move(_queue.front());
        _queue.pop();
        if (_ready && _queue.empty() && !_finalised) { _ready->lower(); }
        return Status::DATA;
    }

    // Lock must be held.
    void updateReady() {
        if (!_ready) {
            return;
        }

        if (_finalised || !_queue.empty()) {
            _ready->raise();
        }
        else {
            _ready->lower();
        }
    }

    std::queue<T>           _queue;
    mutable std::mutex      _mutex;
    std::condition_variable _condition;
    bool                    _finalised = false;
    bool                    _closed    = false;
    std::unique_ptr<Pipe>   _ready;
};

#endif // SUPPORT__QUEUE__HXX
