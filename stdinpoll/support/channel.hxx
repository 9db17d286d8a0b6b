// vi:noai:sw=4
// Copyright © 2026 The stdinpoll Authors

#ifndef SUPPORT__CHANNEL__HXX
#define SUPPORT__CHANNEL__HXX

#include "stdinpoll/support/queue.hxx"

#include <memory>
#include <utility>
#include <chrono>

//
// Move-only endpoints around a shared Queue. Destroying the Sender
// disconnects the channel once it has been drained; destroying the Receiver
// makes further sends no-ops.
//

template <typename T>
class Sender final {
    std::shared_ptr<Queue<T>> _queue;

public:
    explicit Sender(std::shared_ptr<Queue<T>> queue) : _queue(std::move(queue)) {}

    Sender(Sender && other) noexcept = default;

    Sender & operator=(Sender && other) {
        if (this != &other) {
            release();
            _queue = std::move(other._queue);
        }
        return *this;
    }

    ~Sender() { release(); }

    // False once the receiver has gone away; t is dropped.
    bool send(T t) {
        ASSERT(_queue, << "Send on moved-from sender.");
        return _queue->add(std::move(t));
    }

    bool isConnected() const { return _queue && !_queue->isClosed(); }

private:
    void release() {
        if (_queue) {
            _queue->finalise();
            _queue.reset();
        }
    }
};

template <typename T>
class Receiver final {
    std::shared_ptr<Queue<T>> _queue;

public:
    using Status = typename Queue<T>::Status;

    explicit Receiver(std::shared_ptr<Queue<T>> queue) : _queue(std::move(queue)) {}

    Receiver(Receiver && other) noexcept = default;

    Receiver & operator=(Receiver && other) {
        if (this != &other) {
            release();
            _queue = std::move(other._queue);
        }
        return *this;
    }

    ~Receiver() { release(); }

    // Non-blocking poll. DISCONNECTED is permanent.
    Status tryReceive(T & t) {
        if (!_queue) { return Status::DISCONNECTED; }
        return _queue->tryRemove(t);
    }

    // Blocks until data arrives or the channel disconnects.
    std::optional<T> receive() {
        if (!_queue) { return std::nullopt; }
        return _queue->remove();
    }

    template <typename Clock, typename Duration>
    Status receiveUntil(T & t, const std::chrono::time_point<Clock, Duration> & deadline) {
        if (!_queue) { return Status::DISCONNECTED; }
        return _queue->removeUntil(t, deadline);
    }

    template <typename Rep, typename Period>
    Status receiveFor(T & t, const std::chrono::duration<Rep, Period> & timeout) {
        return receiveUntil(t, std::chrono::steady_clock::now() + timeout);
    }

    // Readable while tryReceive() would return DATA or DISCONNECTED, for
    // registering with a Selector. Owned by the channel.
    int fd() {
        ASSERT(_queue, << "fd() on moved-from receiver.");
        return _queue->readyFd();
    }

private:
    void release() {
        if (_queue) {
            _queue->close();
            _queue.reset();
        }
    }
};

template <typename T>
std::pair<Sender<T>, Receiver<T>> makeChannel() {
    auto queue = std::make_shared<Queue<T>>();
    return {Sender<T>(queue), Receiver<T>(queue)};
}

#endif // SUPPORT__CHANNEL__HXX
