// vi:noai:sw=4
// Copyright © 2013 David Bryant
// Copyright © 2026 The stdinpoll Authors

#ifndef SUPPORT__SELECTOR__HXX
#define SUPPORT__SELECTOR__HXX

#include "stdinpoll/support/debug.hxx"
#include "stdinpoll/support/exception.hxx"
#include "stdinpoll/support/pattern.hxx"

#include <map>

#include <unistd.h>
#include <sys/epoll.h>

class I_Selector {
public:
    class I_ReadHandler {
    public:
        virtual void handleRead(int fd) = 0;

    protected:
        ~I_ReadHandler() = default;
    };

    virtual void addReadable(int fd, I_ReadHandler * handler) = 0;
    virtual void removeReadable(int fd) = 0;

protected:
    ~I_Selector() = default;
};

//
//
//

class EPollSelector final : public I_Selector, private Uncopyable {
    int                            _fd;
    std::map<int, I_ReadHandler *> _readRegs;

public:
    EPollSelector() {
        _fd = THROW_IF_SYSCALL_FAILS(::epoll_create1(EPOLL_CLOEXEC), "epoll_create1()");
    }

    ~EPollSelector() {
        TEMP_FAILURE_RETRY(::close(_fd));
    }

    // Wait for, then dispatch, at least one event. milliseconds < 0 waits
    // indefinitely. Returns false if the wait timed out.
    bool animate(int milliseconds = -1) {
        ASSERT(!_readRegs.empty(), << "Nothing to wait for.");

        const int MAX_EVENTS = 8;
        struct epoll_event event_array[MAX_EVENTS];

        int n = THROW_IF_SYSCALL_FAILS(::epoll_wait(_fd, event_array, MAX_EVENTS, milliseconds),
                                       "epoll_wait()");

        for (auto i = 0; i != n; ++i) {
            auto & event = event_array[i];

            auto fd     = event.data.fd;
            auto events = event.events;

            if (events & EPOLLERR) {
                ERROR("Error on fd: " << fd);
            }

            if (events & (EPOLLHUP | EPOLLIN)) {
                // A handler may have deregistered fd while dispatching an
                // earlier event in this batch.
                auto iter = _readRegs.find(fd);
                if (iter != _readRegs.end()) {
                    iter->second->handleRead(fd);
                }
            }
        }

        return n != 0;
    }

    // I_Selector implementation:

    void addReadable(int fd, I_ReadHandler * handler) override {
        ASSERT(_readRegs.find(fd) == _readRegs.end(), << "Already registered: " << fd);

        struct epoll_event event;
        std::memset(&event, 0, sizeof event);
        event.events  = EPOLLIN;
        event.data.fd = fd;
        THROW_IF_SYSCALL_FAILS(::epoll_ctl(_fd, EPOLL_CTL_ADD, fd, &event), "epoll_ctl()");

        _readRegs.insert({fd, handler});
    }

    void removeReadable(int fd) override {
        auto iter = _readRegs.find(fd);
        ASSERT(iter != _readRegs.end(), << "Not registered: " << fd);

        THROW_IF_SYSCALL_FAILS(::epoll_ctl(_fd, EPOLL_CTL_DEL, fd, nullptr), "epoll_ctl()");

        _readRegs.erase(iter);
    }
};

using Selector = EPollSelector;

#endif // SUPPORT__SELECTOR__HXX
