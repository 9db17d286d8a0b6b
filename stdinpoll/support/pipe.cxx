// Copyright © 2017 David Bryant
// Copyright © 2026 The stdinpoll Authors

#include "stdinpoll/support/pipe.hxx"
#include "stdinpoll/support/sys.hxx"
#include "stdinpoll/support/exception.hxx"

#include <fcntl.h>
#include <unistd.h>

Pipe::Pipe(Mode mode) {
    auto flags = O_CLOEXEC;
    if (mode == Mode::NON_BLOCKING) { flags |= O_NONBLOCK; }

#ifdef __linux__
    // pipe2() doesn't raise EINTR.
    THROW_IF_SYSCALL_FAILS(::pipe2(_fds, flags), "pipe2()");
#else
    // pipe() doesn't raise EINTR.
    THROW_IF_SYSCALL_FAILS(::pipe(_fds), "pipe()");
    fdCloseExec(_fds[0]);
    fdCloseExec(_fds[1]);
    if (mode == Mode::NON_BLOCKING) {
        fdNonBlock(_fds[0]);
        fdNonBlock(_fds[1]);
    }
#endif
}

Pipe::~Pipe() {
    if (_fds[0] != -1) { TEMP_FAILURE_RETRY(::close(_fds[0])); }
    if (_fds[1] != -1) { TEMP_FAILURE_RETRY(::close(_fds[1])); }
}

void Pipe::closeRead() {
    closeFd(_fds[0]);
}

void Pipe::closeWrite() {
    closeFd(_fds[1]);
}

void Pipe::raise() {
    ASSERT(_fds[1] != -1, << "Write end closed.");

    const char byte = 0;
    auto rval = TEMP_FAILURE_RETRY(::write(_fds[1], &byte, 1));

    if (rval == -1) {
        switch (errno) {
            case EAGAIN:
                // Full, so it is already readable.
                break;
            default:
                THROW_SYSTEM_ERROR(errno, "write()");
        }
    }
}

void Pipe::lower() {
    ASSERT(_fds[0] != -1, << "Read end closed.");

    char buffer[64];

    for (;;) {
        auto rval = TEMP_FAILURE_RETRY(::read(_fds[0], buffer, sizeof buffer));

        if (rval == -1) {
            switch (errno) {
                case EAGAIN:
                    return;
                default:
                    THROW_SYSTEM_ERROR(errno, "read()");
            }
        }
        else if (rval == 0) {
            // Write end closed.
            return;
        }
    }
}

void Pipe::closeFd(int & fd) {
    ASSERT(fd != -1, << "Already closed.");
    THROW_IF_SYSCALL_FAILS(::close(fd), "close()");
    fd = -1;
}
