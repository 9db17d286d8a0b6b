// vi:noai:sw=4
// Copyright © 2013 David Bryant
// Copyright © 2026 The stdinpoll Authors

#include "stdinpoll/support/sys.hxx"
#include "stdinpoll/support/debug.hxx"
#include "stdinpoll/support/exception.hxx"

#include <unistd.h>
#include <fcntl.h>

// Set FD_CLOEXEC
void fdCloseExec(int fd) {
    ASSERT(fd != -1, );
    int flags = THROW_IF_SYSCALL_FAILS(::fcntl(fd, F_GETFD), "fcntl()");
    flags |= FD_CLOEXEC;
    THROW_IF_SYSCALL_FAILS(::fcntl(fd, F_SETFD, flags), "fcntl()");
}

// Set O_NONBLOCK
void fdNonBlock(int fd) {
    ASSERT(fd != -1, );
    int flags;
    THROW_IF_SYSCALL_FAILS((flags = ::fcntl(fd, F_GETFL)), "fcntl()");
    flags |= O_NONBLOCK;
    THROW_IF_SYSCALL_FAILS(::fcntl(fd, F_SETFL, flags), "fcntl()");
}

bool fdIsTerminal(int fd) noexcept {
    // isatty() reports ENOTTY for pipes and files, EBADF for a closed
    // descriptor. Neither is a terminal.
    return ::isatty(fd) == 1;
}

int fdDuplicate(int fd) {
    return THROW_IF_SYSCALL_FAILS(::fcntl(fd, F_DUPFD_CLOEXEC, 0), "fcntl(F_DUPFD_CLOEXEC)");
}

void writeAll(int fd, const uint8_t * data, size_t size) {
    while (size != 0) {
        auto rval = THROW_IF_SYSCALL_FAILS(::write(fd, static_cast<const void *>(data), size),
                                           "write()");
        if (rval == 0) {
            FATAL(<< "Zero length write");
        }

        data += rval;
        size -= rval;
    }
}
