// vi:noai:sw=4
// Copyright © 2013 David Bryant
// Copyright © 2026 The stdinpoll Authors

#ifndef SUPPORT__SYS__HXX
#define SUPPORT__SYS__HXX

#include <cstddef>
#include <cstdint>

// Set FD_CLOEXEC
void fdCloseExec(int fd);

// Set O_NONBLOCK
void fdNonBlock(int fd);

// Is the descriptor attached to a terminal? Any failure to find out,
// including a closed descriptor, answers false.
bool fdIsTerminal(int fd) noexcept;

// Duplicate a descriptor with FD_CLOEXEC set on the copy.
int fdDuplicate(int fd);

// Write the whole buffer to a blocking descriptor.
void writeAll(int fd, const uint8_t * data, size_t size);

#endif // SUPPORT__SYS__HXX
