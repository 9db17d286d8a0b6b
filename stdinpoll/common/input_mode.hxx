// vi:noai:sw=4
// Copyright © 2026 The stdinpoll Authors

#ifndef COMMON__INPUT_MODE__HXX
#define COMMON__INPUT_MODE__HXX

#include <iosfwd>

#include <unistd.h>

// INTERACTIVE: a terminal; nothing should be waited for.
// PIPED: a pipe, file or other redirect; blocking reads are meaningful.
enum class InputMode { INTERACTIVE, PIPED };

std::ostream & operator<<(std::ostream & ost, InputMode mode);

// Queried afresh on every call; descriptor attachment may change between
// calls (test harnesses, supervisors). Never fails: if the question can't
// be answered the input is PIPED.
InputMode detectInputMode(int fd = STDIN_FILENO) noexcept;

inline bool isInteractive(int fd = STDIN_FILENO) noexcept {
    return detectInputMode(fd) == InputMode::INTERACTIVE;
}

#endif // COMMON__INPUT_MODE__HXX
