// vi:noai:sw=4
// Copyright © 2026 The stdinpoll Authors

#include "stdinpoll/common/input_mode.hxx"
#include "stdinpoll/support/sys.hxx"

#include <ostream>

std::ostream & operator<<(std::ostream & ost, InputMode mode) {
    switch (mode) {
        case InputMode::INTERACTIVE:
            return ost << "interactive";
        case InputMode::PIPED:
            return ost << "piped";
    }

    return ost << "<bad-mode>";
}

InputMode detectInputMode(int fd) noexcept {
    return fdIsTerminal(fd) ? InputMode::INTERACTIVE : InputMode::PIPED;
}
