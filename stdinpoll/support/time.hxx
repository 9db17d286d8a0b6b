// vi:noai:sw=4
// Copyright © 2013 David Bryant
// Copyright © 2026 The stdinpoll Authors

#ifndef SUPPORT__TIME__HXX
#define SUPPORT__TIME__HXX

#include <chrono>
#include <cstdint>

//
// A timer that expires.
//

class Timer {
public:
    using Clock = std::chrono::steady_clock;

private:
    Clock::time_point _endTime;

public:
    explicit Timer(uint32_t milliseconds)
        : _endTime(Clock::now() + std::chrono::milliseconds(milliseconds)) {}

    Clock::time_point deadline() const { return _endTime; }
};

#endif // SUPPORT__TIME__HXX
