// vi:noai:sw=4
// Copyright © 2026 The stdinpoll Authors

#ifndef COMMON__CONFIG__HXX
#define COMMON__CONFIG__HXX

#include <string>
#include <cstddef>
#include <cstdint>

#include <unistd.h>

struct Config {
    int      fd          = STDIN_FILENO;   // what the facades read
    size_t   chunkSize   = 4096;           // upper bound on bytes per read()
    uint32_t gracePeriod = 100;            // milliseconds, one-shot only
    // Debugging support:
    bool     traceReads  = false;

    // Throws UserError if a setting is out of range.
    void validate() const;
};

#endif // COMMON__CONFIG__HXX
