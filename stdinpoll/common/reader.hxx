// vi:noai:sw=4
// Copyright © 2026 The stdinpoll Authors

#ifndef COMMON__READER__HXX
#define COMMON__READER__HXX

#include "stdinpoll/common/config.hxx"
#include "stdinpoll/support/channel.hxx"
#include "stdinpoll/support/pattern.hxx"

#include <vector>
#include <cstdint>

// The bytes one read() returned. No encoding or line structure.
using Chunk = std::vector<uint8_t>;

//
// Blocking read loop, run on its own detached thread. Each read() that
// returns data becomes one Chunk on the channel, in order. End-of-file and
// read errors both end the loop and disconnect the channel. The loop also
// ends after the current read() once the receiver has gone away.
//

class Reader final : private Uncopyable {
    Sender<Chunk> _sender;
    int           _fd;
    size_t        _chunkSize;
    bool          _traceReads;

public:
    // Takes its own duplicate of config.fd.
    Reader(Sender<Chunk> sender, const Config & config);
    ~Reader();

    void run();

private:
    enum class Outcome { DATA, END_OF_FILE, FAILED };

    Outcome readChunk(Chunk & chunk);
    bool    waitReadable();
};

// Start a Reader on a new thread and return its channel. Never throws: if
// the worker can't be started the returned receiver is already
// disconnected.
Receiver<Chunk> spawnReader(const Config & config);

#endif // COMMON__READER__HXX
