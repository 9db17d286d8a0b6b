// vi:noai:sw=4
// Copyright © 2026 The stdinpoll Authors

#include "stdinpoll/common/stdin.hxx"
#include "stdinpoll/support/time.hxx"
#include "stdinpoll/support/debug.hxx"

Chunk getInputOrDefault(const std::optional<Chunk> & fallback, const Config & config) {
    config.validate();

    if (isInteractive(config.fd)) {
        return fallback.value_or(Chunk());
    }

    Timer  grace(config.gracePeriod);
    auto   stream = spawnReader(config);
    Chunk  input;
    Chunk  chunk;

    for (;;) {
        auto status = stream.receiveUntil(chunk, grace.deadline());

        if (status == PollStatus::DATA) {
            input.insert(input.end(), chunk.begin(), chunk.end());
        }
        else {
            // EMPTY: the grace period is over. DISCONNECTED: nothing more
            // will come.
            if (config.traceReads) {
                TRACE("one-shot: " << status << " after " << input.size() << " bytes");
            }
            break;
        }
    }

    // Dropping the stream tells the reader to stop after its current read.

    if (input.empty()) {
        return fallback.value_or(Chunk());
    }
    else {
        return input;
    }
}

std::string getInputOrDefault(const std::string & fallback, const Config & config) {
    auto input = getInputOrDefault(Chunk(fallback.begin(), fallback.end()), config);
    return std::string(input.begin(), input.end());
}

InputStream spawnInputStream(const Config & config) {
    config.validate();

    if (isInteractive(config.fd)) {
        // The sender dies with the pair, leaving the receiver disconnected.
        return std::move(makeChannel<Chunk>().second);
    }

    return spawnReader(config);
}
