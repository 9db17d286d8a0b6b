// vi:noai:sw=4
// Copyright © 2026 The stdinpoll Authors

#include "stdinpoll/common/reader.hxx"
#include "stdinpoll/support/conv.hxx"
#include "stdinpoll/support/sys.hxx"
#include "stdinpoll/support/exception.hxx"

#include <thread>
#include <memory>
#include <system_error>

#include <unistd.h>
#include <poll.h>

Reader::Reader(Sender<Chunk> sender, const Config & config)
    : _sender(std::move(sender))
    , _fd(fdDuplicate(config.fd))
    , _chunkSize(config.chunkSize)
    , _traceReads(config.traceReads) {
    ASSERT(_chunkSize != 0, );
}

Reader::~Reader() {
    TEMP_FAILURE_RETRY(::close(_fd));
}

void Reader::run() {
    try {
        for (;;) {
            Chunk chunk;

            switch (readChunk(chunk)) {
                case Outcome::DATA:
                    break;
                case Outcome::END_OF_FILE:
                    if (_traceReads) { TRACE("fd " << _fd << ": end-of-file"); }
                    return;
                case Outcome::FAILED:
                    return;
            }

            if (_traceReads) {
                TRACE("fd " << _fd << ": " << humanSize(chunk.size()) << ": "
                      << hexPreview(chunk.data(), chunk.size()));
            }

            if (!_sender.send(std::move(chunk))) {
                // Nobody is listening any more.
                if (_traceReads) { TRACE("fd " << _fd << ": receiver gone"); }
                return;
            }
        }
    }
    catch (const std::exception & ex) {
        ERROR("Reader stopped: " << ex.what());
    }
}

Reader::Outcome Reader::readChunk(Chunk & chunk) {
    chunk.resize(_chunkSize);

    for (;;) {
        auto rval = TEMP_FAILURE_RETRY(::read(_fd, chunk.data(), chunk.size()));

        if (rval == -1) {
            switch (errno) {
                case EAGAIN:
                    // Inherited a non-blocking descriptor. Block in poll()
                    // instead.
                    if (waitReadable()) { continue; }
                    return Outcome::FAILED;
                default:
                    WARNING("read() failed on fd " << _fd << ": " << std::strerror(errno));
                    return Outcome::FAILED;
            }
        }
        else if (rval == 0) {
            return Outcome::END_OF_FILE;
        }
        else {
            chunk.resize(rval);
            return Outcome::DATA;
        }
    }
}

bool Reader::waitReadable() {
    struct pollfd pfd;
    pfd.fd      = _fd;
    pfd.events  = POLLIN;
    pfd.revents = 0;

    if (TEMP_FAILURE_RETRY(::poll(&pfd, 1, -1)) == -1) {
        WARNING("poll() failed on fd " << _fd << ": " << std::strerror(errno));
        return false;
    }

    // POLLHUP/POLLERR: let the next read() report end-of-file or the error.
    return true;
}

//
//
//

Receiver<Chunk> spawnReader(const Config & config) {
    auto channel = makeChannel<Chunk>();

    try {
        auto reader = std::make_unique<Reader>(std::move(channel.first), config);
        std::thread([reader = std::move(reader)]() { reader->run(); }).detach();
    }
    catch (const Exception & ex) {
        WARNING("Reader not started: " << ex.what());
    }
    catch (const std::system_error & ex) {
        WARNING("Reader thread not started: " << ex.what());
    }

    return std::move(channel.second);
}
