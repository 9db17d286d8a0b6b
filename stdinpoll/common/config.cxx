// vi:noai:sw=4
// Copyright © 2026 The stdinpoll Authors

#include "stdinpoll/common/config.hxx"
#include "stdinpoll/support/conv.hxx"
#include "stdinpoll/support/exception.hxx"

namespace {

    // Size of the buffer a single read() fills.
    constexpr size_t MAX_CHUNK_SIZE = 16 * 1024 * 1024;

} // namespace

void Config::validate() const {
    THROW_UNLESS(fd >= 0, UserError("Bad descriptor: " + stringify(fd)));
    THROW_UNLESS(chunkSize != 0, UserError("Chunk size must be positive"));
    THROW_UNLESS(chunkSize <= MAX_CHUNK_SIZE,
                 UserError("Chunk size too large: " + humanSize(chunkSize) +
                           " (max " + humanSize(MAX_CHUNK_SIZE) + ")"));
}
