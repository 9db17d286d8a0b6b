// vi:noai:sw=4
// Copyright © 2013 David Bryant
// Copyright © 2026 The stdinpoll Authors

#include "stdinpoll/support/debug.hxx"

#include <cstdlib>
#include <mutex>

namespace {

    void defaultTerminate() { std::terminate(); }

    TerminateHandler terminateHandler = &defaultTerminate;

    std::mutex emitMutex;

} // namespace

void terminate() {
    terminateHandler();
    // If we get here then just abort. The terminate handler can use an
    // exception to unwind through this function, if it really wants to.
    std::abort();
}

TerminateHandler setTerminate(TerminateHandler f) noexcept {
    auto oldHandler  = terminateHandler;
    terminateHandler = f;
    return oldHandler;
}

TerminateHandler getTerminate() noexcept {
    return terminateHandler;
}

void debugEmit(std::ostream & ost, const char * file, int line, const std::string & text) {
    std::ostringstream sst;
    sst << file << ":" << line << " " << text << '\n';

    std::lock_guard<std::mutex> lock(emitMutex);
    ost << sst.str() << std::flush;
}
