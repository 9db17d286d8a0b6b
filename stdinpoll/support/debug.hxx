// vi:noai:sw=4
// Copyright © 2013 David Bryant
// Copyright © 2026 The stdinpoll Authors

#ifndef SUPPORT__DEBUG__HXX
#define SUPPORT__DEBUG__HXX

#include <iostream>
#include <sstream>
#include <string>
#include <cstring>
#include <cerrno>

using TerminateHandler = void (*)();

[[noreturn]] void terminate();
TerminateHandler  setTerminate(TerminateHandler f) noexcept;
TerminateHandler  getTerminate() noexcept;

// Write one complete line. Lines from the reader thread and the caller's
// thread never interleave.
void debugEmit(std::ostream & ost, const char * file, int line, const std::string & text);

#define LIKELY(x) __builtin_expect(!!(x), 1)
#define UNLIKELY(x) __builtin_expect(!!(x), 0)

#define UNUSED(x) UNUSED_##x __attribute__((unused))

// BSD doesn't have EINTR
#ifndef __linux__
#define TEMP_FAILURE_RETRY(a) (a)
#endif

struct DebugDummyInserter {};
inline std::ostream & operator<<(std::ostream & ost, const DebugDummyInserter &) {
    return ost;
}

#define DEBUG_EMIT(stream, output)                                       \
    do {                                                                 \
        std::ostringstream ost_DEBUG;                                    \
        ost_DEBUG << DebugDummyInserter() output;                        \
        debugEmit(stream, __FILE__, __LINE__, ost_DEBUG.str());          \
    } while (false)

#define WARNING(output) DEBUG_EMIT(std::cerr, << output)
#define ERROR(output)   DEBUG_EMIT(std::cerr, << output)
#define TRACE(output)   DEBUG_EMIT(std::cerr, << output)

#define FATAL(output)                   \
    do {                                \
        DEBUG_EMIT(std::cerr, output);  \
        terminate();                    \
    } while (false)

// ENFORCE never gets compiled out
#define ENFORCE(condition, output)                                           \
    do {                                                                     \
        if (!LIKELY(condition)) {                                            \
            DEBUG_EMIT(std::cerr, output << "  ((" #condition "))");         \
            terminate();                                                     \
        }                                                                    \
    } while (false)

// ASSERT may be compiled out
#if DEBUG
#define ASSERT(condition, output) ENFORCE(condition, output)
#else
#define ASSERT(condition, output) \
    do {                          \
    } while (false)
#endif

#endif // SUPPORT__DEBUG__HXX
