// vi:noai:sw=4
// Copyright © 2013 David Bryant
// Copyright © 2026 The stdinpoll Authors

#ifndef SUPPORT__PATTERN__HXX
#define SUPPORT__PATTERN__HXX

#include "stdinpoll/support/debug.hxx"

#include <utility>
#include <functional>

// Inherit from this to be uncopyable (and unassignable).
class Uncopyable {
public:
    Uncopyable(const Uncopyable &) noexcept = delete;
    Uncopyable & operator=(const Uncopyable &) noexcept = delete;

protected:
    Uncopyable() noexcept  = default;
    ~Uncopyable() noexcept = default;
};

//
// http://channel9.msdn.com/Shows/Going+Deep/C-and-Beyond-2012-Andrei-Alexandrescu-Systematic-Error-Handling-in-C
//
// Example usage:
//
//   int fd = THROW_IF_SYSCALL_FAILS(::fcntl(source, F_DUPFD_CLOEXEC, 0), "fcntl()");
//   ScopeGuard guard([fd]() { TEMP_FAILURE_RETRY(::close(fd)); });
//   ... things that may throw ...
//   guard.dismiss();    // fd now has another owner
//

class ScopeGuard final : private Uncopyable {
    using Function = std::function<void()>;

    Function _function;

public:
    explicit ScopeGuard(Function function) : _function(std::move(function)) { ASSERT(_function, ); }

    ScopeGuard(ScopeGuard && scope_guard) noexcept
        : _function(std::exchange(scope_guard._function, nullptr)) {}

    ~ScopeGuard() {
        if (_function) { _function(); }
    }

    // Prevent the guard from executing when it is destroyed.
    void dismiss() { _function = nullptr; }
};

#endif // SUPPORT__PATTERN__HXX
