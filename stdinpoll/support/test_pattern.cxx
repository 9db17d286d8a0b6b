#include "stdinpoll/support/pattern.hxx"
#include "stdinpoll/support/pipe.hxx"
#include "stdinpoll/support/test.hxx"

#include <fcntl.h>
#include <unistd.h>

namespace {

bool isOpen(int fd) {
    return ::fcntl(fd, F_GETFD) != -1;
}

void testGuardRuns(Test & test) {
    int count = 0;
    {
        ScopeGuard guard([&count]() { ++count; });
    }
    test.enforceEqual(count, 1, "ran once on scope exit");
}

void testGuardDismissed(Test & test) {
    int count = 0;
    {
        ScopeGuard guard([&count]() { ++count; });
        guard.dismiss();
    }
    test.enforceEqual(count, 0, "dismissed guard does nothing");
}

void testGuardMoved(Test & test) {
    int count = 0;
    {
        ScopeGuard guard1([&count]() { ++count; });
        ScopeGuard guard2(std::move(guard1));
    }
    test.enforceEqual(count, 1, "ran once after move");
}

void testPipeEnds(Test & test) {
    int readFd, writeFd;
    {
        Pipe pipe(Pipe::Mode::BLOCKING);
        readFd  = pipe.readFd();
        writeFd = pipe.writeFd();
        test.enforce(isOpen(readFd) && isOpen(writeFd), "both ends open");
        test.enforce(!(::fcntl(readFd, F_GETFL) & O_NONBLOCK), "blocking read end");

        pipe.closeWrite();
        test.enforce(!isOpen(writeFd), "write end closed early");
        test.enforceEqual(pipe.writeFd(), -1, "write end forgotten");
    }
    test.enforce(!isOpen(readFd), "read end closed with the pipe");
}

void testPipeRaiseLower(Test & test) {
    Pipe pipe;
    test.enforce(::fcntl(pipe.readFd(), F_GETFL) & O_NONBLOCK, "non-blocking read end");

    pipe.lower();
    pipe.raise();
    pipe.raise();

    char byte;
    test.enforce(::read(pipe.readFd(), &byte, 1) == 1, "raised");
    pipe.lower();
    test.enforce(::read(pipe.readFd(), &byte, 1) == -1 && errno == EAGAIN, "lowered");
}

struct Intercepted {};

void throwIntercepted() { throw Intercepted(); }

void testEnforceIntercepted(Test & test) {
    auto old = setTerminate(&throwIntercepted);
    test.enforce(getTerminate() == &throwIntercepted, "handler installed");

    bool intercepted = false;
    try {
        ENFORCE(1 + 1 == 3, << "expected failure, ignore");
    }
    catch (const Intercepted &) {
        intercepted = true;
    }

    setTerminate(old);
    test.enforce(intercepted, "ENFORCE reached the handler");
}

} // namespace {anonymous}

int main() {
    Test test("support/pattern");

    test.run("guard-runs", &testGuardRuns);
    test.run("guard-dismissed", &testGuardDismissed);
    test.run("guard-moved", &testGuardMoved);
    test.run("pipe-ends", &testPipeEnds);
    test.run("pipe-raise-lower", &testPipeRaiseLower);
    test.run("enforce-intercepted", &testEnforceIntercepted);

    return 0;
}
