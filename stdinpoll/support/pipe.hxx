// vi:noai:sw=4
// Copyright © 2013 David Bryant
// Copyright © 2026 The stdinpoll Authors

#ifndef SUPPORT__PIPE__HXX
#define SUPPORT__PIPE__HXX

#include "stdinpoll/support/pattern.hxx"

class Pipe final : private Uncopyable {
public:
    enum class Mode { BLOCKING, NON_BLOCKING };

    explicit Pipe(Mode mode = Mode::NON_BLOCKING);
    ~Pipe();

    int readFd()  const { return _fds[0]; }
    int writeFd() const { return _fds[1]; }

    // Either end may be closed early, e.g. closing the write end delivers
    // end-of-file to the reader.
    void closeRead();
    void closeWrite();

    // Self-pipe use (NON_BLOCKING only). After raise() the read end polls
    // readable until lower() empties it.
    void raise();
    void lower();

private:
    static void closeFd(int & fd);

    int _fds[2];
};

#endif // SUPPORT__PIPE__HXX
