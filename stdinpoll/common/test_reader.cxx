// vi:noai:sw=4
// Copyright © 2026 The stdinpoll Authors

#include "stdinpoll/common/reader.hxx"
#include "stdinpoll/support/pipe.hxx"
#include "stdinpoll/support/sys.hxx"
#include "stdinpoll/support/test.hxx"

#include <thread>
#include <chrono>

#include <signal.h>
#include <unistd.h>

namespace {

Chunk bytes(const std::string & str) {
    return Chunk(str.begin(), str.end());
}

std::string text(const Chunk & chunk) {
    return std::string(chunk.begin(), chunk.end());
}

// Blocks until disconnected.
std::vector<Chunk> drain(Receiver<Chunk> & receiver) {
    std::vector<Chunk> chunks;
    while (auto chunk = receiver.receive()) {
        chunks.push_back(std::move(*chunk));
    }
    return chunks;
}

Chunk concatenate(const std::vector<Chunk> & chunks) {
    Chunk all;
    for (auto & c : chunks) { all.insert(all.end(), c.begin(), c.end()); }
    return all;
}

void testEmpty(Test & test) {
    Pipe pipe(Pipe::Mode::BLOCKING);
    Config config;
    config.fd = pipe.readFd();

    auto receiver = spawnReader(config);
    pipe.closeWrite();

    test.enforce(drain(receiver).empty(), "no chunks from an empty pipe");

    Chunk chunk;
    test.enforceEqual(receiver.tryReceive(chunk), PollStatus::DISCONNECTED, "disconnected");
}

void testBinaryInOrder(Test & test) {
    Pipe pipe(Pipe::Mode::BLOCKING);
    Config config;
    config.fd = pipe.readFd();

    Chunk input;
    for (int i = 0; i != 3 * 256; ++i) { input.push_back(static_cast<uint8_t>(i * 7)); }
    input.push_back(0x00);
    input.push_back(0xC3);      // truncated UTF-8 sequence
    input.push_back(0xFF);

    auto receiver = spawnReader(config);

    std::thread writer([&]() {
        size_t offset = 0;
        while (offset != input.size()) {
            auto size = std::min<size_t>(100, input.size() - offset);
            writeAll(pipe.writeFd(), input.data() + offset, size);
            offset += size;
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        pipe.closeWrite();
    });

    auto chunks = drain(receiver);
    writer.join();

    test.enforce(!chunks.empty(), "some chunks");
    test.enforce(concatenate(chunks) == input, "concatenation reproduces the input");
}

void testChunkSize(Test & test) {
    Pipe pipe(Pipe::Mode::BLOCKING);
    Config config;
    config.fd        = pipe.readFd();
    config.chunkSize = 4;

    auto input = bytes("abcdefghij");
    writeAll(pipe.writeFd(), input.data(), input.size());
    pipe.closeWrite();

    auto receiver = spawnReader(config);
    auto chunks   = drain(receiver);

    bool bounded = true;
    for (auto & c : chunks) {
        if (c.empty() || c.size() > 4) { bounded = false; }
    }
    test.enforce(bounded, "every chunk between 1 and 4 bytes");
    test.enforceEqual(chunks.size(), static_cast<size_t>(3), "4 + 4 + 2");
    test.enforceEqual(text(concatenate(chunks)), std::string("abcdefghij"), "all bytes");
}

void testNonBlockingDescriptor(Test & test) {
    Pipe pipe(Pipe::Mode::NON_BLOCKING);
    Config config;
    config.fd = pipe.readFd();

    auto receiver = spawnReader(config);

    // Give the reader time to find the pipe empty.
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    auto input = bytes("late");
    writeAll(pipe.writeFd(), input.data(), input.size());
    pipe.closeWrite();

    test.enforceEqual(text(concatenate(drain(receiver))), std::string("late"),
                      "data after EAGAIN still arrives");
}

void testCallerClosesDescriptor(Test & test) {
    Pipe pipe(Pipe::Mode::BLOCKING);
    Config config;
    config.fd = pipe.readFd();

    auto receiver = spawnReader(config);
    pipe.closeRead();

    auto input = bytes("still here");
    writeAll(pipe.writeFd(), input.data(), input.size());
    pipe.closeWrite();

    test.enforceEqual(text(concatenate(drain(receiver))), std::string("still here"),
                      "reader owns its own descriptor");
}

void testStopsWhenReceiverGone(Test & test) {
    Pipe pipe(Pipe::Mode::BLOCKING);
    Config config;
    config.fd = pipe.readFd();

    {
        auto receiver = spawnReader(config);
    }
    pipe.closeRead();

    // Each write wakes the reader; the first one it reads finds nobody
    // listening, so it exits and closes the last read end.
    bool stopped = false;
    const uint8_t byte = 'x';

    for (int i = 0; i != 500 && !stopped; ++i) {
        if (::write(pipe.writeFd(), &byte, 1) == -1 && errno == EPIPE) {
            stopped = true;
        }
        else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    test.enforce(stopped, "reader exited after the receiver went away");
}

void testBadDescriptor(Test & test) {
    Config config;
    config.fd = -1;

    auto receiver = spawnReader(config);

    Chunk chunk;
    test.enforceEqual(receiver.tryReceive(chunk), PollStatus::DISCONNECTED,
                      "disconnected straight away");
}

} // namespace {anonymous}

int main() {
    // Writes to a pipe without readers must fail, not kill us.
    ::signal(SIGPIPE, SIG_IGN);

    Test test("common/reader");

    test.run("empty", &testEmpty);
    test.run("binary-in-order", &testBinaryInOrder);
    test.run("chunk-size", &testChunkSize);
    test.run("non-blocking-descriptor", &testNonBlockingDescriptor);
    test.run("caller-closes-descriptor", &testCallerClosesDescriptor);
    test.run("stops-when-receiver-gone", &testStopsWhenReceiverGone);
    test.run("bad-descriptor", &testBadDescriptor);

    return 0;
}
