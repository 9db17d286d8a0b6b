// vi:noai:sw=4
// Copyright © 2026 The stdinpoll Authors

#ifndef COMMON__STDIN__HXX
#define COMMON__STDIN__HXX

#include "stdinpoll/common/config.hxx"
#include "stdinpoll/common/input_mode.hxx"
#include "stdinpoll/common/reader.hxx"
#include "stdinpoll/support/channel.hxx"

#include <optional>
#include <string>

// Consumer end of a stream of Chunks read from standard input.
//
//   auto stream = spawnInputStream();
//   Chunk chunk;
//   for (;;) {
//       switch (stream.tryReceive(chunk)) {
//           case PollStatus::DATA:          use(chunk); break;
//           case PollStatus::EMPTY:         doOtherWork(); break;
//           case PollStatus::DISCONNECTED:  return;
//       }
//   }
using InputStream = Receiver<Chunk>;

// Everything that arrives on config.fd within config.gracePeriod (or up
// to end-of-file, if sooner). If that is nothing, or the input is a
// terminal, the fallback (or nothing) instead. A terminal costs no wait
// and no thread.
Chunk getInputOrDefault(const std::optional<Chunk> & fallback = std::nullopt,
                        const Config & config = Config());

// Binary-safe convenience for text callers.
std::string getInputOrDefault(const std::string & fallback,
                              const Config & config = Config());

// Returns immediately. For a terminal the stream is already disconnected
// and no thread is started.
InputStream spawnInputStream(const Config & config = Config());

#endif // COMMON__STDIN__HXX
