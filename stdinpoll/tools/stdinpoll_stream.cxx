// vi:noai:sw=4
// Copyright © 2026 The stdinpoll Authors

#include "stdinpoll/common/config.hxx"
#include "stdinpoll/common/stdin.hxx"
#include "stdinpoll/support/cmdline.hxx"
#include "stdinpoll/support/selector.hxx"
#include "stdinpoll/support/sys.hxx"
#include "stdinpoll/support/debug.hxx"

#include <thread>
#include <chrono>

namespace {

    std::string makeHelp(const std::string & progName) {
        std::ostringstream ost;
        ost << "stdinpoll-stream " << VERSION << std::endl
            << "Usage: " << progName << " [OPTION]..." << std::endl
            << std::endl
            << "Copy standard input to standard output chunk by chunk until it" << std::endl
            << "closes. Print the default text if no chunk ever arrived." << std::endl
            << std::endl
            << "Options:" << std::endl
            << "  --help" << std::endl
            << "  --version" << std::endl
            << "  --default=TEXT        (fallback_value)" << std::endl
            << "  --delay=MS            (pause after each chunk)" << std::endl
            << "  --chunk-size=BYTES" << std::endl
            << "  --[no-]trace-reads" << std::endl;
        return ost.str();
    }

    class Copier final : private I_Selector::I_ReadHandler, private Uncopyable {
        I_Selector & _selector;
        InputStream  _stream;
        int          _fd;
        uint32_t     _delay;
        bool         _received = false;
        bool         _finished = false;

    public:
        Copier(I_Selector & selector, InputStream stream, uint32_t delay)
            : _selector(selector)
            , _stream(std::move(stream))
            , _fd(_stream.fd())
            , _delay(delay) {
            _selector.addReadable(_fd, this);
        }

        ~Copier() {
            if (!_finished) { _selector.removeReadable(_fd); }
        }

        bool isFinished() const { return _finished; }
        bool hasReceived() const { return _received; }

    private:
        // I_Selector::I_ReadHandler implementation:

        void handleRead(int UNUSED(fd)) override {
            Chunk chunk;

            for (;;) {
                switch (_stream.tryReceive(chunk)) {
                    case PollStatus::DATA:
                        _received = true;
                        if (_delay != 0) {
                            // Simulate slow processing of each chunk.
                            std::this_thread::sleep_for(std::chrono::milliseconds(_delay));
                        }
                        writeAll(STDOUT_FILENO, chunk.data(), chunk.size());
                        break;
                    case PollStatus::EMPTY:
                        return;
                    case PollStatus::DISCONNECTED:
                        _selector.removeReadable(_fd);
                        _finished = true;
                        return;
                }
            }
        }
    };

} // namespace

int main(int argc, char * argv[]) try {
    Config config;

    std::string fallback = "fallback_value";
    uint32_t    delay    = 0;

    CmdLine cmdLine(makeHelp(argv[0]), VERSION);
    cmdLine.add(std::make_unique<StringHandler>(fallback), 'd', "default");
    cmdLine.add(std::make_unique<IStreamHandler<uint32_t>>(delay), '\0', "delay");
    cmdLine.add(std::make_unique<IStreamHandler<size_t>>(config.chunkSize), '\0', "chunk-size");
    cmdLine.add(std::make_unique<BoolHandler>(config.traceReads), 't', "trace-reads");

    // Command line

    auto arguments = cmdLine.parse(argc, const_cast<const char **>(argv));
    THROW_UNLESS(arguments.empty(), UserError("Unexpected argument: " + arguments.front()));

    config.validate();

    Selector selector;

    Copier copier(selector, spawnInputStream(config), delay);

    do { selector.animate(); } while (!copier.isFinished());

    if (!copier.hasReceived()) {
        writeAll(STDOUT_FILENO, reinterpret_cast<const uint8_t *>(fallback.data()), fallback.size());
    }

    return 0;
}
catch (const UserError & ex) {
    std::cerr << ex.message() << std::endl;
    return 1;
}
catch (const SystemError & ex) {
    std::cerr << ex.what() << std::endl;
    return 1;
}
