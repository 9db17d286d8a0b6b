// vi:noai:sw=4
// Copyright © 2026 The stdinpoll Authors

#include "stdinpoll/common/config.hxx"
#include "stdinpoll/common/stdin.hxx"
#include "stdinpoll/support/cmdline.hxx"
#include "stdinpoll/support/sys.hxx"
#include "stdinpoll/support/debug.hxx"

namespace {

    std::string makeHelp(const std::string & progName) {
        std::ostringstream ost;
        ost << "stdinpoll-cat " << VERSION << std::endl
            << "Usage: " << progName << " [OPTION]..." << std::endl
            << std::endl
            << "Copy whatever standard input offers within the grace period to" << std::endl
            << "standard output, or the default text if it offers nothing." << std::endl
            << std::endl
            << "Options:" << std::endl
            << "  --help" << std::endl
            << "  --version" << std::endl
            << "  --default=TEXT        (fallback_value)" << std::endl
            << "  --grace-period=MS" << std::endl
            << "  --chunk-size=BYTES" << std::endl
            << "  --[no-]trace-reads" << std::endl;
        return ost.str();
    }

} // namespace

int main(int argc, char * argv[]) try {
    Config config;

    std::string fallback = "fallback_value";

    CmdLine cmdLine(makeHelp(argv[0]), VERSION);
    cmdLine.add(std::make_unique<StringHandler>(fallback), 'd', "default");
    cmdLine.add(std::make_unique<IStreamHandler<uint32_t>>(config.gracePeriod), 'g', "grace-period");
    cmdLine.add(std::make_unique<IStreamHandler<size_t>>(config.chunkSize), '\0', "chunk-size");
    cmdLine.add(std::make_unique<BoolHandler>(config.traceReads), 't', "trace-reads");

    // Command line

    auto arguments = cmdLine.parse(argc, const_cast<const char **>(argv));
    THROW_UNLESS(arguments.empty(), UserError("Unexpected argument: " + arguments.front()));

    config.validate();

    auto input = getInputOrDefault(Chunk(fallback.begin(), fallback.end()), config);

    writeAll(STDOUT_FILENO, input.data(), input.size());

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
