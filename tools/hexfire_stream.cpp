#include "hexfire/hexfire.hpp"

#include <csignal>
#include <iostream>
#include <unistd.h>

int main(int argc, char **argv) {
    // A consumer closing the pipe must surface as EPIPE, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    hf::StreamCommand cmd;
    try {
        cmd = hf::ParseStreamOptions(argc, argv);
    } catch (const std::invalid_argument &e) {
        std::cerr << argv[0] << ": " << e.what() << "\n" << hf::StreamUsage(argv[0]);
        return hf::kStreamFatal;
    }
    if (cmd.help) {
        std::cout << hf::StreamUsage(argv[0]);
        return hf::kStreamOk;
    }

    hf::FdSink out(STDOUT_FILENO);
    return hf::RunStreamCommand(cmd, out);
}
