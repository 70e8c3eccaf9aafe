#include "hexfire/hexfire.hpp"

#include <iostream>

int main(int argc, char **argv) {
    hf::ValidateCommand cmd;
    try {
        cmd = hf::ParseValidateOptions(argc, argv);
    } catch (const std::invalid_argument &e) {
        std::cerr << argv[0] << ": " << e.what() << "\n" << hf::ValidateUsage(argv[0]);
        return hf::kValidateFatal;
    }
    if (cmd.help) {
        std::cout << hf::ValidateUsage(argv[0]);
        return hf::kValidatePassed;
    }
    return hf::RunValidateCommand(cmd);
}
