#pragma once

#include "hexfire/emitter.hpp"
#include "hexfire/options.hpp"

namespace hexfire {

    // Process exit codes of the two tools.
    inline constexpr int kStreamOk = 0;
    inline constexpr int kStreamFatal = 1;

    inline constexpr int kValidatePassed = 0;
    inline constexpr int kValidateFailed = 1;
    inline constexpr int kValidateFatal = 2;

    // Runs a parsed stream command into sink. A closed sink still counts as success.
    int RunStreamCommand(const StreamCommand &cmd, NdjsonSink &sink);

    // Runs a parsed validate command and logs the verdict.
    int RunValidateCommand(const ValidateCommand &cmd);

} // namespace hexfire
