#pragma once

#include "hexfire/pipeline.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hexfire {

    struct StreamCommand {
        StreamOptions options;
        std::string log_level = "info";
        bool help = false;
    };

    struct ValidateCommand {
        std::filesystem::path data_dir = "GeoJson";
        std::vector<int> resolutions{1, 2, 3, 4};
        std::optional<std::filesystem::path> aggregates_path;
        std::size_t sample = 5;
        std::string log_level = "info";
        bool help = false;
    };

    // Both parsers throw std::invalid_argument with a printable message on any bad option.
    StreamCommand ParseStreamOptions(int argc, char **argv);
    ValidateCommand ParseValidateOptions(int argc, char **argv);

    std::string StreamUsage(const std::string &prog);
    std::string ValidateUsage(const std::string &prog);

} // namespace hexfire
