#include "hexfire/cli.hpp"

#include "hexfire/coverage.hpp"
#include "hexfire/log.hpp"
#include "hexfire/pipeline.hpp"
#include "hexfire/source.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

namespace hexfire {

    int RunStreamCommand(const StreamCommand &cmd, NdjsonSink &sink) {
        SetLogLevel(cmd.log_level);
        try {
            RunStream(cmd.options, sink);
        } catch (const std::exception &e) {
            log()->critical("{}", e.what());
            return kStreamFatal;
        }
        return kStreamOk;
    }

    namespace {

        CoverageReport CheckCoverage(const ValidateCommand &cmd) {
            CoverageValidator validator(cmd.resolutions);

            if (cmd.aggregates_path) {
                std::ifstream in(*cmd.aggregates_path);
                if (!in)
                    throw std::runtime_error("hexfire::RunValidateCommand(): cannot open " +
                                             cmd.aggregates_path->string());
                auto n = ReadAggregateKeys(in, validator);
                log()->debug("{} aggregate records read from {}", n, cmd.aggregates_path->string());
            }

            FeatureSource source(cmd.data_dir);
            while (auto feature = source.next()) {
                validator.addRaw(*feature);
                if (!cmd.aggregates_path)
                    validator.addAggregatesFrom(*feature);
            }
            return validator.validate(cmd.sample);
        }

    } // namespace

    int RunValidateCommand(const ValidateCommand &cmd) {
        SetLogLevel(cmd.log_level);

        CoverageReport report;
        try {
            report = CheckCoverage(cmd);
        } catch (const std::exception &e) {
            log()->critical("{}", e.what());
            return kValidateFatal;
        }

        if (!report.ok()) {
            std::string sample;
            for (auto const &key : report.missing_sample)
                sample += (sample.empty() ? "" : ", ") + ToString(key);
            log()->error("Validation failed: {} of {} H3 aggregates have no raw feature coverage. Examples: {}",
                         report.missing, report.aggregate_buckets, sample);
            return kValidateFailed;
        }
        log()->info("Validation passed: all {} H3 aggregates have at least one raw feature",
                    report.aggregate_buckets);
        return kValidatePassed;
    }

} // namespace hexfire
