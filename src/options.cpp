#include "hexfire/options.hpp"

#include "hexfire/hexgrid.hpp"
#include "hexfire/timestamp.hpp"

#include <getopt.h>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

namespace hexfire {

    namespace {

        int parseInt(const char *name, const std::string &text) {
            std::size_t used = 0;
            int v = 0;
            try {
                v = std::stoi(text, &used);
            } catch (const std::logic_error &) {
                used = 0;
            }
            if (used == 0 || used != text.size())
                throw std::invalid_argument(std::string("--") + name + " expects an integer, got '" + text + "'");
            return v;
        }

        int parseResolution(const char *name, const std::string &text) {
            int res = parseInt(name, text);
            if (!IsValidResolution(res))
                throw std::invalid_argument(std::string("--") + name + " must be within 0..15, got " + text);
            return res;
        }

        int parseZoom(const char *name, const std::string &text) {
            int z = parseInt(name, text);
            if (z < 0)
                throw std::invalid_argument(std::string("--") + name + " must not be negative, got " + text);
            return z;
        }

        std::string parseLogLevel(const std::string &text) {
            // from_str maps unknown names to off; only accept "off" when it was asked for.
            if (text != "off" && spdlog::level::from_str(text) == spdlog::level::off)
                throw std::invalid_argument("unknown log level '" + text + "'");
            return text;
        }

        std::string unknownOption(int argc, char **argv) {
            int at = optind - 1;
            if (at > 0 && at < argc)
                return std::string("unrecognized or incomplete option '") + argv[at] + "'";
            return "unrecognized option";
        }

        void rejectPositional(int argc, char **argv) {
            if (optind < argc)
                throw std::invalid_argument(std::string("unexpected argument '") + argv[optind] + "'");
        }

    } // namespace

    StreamCommand ParseStreamOptions(int argc, char **argv) {
        enum {
            kDataDir = 256,
            kH3Res,
            kLowZoomMax,
            kHighZoomMin,
            kOmitRaw,
            kRawOnly,
            kStartDate,
            kEndDate,
            kStatsGdf,
            kLogLevel,
        };
        static const struct option long_options[] = {
            {"data-dir", required_argument, nullptr, kDataDir},
            {"h3-res", required_argument, nullptr, kH3Res},
            {"low-zoom-max", required_argument, nullptr, kLowZoomMax},
            {"high-zoom-min", required_argument, nullptr, kHighZoomMin},
            {"omit-raw", no_argument, nullptr, kOmitRaw},
            {"raw-only", no_argument, nullptr, kRawOnly},
            {"start-date", required_argument, nullptr, kStartDate},
            {"end-date", required_argument, nullptr, kEndDate},
            {"stats-gdf", required_argument, nullptr, kStatsGdf},
            {"log-level", required_argument, nullptr, kLogLevel},
            {"help", no_argument, nullptr, 'h'},
            {nullptr, 0, nullptr, 0},
        };

        StreamCommand cmd;
        auto &o = cmd.options;
        optind = 0;
        opterr = 0;
        int i;
        while ((i = getopt_long(argc, argv, "h", long_options, nullptr)) != -1) {
            switch (i) {
            case kDataDir:
                o.data_dir = optarg;
                break;
            case kH3Res:
                o.resolution = parseResolution("h3-res", optarg);
                break;
            case kLowZoomMax:
                o.low_zoom_max = parseZoom("low-zoom-max", optarg);
                break;
            case kHighZoomMin:
                o.high_zoom_min = parseZoom("high-zoom-min", optarg);
                break;
            case kOmitRaw:
                o.include_raw = false;
                break;
            case kRawOnly:
                o.raw_only = true;
                break;
            case kStartDate:
                o.range.start = ParseDate(optarg);
                break;
            case kEndDate:
                // inclusive end date: everything before the following midnight
                o.range.end = ParseDate(optarg) + kSecondsPerDay;
                break;
            case kStatsGdf:
                o.stats_path = std::filesystem::path(optarg);
                break;
            case kLogLevel:
                cmd.log_level = parseLogLevel(optarg);
                break;
            case 'h':
                cmd.help = true;
                break;
            default:
                throw std::invalid_argument(unknownOption(argc, argv));
            }
        }
        rejectPositional(argc, argv);

        if (o.raw_only && !o.include_raw)
            throw std::invalid_argument("--omit-raw and --raw-only are mutually exclusive");
        if (o.range.start && o.range.end && *o.range.start >= *o.range.end)
            throw std::invalid_argument("--start-date is after --end-date");
        return cmd;
    }

    ValidateCommand ParseValidateOptions(int argc, char **argv) {
        enum {
            kDataDir = 256,
            kRes,
            kAggregates,
            kSample,
            kLogLevel,
        };
        static const struct option long_options[] = {
            {"data-dir", required_argument, nullptr, kDataDir},
            {"res", required_argument, nullptr, kRes},
            {"aggregates", required_argument, nullptr, kAggregates},
            {"sample", required_argument, nullptr, kSample},
            {"log-level", required_argument, nullptr, kLogLevel},
            {"help", no_argument, nullptr, 'h'},
            {nullptr, 0, nullptr, 0},
        };

        ValidateCommand cmd;
        optind = 0;
        opterr = 0;
        int i;
        while ((i = getopt_long(argc, argv, "h", long_options, nullptr)) != -1) {
            switch (i) {
            case kDataDir:
                cmd.data_dir = optarg;
                break;
            case kRes: {
                cmd.resolutions.clear();
                std::stringstream ss(optarg);
                std::string item;
                while (std::getline(ss, item, ','))
                    cmd.resolutions.push_back(parseResolution("res", item));
                if (cmd.resolutions.empty())
                    throw std::invalid_argument("--res expects a comma separated list of resolutions");
                break;
            }
            case kAggregates:
                cmd.aggregates_path = std::filesystem::path(optarg);
                break;
            case kSample: {
                int n = parseInt("sample", optarg);
                if (n < 0)
                    throw std::invalid_argument("--sample must not be negative");
                cmd.sample = static_cast<std::size_t>(n);
                break;
            }
            case kLogLevel:
                cmd.log_level = parseLogLevel(optarg);
                break;
            case 'h':
                cmd.help = true;
                break;
            default:
                throw std::invalid_argument(unknownOption(argc, argv));
            }
        }
        rejectPositional(argc, argv);
        return cmd;
    }

    std::string StreamUsage(const std::string &prog) {
        return "Usage: " + prog +
               " [options]\n"
               "Streams fire observations as NDJSON: raw features for high zooms, H3 aggregates for low zooms.\n"
               "\n"
               "  --data-dir DIR        input directory of *.geojson files (default GeoJson)\n"
               "  --h3-res N            H3 resolution for aggregates, 0..15 (default 3)\n"
               "  --low-zoom-max N      maxzoom of aggregate features (default 4)\n"
               "  --high-zoom-min N     minzoom of raw features (default low-zoom-max + 1)\n"
               "  --omit-raw            write aggregates only\n"
               "  --raw-only            write raw features only, without zoom hints\n"
               "  --start-date D        first UTC day to include (YYYY-MM-DD)\n"
               "  --end-date D          last UTC day to include (YYYY-MM-DD)\n"
               "  --stats-gdf PATH      per-event start/end override table\n"
               "  --log-level L         trace, debug, info, warn, error, critical or off (default info)\n"
               "  -h, --help            show this message\n";
    }

    std::string ValidateUsage(const std::string &prog) {
        return "Usage: " + prog +
               " [options]\n"
               "Checks that every H3 aggregate bucket is backed by at least one raw feature.\n"
               "\n"
               "  --data-dir DIR        input directory of *.geojson files (default GeoJson)\n"
               "  --res LIST            comma separated resolutions (default 1,2,3,4)\n"
               "  --aggregates FILE     check aggregate records from a previous stream run\n"
               "  --sample N            missing buckets to print (default 5)\n"
               "  --log-level L         spdlog level name (default info)\n"
               "  -h, --help            show this message\n";
    }

} // namespace hexfire
