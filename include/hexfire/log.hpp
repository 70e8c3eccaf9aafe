#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace hexfire {

    // Library logger. Bound to stderr: stdout carries the feature stream.
    inline std::shared_ptr<spdlog::logger> log() {
        static std::shared_ptr<spdlog::logger> logger = [] {
            auto existing = spdlog::get("hexfire");
            return existing ? existing : spdlog::stderr_color_mt("hexfire");
        }();
        return logger;
    }

    // Accepts spdlog level names (trace, debug, info, warn, error, critical, off).
    inline void SetLogLevel(const std::string &name) { log()->set_level(spdlog::level::from_str(name)); }

} // namespace hexfire
