#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

namespace icodec {

// Library logger named "icodec". Reuses a logger of that name if the
// application registered one before the first decode.
inline spdlog::logger& logger() {
    static const std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get("icodec")) {
            return existing;
        }
        return spdlog::stderr_color_mt("icodec");
    }();
    return *instance;
}

} // namespace icodec
