#pragma once
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace cancor_core {
namespace util {

/*
 * Library-wide logger named "cancor_core".
 * A logger registered under this name by the caller (e.g. with custom sinks)
 * takes precedence over the default stderr logger.
 */
inline std::shared_ptr<spdlog::logger> logger()
{
    static constexpr const char* name = "cancor_core";
    auto lg = spdlog::get(name);
    if (lg) return lg;
    try {
        return spdlog::stderr_color_mt(name);
    } catch (const spdlog::spdlog_ex&) {
        // registered concurrently by someone else
        return spdlog::get(name);
    }
}

} // namespace util
} // namespace cancor_core
