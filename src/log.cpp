#include "toolwire/log.hpp"
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace toolwire::log {

std::shared_ptr<spdlog::logger> stderr_logger(const std::string& name) {
    if (auto existing = spdlog::get(name)) return existing;
    try {
        return spdlog::stderr_color_mt(name);
    } catch (const spdlog::spdlog_ex&) {
        // Registered concurrently by another thread.
        return spdlog::get(name);
    }
}

std::shared_ptr<spdlog::logger> null_logger() {
    return std::make_shared<spdlog::logger>("toolwire-null",
                                            std::make_shared<spdlog::sinks::null_sink_mt>());
}

void configure_from_env() {
    spdlog::cfg::load_env_levels();
}

std::shared_ptr<spdlog::logger> or_default(std::shared_ptr<spdlog::logger> logger) {
    return logger ? std::move(logger) : stderr_logger();
}

} // namespace toolwire::log
