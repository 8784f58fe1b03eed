#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace toolwire::log {

/// Colored stderr logger registered under `name`; an existing logger with
/// that name is reused. stdout carries the protocol and is never logged to.
std::shared_ptr<spdlog::logger> stderr_logger(const std::string& name = "toolwire");

/// Logger that discards everything.
std::shared_ptr<spdlog::logger> null_logger();

/// Apply SPDLOG_LEVEL (e.g. "debug" or "toolwire=trace,warn").
void configure_from_env();

/// `logger` if set, otherwise the shared "toolwire" stderr logger.
std::shared_ptr<spdlog::logger> or_default(std::shared_ptr<spdlog::logger> logger);

} // namespace toolwire::log
