#ifndef ACPBRIDGE_LOGGING_HPP
#define ACPBRIDGE_LOGGING_HPP

#include <memory>
#include <spdlog/spdlog.h>

namespace acpbridge
{
namespace log
{

// Name of the library logger
constexpr const char* LOGGER_NAME = "acpbridge";

// Library logger. Created on first use with a colored stderr sink.
std::shared_ptr<spdlog::logger> get();

// Replace the library logger (hosts and tests install their own sinks).
// Passing nullptr restores the default logger.
void set_logger(std::shared_ptr<spdlog::logger> logger);

// Apply LOG_LEVEL (trace, debug, info, warn, error, critical, off) when set.
void configure_from_environment();

} // namespace log
} // namespace acpbridge

#endif // ACPBRIDGE_LOGGING_HPP
