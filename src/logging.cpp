#include <acpbridge/logging.hpp>
#include <cstdlib>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace acpbridge
{
namespace log
{

namespace
{
std::mutex logger_mutex;
std::shared_ptr<spdlog::logger> current_logger;

std::shared_ptr<spdlog::logger> make_default_logger()
{
    if (auto existing = spdlog::get(LOGGER_NAME))
        return existing;
    auto logger = spdlog::stderr_color_mt(LOGGER_NAME);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return logger;
}
} // namespace

std::shared_ptr<spdlog::logger> get()
{
    std::lock_guard<std::mutex> lock(logger_mutex);
    if (!current_logger)
        current_logger = make_default_logger();
    return current_logger;
}

void set_logger(std::shared_ptr<spdlog::logger> logger)
{
    std::lock_guard<std::mutex> lock(logger_mutex);
    current_logger = logger ? std::move(logger) : make_default_logger();
}

void configure_from_environment()
{
    const char* env = std::getenv("LOG_LEVEL");
    if (env == nullptr || env[0] == '\0')
        return;

    auto level = spdlog::level::from_str(env);
    // from_str maps unknown names to "off"; only honour an explicit "off"
    if (level == spdlog::level::off && std::string(env) != "off")
    {
        get()->warn("Ignoring unknown LOG_LEVEL value: {}", env);
        return;
    }
    get()->set_level(level);
}

} // namespace log
} // namespace acpbridge
