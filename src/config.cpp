#include <acpbridge/config.hpp>
#include <acpbridge/logging.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace acpbridge
{

namespace
{
class EnvReader
{
  public:
    explicit EnvReader(const EnvLookup& lookup) : lookup_(lookup) {}

    std::optional<std::string> get(const std::string& name) const
    {
        auto value = lookup_(name);
        if (!value || value->empty())
            return std::nullopt;
        return value;
    }

    std::string string(const std::string& name, const std::string& fallback) const
    {
        return get(name).value_or(fallback);
    }

    int integer(const std::string& name, int fallback) const
    {
        auto value = get(name);
        if (!value)
            return fallback;
        try
        {
            size_t used = 0;
            int parsed = std::stoi(*value, &used, 10);
            if (used == value->size())
                return parsed;
        }
        catch (const std::logic_error&)
        {
            // invalid_argument / out_of_range: reported below
        }
        log::get()->warn("Ignoring invalid {}={}; using {}", name, *value, fallback);
        return fallback;
    }

    bool boolean(const std::string& name, bool fallback) const
    {
        auto value = get(name);
        if (!value)
            return fallback;
        std::string lower = *value;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "true" || lower == "1" || lower == "yes")
            return true;
        if (lower == "false" || lower == "0" || lower == "no")
            return false;
        log::get()->warn("Ignoring invalid {}={}; using {}", name, *value, fallback);
        return fallback;
    }

  private:
    const EnvLookup& lookup_;
};

std::string user_home(const EnvReader& env)
{
    return env.string("HOME", ".");
}
} // namespace

BridgeConfig load_config(const EnvLookup& lookup)
{
    EnvReader env(lookup);
    BridgeConfig config;

    const std::string home = user_home(env);
    config.home_dir =
        env.string("ACPBRIDGE_HOME", (std::filesystem::path(home) / ".acpbridge").string());

    config.agent_type = parse_agent_type(env.string("CLI_AGENT", "gemini"));
    config.agent.command = env.string("CLI_AGENT_COMMAND", "");
    config.agent.approval_mode = env.string("CLI_AGENT_APPROVAL_MODE", "");
    config.agent.model = env.string("CLI_AGENT_MODEL", "");
    config.agent.include_directories = {config.home_dir, home};
    if (env.get("CLI_AGENT_KILL_GRACE_MS"))
        config.agent.kill_grace_ms = env.integer("CLI_AGENT_KILL_GRACE_MS", 5000);

    RuntimeOptions& runtime = config.runtime;
    runtime.permission_strategy = env.string("ACP_PERMISSION_STRATEGY", runtime.permission_strategy);
    runtime.stream_stdout = env.boolean("ACP_STREAM_STDOUT", runtime.stream_stdout);
    runtime.debug_stream = env.boolean("ACP_DEBUG_STREAM", runtime.debug_stream);
    runtime.timeout_ms = env.integer("CLI_AGENT_TIMEOUT_MS", runtime.timeout_ms);
    runtime.no_output_timeout_ms =
        env.integer("CLI_AGENT_NO_OUTPUT_TIMEOUT_MS", runtime.no_output_timeout_ms);
    runtime.handshake_timeout_ms =
        env.integer("ACP_HANDSHAKE_TIMEOUT_MS", runtime.handshake_timeout_ms);
    runtime.prewarm_retry_ms = env.integer("ACP_PREWARM_RETRY_MS", runtime.prewarm_retry_ms);
    runtime.prewarm_max_retries =
        env.integer("ACP_PREWARM_MAX_RETRIES", runtime.prewarm_max_retries);
    runtime.mcp_servers_json = env.string("ACP_MCP_SERVERS_JSON", "");

    DeliveryOptions& stream = config.processor.delivery;
    int max_length = env.integer("MAX_RESPONSE_LENGTH", static_cast<int>(stream.max_response_length));
    if (max_length > 0)
        stream.max_response_length = static_cast<size_t>(max_length);
    stream.stream_update_interval_ms =
        env.integer("STREAM_UPDATE_INTERVAL_MS", stream.stream_update_interval_ms);
    stream.message_gap_threshold_ms =
        env.integer("MESSAGE_GAP_THRESHOLD_MS", stream.message_gap_threshold_ms);

    return config;
}

BridgeConfig load_config_from_environment()
{
    return load_config(
        [](const std::string& name) -> std::optional<std::string>
        {
            if (const char* value = std::getenv(name.c_str()))
                return std::string(value);
            return std::nullopt;
        });
}

} // namespace acpbridge
