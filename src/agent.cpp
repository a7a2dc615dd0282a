#include "internal/subprocess/process.hpp"

#include <acpbridge/agent.hpp>
#include <acpbridge/errors.hpp>
#include <acpbridge/logging.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>

namespace acpbridge
{

namespace
{
constexpr int DEFAULT_KILL_GRACE_MS = 5000;
constexpr auto VALIDATE_TIMEOUT = std::chrono::seconds(10);
constexpr const char* SUPPORTED_AGENTS = "gemini, opencode, claude, qwen";

std::string trim_lower(const std::string& value)
{
    auto begin = std::find_if_not(value.begin(), value.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(),
                                [](unsigned char c) { return std::isspace(c); })
                   .base();
    std::string out = begin < end ? std::string(begin, end) : std::string();
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string default_qwen_settings_path()
{
    const char* home = std::getenv("HOME");
    std::filesystem::path base = home ? home : ".";
    return (base / ".qwen" / "settings.json").string();
}
} // namespace

// ============================================================================
// Agent type helpers
// ============================================================================

const char* to_string(AgentType type)
{
    switch (type)
    {
    case AgentType::Gemini:
        return "gemini";
    case AgentType::Opencode:
        return "opencode";
    case AgentType::Claude:
        return "claude";
    case AgentType::Qwen:
        return "qwen";
    }
    return "unknown";
}

AgentType parse_agent_type(const std::string& value)
{
    std::string normalized = trim_lower(value);
    if (normalized == "gemini")
        return AgentType::Gemini;
    if (normalized == "opencode")
        return AgentType::Opencode;
    if (normalized == "claude")
        return AgentType::Claude;
    if (normalized == "qwen")
        return AgentType::Qwen;
    throw ConfigError("Invalid CLI_AGENT value: " + value +
                      ". Supported values: " + SUPPORTED_AGENTS);
}

std::string default_agent_command(AgentType type)
{
    switch (type)
    {
    case AgentType::Opencode:
        return "opencode";
    case AgentType::Claude:
        return "claude-agent-acp";
    case AgentType::Qwen:
        return "qwen";
    case AgentType::Gemini:
        break;
    }
    return "gemini";
}

// ============================================================================
// CliAgent
// ============================================================================

CliAgent::CliAgent(CliAgentConfig config) : config_(std::move(config)) {}

std::string CliAgent::command() const
{
    return config_.command;
}

json CliAgent::mcp_servers() const
{
    return json::array();
}

int CliAgent::kill_grace_ms() const
{
    return config_.kill_grace_ms.value_or(DEFAULT_KILL_GRACE_MS);
}

std::vector<std::string> CliAgent::build_flag_args(const std::string& acp_flag) const
{
    std::vector<std::string> args{acp_flag};

    // Duplicates dropped, first occurrence order kept
    std::set<std::string> seen;
    for (const auto& dir : config_.include_directories)
    {
        if (!seen.insert(dir).second)
            continue;
        args.push_back("--include-directories");
        args.push_back(dir);
    }

    if (!config_.approval_mode.empty())
    {
        args.push_back("--approval-mode");
        args.push_back(config_.approval_mode);
    }

    if (!config_.model.empty())
    {
        args.push_back("--model");
        args.push_back(config_.model);
    }

    return args;
}

AgentValidation CliAgent::validate() const
{
    const std::string cmd = command();
    if (!subprocess::find_executable(cmd))
        return {false, display_name() + " executable not found: " + cmd +
                           ". Install it or set CLI_AGENT_COMMAND to a valid executable path."};

    try
    {
        // Output lands in pipes nobody reads; --version output is small
        subprocess::ProcessOptions options;
        options.redirect_stdin = false;

        subprocess::Process process;
        process.spawn(cmd, {"--version"}, options);
        if (!process.wait_for(VALIDATE_TIMEOUT))
        {
            process.kill();
            process.wait();
            return {false, display_name() + " (" + cmd + ") did not answer --version within 10s"};
        }
        return {true, {}};
    }
    catch (const std::exception& e)
    {
        return {false, "Failed to execute " + display_name() + " (" + cmd + "): " + e.what()};
    }
}

// ============================================================================
// Concrete agents
// ============================================================================

std::string GeminiAgent::display_name() const
{
    return "Gemini CLI";
}

std::vector<std::string> GeminiAgent::build_acp_args() const
{
    return build_flag_args("--experimental-acp");
}

AgentCapabilities GeminiAgent::capabilities() const
{
    return {true, true, true, true};
}

std::string OpencodeAgent::display_name() const
{
    return "OpenCode";
}

std::vector<std::string> OpencodeAgent::build_acp_args() const
{
    return build_flag_args("--experimental-acp");
}

AgentCapabilities OpencodeAgent::capabilities() const
{
    return {true, true, true, true};
}

QwenAgent::QwenAgent(CliAgentConfig config) : CliAgent(std::move(config))
{
    if (config_.settings_path.empty())
        config_.settings_path = default_qwen_settings_path();
}

std::string QwenAgent::display_name() const
{
    return "Qwen CLI";
}

std::vector<std::string> QwenAgent::build_acp_args() const
{
    auto args = build_flag_args("--experimental-acp");

    auto names = mcp_server_names();
    if (!names.empty())
    {
        args.push_back("--allowed-mcp-server-names");
        args.insert(args.end(), names.begin(), names.end());
    }
    return args;
}

AgentCapabilities QwenAgent::capabilities() const
{
    return {true, true, true, true};
}

json QwenAgent::read_settings_servers() const
{
    std::error_code ec;
    if (!std::filesystem::exists(config_.settings_path, ec))
        return json::object();

    try
    {
        std::ifstream in(config_.settings_path);
        json settings = json::parse(in);
        if (settings.is_object() && settings.contains("mcpServers") &&
            settings["mcpServers"].is_object())
            return settings["mcpServers"];
    }
    catch (const json::exception& e)
    {
        log::get()->error("Failed to read Qwen MCP settings {}: {}", config_.settings_path,
                          e.what());
    }
    return json::object();
}

std::vector<std::string> QwenAgent::mcp_server_names() const
{
    std::vector<std::string> names;
    const json configured = read_settings_servers();
    for (const auto& [name, server] : configured.items())
        names.push_back(name);
    return names;
}

json QwenAgent::mcp_servers() const
{
    json servers = json::array();
    const json configured = read_settings_servers();
    for (const auto& [name, server] : configured.items())
    {
        if (!server.is_object())
            continue;

        if (server.contains("command") && server["command"].is_string())
        {
            // stdio server; env becomes [{name, value}]
            json env = json::array();
            if (server.contains("env") && server["env"].is_object())
                for (const auto& [key, value] : server["env"].items())
                    env.push_back({{"name", key}, {"value", value}});

            servers.push_back({{"name", name},
                               {"command", server["command"]},
                               {"args", server.value("args", json::array())},
                               {"env", env}});
        }
        else if (server.contains("url") && server["url"].is_string())
        {
            servers.push_back({{"name", name},
                               {"type", server.value("type", "sse")},
                               {"url", server["url"]},
                               {"headers", server.value("headers", json::array())}});
        }
    }
    return servers;
}

std::string ClaudeCodeAgent::display_name() const
{
    return "Claude Code";
}

std::vector<std::string> ClaudeCodeAgent::build_acp_args() const
{
    return {};
}

AgentCapabilities ClaudeCodeAgent::capabilities() const
{
    return {true, false, false, false};
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<CliAgent> create_cli_agent(AgentType type, CliAgentConfig config)
{
    if (config.command.empty())
        config.command = default_agent_command(type);

    switch (type)
    {
    case AgentType::Gemini:
        return std::make_unique<GeminiAgent>(std::move(config));
    case AgentType::Opencode:
        return std::make_unique<OpencodeAgent>(std::move(config));
    case AgentType::Claude:
        return std::make_unique<ClaudeCodeAgent>(std::move(config));
    case AgentType::Qwen:
        return std::make_unique<QwenAgent>(std::move(config));
    }
    throw ConfigError(std::string("Unsupported agent type. Supported types: ") + SUPPORTED_AGENTS);
}

} // namespace acpbridge
