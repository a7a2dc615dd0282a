#ifndef ACPBRIDGE_AGENT_HPP
#define ACPBRIDGE_AGENT_HPP

#include <acpbridge/types.hpp>
#include <memory>
#include <string>
#include <vector>

namespace acpbridge
{

enum class AgentType
{
    Gemini,
    Opencode,
    Claude,
    Qwen
};

// "gemini", "opencode", "claude", "qwen"
const char* to_string(AgentType type);

// Trimmed, case-insensitive. Throws ConfigError listing the supported values.
AgentType parse_agent_type(const std::string& value);

// Executable used when CliAgentConfig::command is empty
std::string default_agent_command(AgentType type);

struct AgentCapabilities
{
    bool supports_acp = true;
    bool supports_approval_mode = false;
    bool supports_model_selection = false;
    bool supports_include_directories = false;
};

struct AgentValidation
{
    bool valid = false;
    std::string error;
};

/**
 * An agent CLI that can speak ACP.
 *
 * Subclasses decide the executable, the protocol-mode arguments and any
 * MCP servers to hand to session/new.
 */
class CliAgent
{
  public:
    explicit CliAgent(CliAgentConfig config);
    virtual ~CliAgent() = default;

    virtual std::string command() const;
    virtual std::string display_name() const = 0;
    virtual std::vector<std::string> build_acp_args() const = 0;
    virtual AgentCapabilities capabilities() const = 0;

    // MCP servers for session/new; an empty array defers to RuntimeOptions::mcp_servers_json
    virtual json mcp_servers() const;

    // Runs `<command> --version` with a 10 second limit
    virtual AgentValidation validate() const;

    int kill_grace_ms() const;

    const CliAgentConfig& config() const
    {
        return config_;
    }

  protected:
    // <acp_flag> [--include-directories d]... [--approval-mode m] [--model m]
    std::vector<std::string> build_flag_args(const std::string& acp_flag) const;

    CliAgentConfig config_;
};

class GeminiAgent : public CliAgent
{
  public:
    using CliAgent::CliAgent;

    std::string display_name() const override;
    std::vector<std::string> build_acp_args() const override;
    AgentCapabilities capabilities() const override;
};

class OpencodeAgent : public CliAgent
{
  public:
    using CliAgent::CliAgent;

    std::string display_name() const override;
    std::vector<std::string> build_acp_args() const override;
    AgentCapabilities capabilities() const override;
};

// Gemini-compatible flags plus MCP servers read from the Qwen settings file
class QwenAgent : public CliAgent
{
  public:
    explicit QwenAgent(CliAgentConfig config);

    std::string display_name() const override;
    std::vector<std::string> build_acp_args() const override;
    AgentCapabilities capabilities() const override;
    json mcp_servers() const override;

    // Names under "mcpServers" in the settings file (empty if unreadable)
    std::vector<std::string> mcp_server_names() const;

  private:
    json read_settings_servers() const;
};

// Claude Code through the claude-agent-acp adapter; takes no flags
class ClaudeCodeAgent : public CliAgent
{
  public:
    using CliAgent::CliAgent;

    std::string display_name() const override;
    std::vector<std::string> build_acp_args() const override;
    AgentCapabilities capabilities() const override;
};

// Fills in the default command when config.command is empty
std::unique_ptr<CliAgent> create_cli_agent(AgentType type, CliAgentConfig config);

} // namespace acpbridge

#endif // ACPBRIDGE_AGENT_HPP
