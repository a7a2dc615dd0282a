#ifndef ACPBRIDGE_CONFIG_HPP
#define ACPBRIDGE_CONFIG_HPP

#include <acpbridge/agent.hpp>
#include <acpbridge/types.hpp>
#include <functional>
#include <optional>
#include <string>

namespace acpbridge
{

/// Everything a host needs to wire the runtime, queue and delivery together
struct BridgeConfig
{
    AgentType agent_type = AgentType::Gemini;
    CliAgentConfig agent;
    RuntimeOptions runtime;
    ProcessorOptions processor;
    std::string home_dir; // ACPBRIDGE_HOME, default ~/.acpbridge
};

// Returns the variable's value, or nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

/**
 * Build a configuration from environment variables.
 *
 * Unset variables and numbers that do not parse keep their defaults.
 * The agent gets the home directory and the user's home as include
 * directories.
 *
 * @throws ConfigError when CLI_AGENT names an unsupported agent
 */
BridgeConfig load_config(const EnvLookup& lookup);

// load_config() over the process environment
BridgeConfig load_config_from_environment();

} // namespace acpbridge

#endif // ACPBRIDGE_CONFIG_HPP
