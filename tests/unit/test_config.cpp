#include "../test_utils.hpp"

#include <acpbridge/config.hpp>
#include <acpbridge/errors.hpp>
#include <gtest/gtest.h>
#include <map>

using namespace acpbridge;

namespace
{
EnvLookup lookup_from(std::map<std::string, std::string> values)
{
    return [values = std::move(values)](const std::string& name) -> std::optional<std::string>
    {
        auto it = values.find(name);
        if (it == values.end())
            return std::nullopt;
        return it->second;
    };
}
} // namespace

TEST(ConfigTest, Defaults)
{
    BridgeConfig config = load_config(lookup_from({{"HOME", "/home/u"}}));

    EXPECT_EQ(config.agent_type, AgentType::Gemini);
    EXPECT_EQ(config.home_dir, "/home/u/.acpbridge");
    EXPECT_EQ(config.agent.include_directories,
              (std::vector<std::string>{"/home/u/.acpbridge", "/home/u"}));
    EXPECT_FALSE(config.agent.kill_grace_ms.has_value());

    EXPECT_EQ(config.runtime.permission_strategy, "allow_once");
    EXPECT_FALSE(config.runtime.stream_stdout);
    EXPECT_EQ(config.runtime.timeout_ms, 20 * 60 * 1000);
    EXPECT_EQ(config.runtime.no_output_timeout_ms, 5 * 60 * 1000);
    EXPECT_EQ(config.processor.delivery.max_response_length, 4000u);
    EXPECT_EQ(config.processor.delivery.stream_update_interval_ms, 5000);
    EXPECT_EQ(config.processor.delivery.message_gap_threshold_ms, 10000);
}

TEST(ConfigTest, ReadsEveryVariable)
{
    BridgeConfig config = load_config(lookup_from({
        {"HOME", "/home/u"},
        {"ACPBRIDGE_HOME", "/srv/bridge"},
        {"CLI_AGENT", "Qwen"},
        {"CLI_AGENT_COMMAND", "/opt/qwen"},
        {"CLI_AGENT_APPROVAL_MODE", "yolo"},
        {"CLI_AGENT_MODEL", "qwen-max"},
        {"CLI_AGENT_KILL_GRACE_MS", "1500"},
        {"CLI_AGENT_TIMEOUT_MS", "60000"},
        {"CLI_AGENT_NO_OUTPUT_TIMEOUT_MS", "0"},
        {"ACP_PERMISSION_STRATEGY", "cancelled"},
        {"ACP_STREAM_STDOUT", "TRUE"},
        {"ACP_DEBUG_STREAM", "yes"},
        {"ACP_HANDSHAKE_TIMEOUT_MS", "5000"},
        {"ACP_PREWARM_RETRY_MS", "1000"},
        {"ACP_PREWARM_MAX_RETRIES", "4"},
        {"ACP_MCP_SERVERS_JSON", "[]"},
        {"MAX_RESPONSE_LENGTH", "2000"},
        {"STREAM_UPDATE_INTERVAL_MS", "750"},
        {"MESSAGE_GAP_THRESHOLD_MS", "3000"},
    }));

    EXPECT_EQ(config.agent_type, AgentType::Qwen);
    EXPECT_EQ(config.home_dir, "/srv/bridge");
    EXPECT_EQ(config.agent.command, "/opt/qwen");
    EXPECT_EQ(config.agent.approval_mode, "yolo");
    EXPECT_EQ(config.agent.model, "qwen-max");
    EXPECT_EQ(config.agent.kill_grace_ms, 1500);
    EXPECT_EQ(config.agent.include_directories,
              (std::vector<std::string>{"/srv/bridge", "/home/u"}));

    EXPECT_EQ(config.runtime.timeout_ms, 60000);
    EXPECT_EQ(config.runtime.no_output_timeout_ms, 0);
    EXPECT_EQ(config.runtime.permission_strategy, "cancelled");
    EXPECT_TRUE(config.runtime.stream_stdout);
    EXPECT_TRUE(config.runtime.debug_stream);
    EXPECT_EQ(config.runtime.handshake_timeout_ms, 5000);
    EXPECT_EQ(config.runtime.prewarm_retry_ms, 1000);
    EXPECT_EQ(config.runtime.prewarm_max_retries, 4);
    EXPECT_EQ(config.runtime.mcp_servers_json, "[]");

    EXPECT_EQ(config.processor.delivery.max_response_length, 2000u);
    EXPECT_EQ(config.processor.delivery.stream_update_interval_ms, 750);
    EXPECT_EQ(config.processor.delivery.message_gap_threshold_ms, 3000);
}

TEST(ConfigTest, InvalidNumbersKeepDefaults)
{
    test::LogCapture logs;
    BridgeConfig config = load_config(lookup_from({
        {"HOME", "/home/u"},
        {"CLI_AGENT_TIMEOUT_MS", "soon"},
        {"ACP_PREWARM_RETRY_MS", "12abc"},
        {"MAX_RESPONSE_LENGTH", "-5"},
        {"ACP_STREAM_STDOUT", "maybe"},
    }));

    EXPECT_EQ(config.runtime.timeout_ms, 20 * 60 * 1000);
    EXPECT_EQ(config.runtime.prewarm_retry_ms, 30000);
    EXPECT_EQ(config.processor.delivery.max_response_length, 4000u);
    EXPECT_FALSE(config.runtime.stream_stdout);
    EXPECT_TRUE(logs.contains("Ignoring invalid CLI_AGENT_TIMEOUT_MS=soon"));
}

TEST(ConfigTest, EmptyValuesCountAsUnset)
{
    BridgeConfig config = load_config(lookup_from({
        {"HOME", "/home/u"},
        {"CLI_AGENT", ""},
        {"ACP_PERMISSION_STRATEGY", ""},
    }));

    EXPECT_EQ(config.agent_type, AgentType::Gemini);
    EXPECT_EQ(config.runtime.permission_strategy, "allow_once");
}

TEST(ConfigTest, UnsupportedAgentThrows)
{
    EXPECT_THROW(load_config(lookup_from({{"CLI_AGENT", "copilot"}})), ConfigError);
}
