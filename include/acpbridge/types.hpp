#ifndef ACPBRIDGE_TYPES_HPP
#define ACPBRIDGE_TYPES_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace acpbridge
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

// ============================================================================
// Session state
// ============================================================================

enum class RuntimeState
{
    Idle,
    Starting,
    Ready,
    Prompting,
    Error,
    ShuttingDown
};

// "IDLE", "STARTING", ... as used in logs and heartbeats
const char* to_string(RuntimeState state);

/// Snapshot returned by AcpRuntime::runtime_state()
struct RuntimeStateSnapshot
{
    bool session_ready = false;   // READY or PROMPTING with a live session
    bool process_running = false; // Agent subprocess alive
    RuntimeState state = RuntimeState::Idle;
};

/// How a supervised process ended up after a termination request
enum class TerminationOutcome
{
    Exit,          // exited on its own or after SIGTERM within the grace period
    AlreadyExited, // nothing to do
    SigKill        // grace period elapsed, SIGKILL sent
};

const char* to_string(TerminationOutcome outcome);

// ============================================================================
// Options
// ============================================================================

/// Agent CLI configuration (see agent.hpp)
struct CliAgentConfig
{
    std::string command;      // Executable name or path
    std::string approval_mode; // Passed as --approval-mode when set
    std::string model;         // Passed as --model when set
    std::vector<std::string> include_directories;
    std::optional<int> kill_grace_ms; // Default 5000
    // Qwen only: settings file listing MCP servers (default ~/.qwen/settings.json)
    std::string settings_path;
};

/// Session manager options
struct RuntimeOptions
{
    std::string working_directory; // cwd for the agent and session/new (empty = current)
    std::map<std::string, std::string> environment; // Extra variables for the agent process

    std::string permission_strategy = "allow_once"; // option kind to pick, or "cancelled"
    bool stream_stdout = false; // Echo message chunks to stdout
    bool debug_stream = false;  // Log chunk-level details

    int timeout_ms = 20 * 60 * 1000;          // Overall prompt timeout
    int no_output_timeout_ms = 5 * 60 * 1000; // 0 disables
    int handshake_timeout_ms = 60000;         // initialize / session/new
    int prewarm_retry_ms = 30000;             // 0 disables retries
    int prewarm_max_retries = 0;              // 0 = unlimited

    std::string mcp_servers_json; // Fallback MCP server list (JSON array)
    size_t stderr_tail_max_chars = 4000;
    size_t max_message_bytes = 10 * 1024 * 1024; // Largest accepted stdout line
};

/// Streaming delivery options
struct DeliveryOptions
{
    size_t max_response_length = 4000;
    int stream_update_interval_ms = 5000;
    int message_gap_threshold_ms = 10000; // Live preview: start a new message after this gap
};

/// Message processor options
struct ProcessorOptions
{
    int max_retries = 3;
    int retry_delay_ms = 5000; // Doubled on every attempt
    DeliveryOptions delivery;
};

} // namespace acpbridge

#endif // ACPBRIDGE_TYPES_HPP
