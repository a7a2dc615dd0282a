#ifndef ACPBRIDGE_CONNECTION_HPP
#define ACPBRIDGE_CONNECTION_HPP

#include <acpbridge/protocol/acp.hpp>
#include <acpbridge/types.hpp>
#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace acpbridge
{

/**
 * Answers the requests and notifications an agent sends to its client.
 *
 * One method per inbound message kind. Calls arrive on the connection's
 * reader thread; implementations must not block for long.
 */
class ClientHandler
{
  public:
    virtual ~ClientHandler() = default;

    /// session/request_permission - returns the {outcome: ...} result
    virtual json request_permission(const json& params) = 0;

    /// session/update notification
    virtual void session_update(const protocol::SessionNotification& notification) = 0;

    /// fs/read_text_file
    virtual json read_text_file(const json& params) = 0;

    /// fs/write_text_file
    virtual json write_text_file(const json& params) = 0;
};

/// Why a connection stopped working
struct ConnectionFault
{
    std::string reason;
    std::optional<int> exit_code; // Set when the process exit was observed
};

/// Out-of-band connection events. Callbacks run on connection threads.
struct ConnectionEvents
{
    // Raw stderr text from the agent process
    std::function<void(const std::string&)> on_stderr;
    // Fires at most once when the connection dies without close() being called
    std::function<void(const ConnectionFault&)> on_closed;
};

/// What to launch
struct SpawnSpec
{
    std::string command;
    std::vector<std::string> args;
    std::string working_directory;
    std::map<std::string, std::string> environment;
    size_t max_message_bytes = 10 * 1024 * 1024;
};

/**
 * Abstract ACP connection to an agent.
 *
 * The runtime only talks to agents through this interface; the stdio
 * implementation frames newline-delimited JSON-RPC over a subprocess.
 * Tests inject their own implementation through a ConnectionFactory.
 */
class AgentConnection
{
  public:
    // stop_reason is meaningful only when error is null
    using PromptCallback = std::function<void(const std::string& stop_reason, std::exception_ptr error)>;

    virtual ~AgentConnection() = default;

    /// Launch the agent. Throws ProcessSpawnError.
    virtual void start() = 0;

    /// initialize - blocks for the response
    virtual json initialize(const json& client_capabilities, int timeout_ms) = 0;

    /// session/new - returns the session id
    virtual std::string new_session(const std::string& cwd, const json& mcp_servers,
                                    int timeout_ms) = 0;

    /// session/prompt - done runs once on a connection thread
    virtual void prompt(const std::string& session_id, const json& content,
                        PromptCallback done) = 0;

    /// session/cancel notification
    virtual void cancel(const std::string& session_id) = 0;

    /// True while the agent process is running and the stream is usable
    virtual bool is_alive() const = 0;

    /// Agent process id, 0 if none
    virtual long pid() const = 0;

    /// Terminate the agent (SIGTERM, SIGKILL after grace) and fail pending requests.
    /// Suppresses on_closed.
    virtual TerminationOutcome close(std::chrono::milliseconds grace) = 0;
};

using ConnectionFactory = std::function<std::unique_ptr<AgentConnection>(
    const SpawnSpec& spec, ClientHandler& handler, ConnectionEvents events)>;

// Newline-delimited JSON-RPC 2.0 over the agent's stdin/stdout
std::unique_ptr<AgentConnection> create_stdio_connection(const SpawnSpec& spec,
                                                         ClientHandler& handler,
                                                         ConnectionEvents events);

} // namespace acpbridge

#endif // ACPBRIDGE_CONNECTION_HPP
