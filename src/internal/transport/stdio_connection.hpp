#ifndef ACPBRIDGE_INTERNAL_STDIO_CONNECTION_HPP
#define ACPBRIDGE_INTERNAL_STDIO_CONNECTION_HPP

#include "../line_buffer.hpp"
#include "../supervisor.hpp"

#include <acpbridge/connection.hpp>
#include <acpbridge/protocol/jsonrpc.hpp>
#include <atomic>
#include <memory>
#include <thread>

namespace acpbridge
{
namespace internal
{

/**
 * ACP over a supervised subprocess.
 *
 * One reader thread parses stdout lines and routes responses to the
 * JSON-RPC peer, notifications and requests to the ClientHandler.
 * Malformed lines are logged and skipped; an oversized line or EOF ends
 * the connection and fails every pending request.
 */
class StdioConnection : public AgentConnection
{
  public:
    StdioConnection(SpawnSpec spec, ClientHandler& handler, ConnectionEvents events);
    ~StdioConnection() override;

    void start() override;
    json initialize(const json& client_capabilities, int timeout_ms) override;
    std::string new_session(const std::string& cwd, const json& mcp_servers,
                            int timeout_ms) override;
    void prompt(const std::string& session_id, const json& content, PromptCallback done) override;
    void cancel(const std::string& session_id) override;
    bool is_alive() const override;
    long pid() const override;
    TerminationOutcome close(std::chrono::milliseconds grace) override;

  private:
    void write(const std::string& data);
    protocol::JsonRpcPeer::WriteFunc writer();

    void reader_loop();
    void handle_line(const std::string& line);
    void dispatch_notification(const json& message);
    void dispatch_request(const json& message);
    void report_closed(ConnectionFault fault);
    void wait_for_exit_after_eof();

    SpawnSpec spec_;
    ClientHandler& handler_;
    ConnectionEvents events_;

    std::unique_ptr<ProcessSupervisor> supervisor_;
    protocol::JsonRpcPeer peer_;
    LineBuffer lines_;

    std::thread reader_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> closing_{false};
    std::atomic<bool> fault_reported_{false};
    std::atomic<bool> stream_open_{false};
};

} // namespace internal
} // namespace acpbridge

#endif // ACPBRIDGE_INTERNAL_STDIO_CONNECTION_HPP
