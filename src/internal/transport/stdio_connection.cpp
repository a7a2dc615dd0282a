#include "stdio_connection.hpp"

#include <acpbridge/errors.hpp>
#include <acpbridge/logging.hpp>
#include <acpbridge/version.hpp>
#include <chrono>

namespace acpbridge
{
namespace internal
{

namespace
{
constexpr int STDOUT_POLL_MS = 100;
// After EOF, how long to wait for the exit watcher to report the exit code
constexpr auto EOF_EXIT_GRACE = std::chrono::milliseconds(500);

std::string command_token(const std::string& command)
{
    auto pos = command.find_last_of("/\\");
    return pos == std::string::npos ? command : command.substr(pos + 1);
}
} // namespace

StdioConnection::StdioConnection(SpawnSpec spec, ClientHandler& handler, ConnectionEvents events)
    : spec_(std::move(spec)), handler_(handler), events_(std::move(events)),
      lines_(spec_.max_message_bytes)
{
}

StdioConnection::~StdioConnection()
{
    try
    {
        close(std::chrono::milliseconds(0));
    }
    catch (const std::exception& e)
    {
        log::get()->warn("Failed to close agent connection: {}", e.what());
    }
}

void StdioConnection::start()
{
    if (supervisor_)
        throw BridgeError("Connection already started");

    subprocess::ProcessOptions options;
    options.working_directory = spec_.working_directory;
    options.environment = spec_.environment;

    supervisor_ = std::make_unique<ProcessSupervisor>(command_token(spec_.command));
    supervisor_->start(
        spec_.command, spec_.args, options,
        [this](const std::string& text)
        {
            if (events_.on_stderr)
                events_.on_stderr(text);
        },
        [this](int exit_code)
        {
            report_closed(ConnectionFault{"Agent process exited with code " +
                                              std::to_string(exit_code),
                                          exit_code});
        });

    stream_open_ = true;
    running_ = true;
    reader_thread_ = std::thread(&StdioConnection::reader_loop, this);
}

void StdioConnection::write(const std::string& data)
{
    if (!supervisor_ || !stream_open_)
        throw ConnectionClosedError("Agent connection is closed");
    try
    {
        supervisor_->write(data);
    }
    catch (const BridgeError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw ConnectionClosedError(std::string("Failed to write to agent: ") + e.what());
    }
}

protocol::JsonRpcPeer::WriteFunc StdioConnection::writer()
{
    return [this](const std::string& data) { write(data); };
}

json StdioConnection::initialize(const json& client_capabilities, int timeout_ms)
{
    json params = {{"protocolVersion", ACP_PROTOCOL_VERSION},
                   {"clientCapabilities", client_capabilities}};
    return peer_.send_request(writer(), protocol::METHOD_INITIALIZE, params, timeout_ms);
}

std::string StdioConnection::new_session(const std::string& cwd, const json& mcp_servers,
                                         int timeout_ms)
{
    json params = {{"cwd", cwd}, {"mcpServers", mcp_servers}};
    json result = peer_.send_request(writer(), protocol::METHOD_SESSION_NEW, params, timeout_ms);
    if (!result.is_object() || !result.contains("sessionId") || !result["sessionId"].is_string())
        throw ProtocolError("session/new response missing sessionId: " + result.dump());
    return result["sessionId"].get<std::string>();
}

void StdioConnection::prompt(const std::string& session_id, const json& content,
                             PromptCallback done)
{
    json params = {{"sessionId", session_id}, {"prompt", content}};
    peer_.send_request_async(
        writer(), protocol::METHOD_SESSION_PROMPT, params,
        [done = std::move(done)](const json& result, std::exception_ptr error)
        {
            if (error)
            {
                done(std::string(), error);
                return;
            }
            std::string stop_reason = "end_turn";
            if (result.is_object() && result.contains("stopReason") &&
                result["stopReason"].is_string())
                stop_reason = result["stopReason"].get<std::string>();
            done(stop_reason, nullptr);
        });
}

void StdioConnection::cancel(const std::string& session_id)
{
    peer_.send_notification(writer(), protocol::METHOD_SESSION_CANCEL,
                            json{{"sessionId", session_id}});
}

bool StdioConnection::is_alive() const
{
    return supervisor_ && stream_open_ && supervisor_->is_running();
}

long StdioConnection::pid() const
{
    return supervisor_ ? supervisor_->pid() : 0;
}

TerminationOutcome StdioConnection::close(std::chrono::milliseconds grace)
{
    closing_ = true;
    if (!supervisor_)
        return TerminationOutcome::AlreadyExited;

    auto outcome = supervisor_->terminate_gracefully(grace);

    running_ = false;
    if (reader_thread_.joinable())
    {
        if (reader_thread_.get_id() == std::this_thread::get_id())
            reader_thread_.detach();
        else
            reader_thread_.join();
    }

    stream_open_ = false;
    peer_.fail_all_pending("Agent connection closed");
    return outcome;
}

void StdioConnection::reader_loop()
{
    try
    {
        auto& pipe = supervisor_->stdout_pipe();
        char buffer[4096];
        while (running_)
        {
            if (!pipe.has_data(STDOUT_POLL_MS))
                continue;

            size_t n = pipe.read(buffer, sizeof(buffer));
            if (n == 0)
                break; // EOF reached

            for (const auto& line : lines_.add_data(std::string(buffer, n)))
                handle_line(line);
        }

        if (auto rest = lines_.take_remainder())
            handle_line(*rest);
    }
    catch (const ProtocolError& e)
    {
        log::get()->error("Agent stream framing error: {}", e.what());
        stream_open_ = false;
        peer_.fail_all_pending(e.what());
        report_closed(ConnectionFault{e.what(), std::nullopt});
        return;
    }
    catch (const std::exception& e)
    {
        log::get()->error("Agent stream reader failed: {}", e.what());
    }

    stream_open_ = false;
    peer_.fail_all_pending("Agent closed its output stream");
    if (running_)
        wait_for_exit_after_eof();
}

void StdioConnection::wait_for_exit_after_eof()
{
    auto deadline = std::chrono::steady_clock::now() + EOF_EXIT_GRACE;
    while (supervisor_->is_running() && !closing_ && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

    // The exit watcher reports real exits; this covers an agent that closed stdout and kept running
    if (supervisor_->is_running())
        report_closed(ConnectionFault{"Agent closed its output stream", std::nullopt});
}

void StdioConnection::handle_line(const std::string& line)
{
    json message;
    try
    {
        message = json::parse(line);
    }
    catch (const json::exception& e)
    {
        log::get()->warn("Skipping non-JSON line from agent ({}): {}", e.what(),
                         line.substr(0, 200));
        return;
    }

    try
    {
        switch (protocol::classify_message(message))
        {
        case protocol::MessageKind::Response:
            peer_.handle_response(message);
            break;
        case protocol::MessageKind::Notification:
            dispatch_notification(message);
            break;
        case protocol::MessageKind::Request:
            dispatch_request(message);
            break;
        case protocol::MessageKind::Invalid:
            log::get()->warn("Skipping invalid JSON-RPC message: {}", line.substr(0, 200));
            break;
        }
    }
    catch (const std::exception& e)
    {
        log::get()->error("Failed to handle agent message: {}", e.what());
    }
}

void StdioConnection::dispatch_notification(const json& message)
{
    const std::string method = message["method"].get<std::string>();
    const json params = message.value("params", json::object());

    if (method == protocol::METHOD_SESSION_UPDATE)
        handler_.session_update(protocol::parse_session_notification(params));
    else
        log::get()->debug("Ignoring agent notification: {}", method);
}

void StdioConnection::dispatch_request(const json& message)
{
    const json id = message["id"];
    const std::string method = message["method"].get<std::string>();
    const json params = message.value("params", json::object());

    std::string response;
    try
    {
        if (method == protocol::METHOD_REQUEST_PERMISSION)
            response = protocol::JsonRpcPeer::build_result_response(
                id, handler_.request_permission(params));
        else if (method == protocol::METHOD_READ_TEXT_FILE)
            response =
                protocol::JsonRpcPeer::build_result_response(id, handler_.read_text_file(params));
        else if (method == protocol::METHOD_WRITE_TEXT_FILE)
            response =
                protocol::JsonRpcPeer::build_result_response(id, handler_.write_text_file(params));
        else
            response = protocol::JsonRpcPeer::build_error_response(
                id, protocol::METHOD_NOT_FOUND, "Method not found: " + method);
    }
    catch (const std::exception& e)
    {
        response = protocol::JsonRpcPeer::build_error_response(id, protocol::INTERNAL_ERROR,
                                                               e.what());
    }

    write(response);
}

void StdioConnection::report_closed(ConnectionFault fault)
{
    if (closing_ || fault_reported_.exchange(true))
        return;

    stream_open_ = false;
    if (events_.on_closed)
    {
        try
        {
            events_.on_closed(fault);
        }
        catch (const std::exception& e)
        {
            log::get()->warn("Connection close handler threw: {}", e.what());
        }
    }
}

} // namespace internal

std::unique_ptr<AgentConnection> create_stdio_connection(const SpawnSpec& spec,
                                                         ClientHandler& handler,
                                                         ConnectionEvents events)
{
    return std::make_unique<internal::StdioConnection>(spec, handler, std::move(events));
}

} // namespace acpbridge
