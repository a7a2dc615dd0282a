#include "internal/executor.hpp"

#include <acpbridge/errors.hpp>
#include <acpbridge/logging.hpp>
#include <acpbridge/protocol/acp.hpp>
#include <acpbridge/runtime.hpp>
#include <acpbridge/timer.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <future>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>

namespace acpbridge
{

namespace
{
using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

constexpr const char* NO_RESPONSE = "No response received.";
constexpr const char* PROCESS_LABEL = "main-acp-runtime";

constexpr const char* CONTEXT_UPDATE_PREAMBLE =
    "[SYSTEM: CONTEXT UPDATE]\n"
    "The following is the result of a background task you previously scheduled. \n"
    "Please incorporate this into your current context. \n"
    "DO NOT respond to this message now. \n"
    "DO NOT generate any visible output or message chunks.\n"
    "Acknowledge silently and wait for the next user input.\n"
    "\n"
    "Result:\n";

std::string describe(const std::exception_ptr& error)
{
    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception& e)
    {
        return e.what();
    }
    catch (...)
    {
        return "unknown error";
    }
}

std::string trim(const std::string& text)
{
    constexpr const char* ws = " \t\n\r\f\v";
    auto begin = text.find_first_not_of(ws);
    if (begin == std::string::npos)
        return {};
    auto end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

// "/usr/local/bin/Gemini CLI" -> "gemini-cli"
std::string stderr_prefix_token(const std::string& command)
{
    auto slash = command.find_last_of("/\\");
    std::string token = slash == std::string::npos ? command : command.substr(slash + 1);
    if (token.empty())
        token = command;

    std::string out;
    bool in_space = false;
    for (unsigned char c : token)
    {
        if (std::isspace(c))
        {
            if (!in_space)
                out += '-';
            in_space = true;
            continue;
        }
        in_space = false;
        out += static_cast<char>(std::tolower(c));
    }
    return out;
}

// acp-<epoch ms>-<6 base36 chars>
std::string new_invocation_id()
{
    static thread_local std::mt19937 rng{std::random_device{}()};
    static const char* digits = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<int> pick(0, 35);

    auto now = std::chrono::duration_cast<milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();
    std::string suffix;
    for (int i = 0; i < 6; ++i)
        suffix += digits[pick(rng)];
    return "acp-" + std::to_string(now) + "-" + suffix;
}

std::string join(const std::vector<std::string>& items)
{
    std::ostringstream out;
    for (size_t i = 0; i < items.size(); ++i)
        out << (i ? " " : "") << items[i];
    return out.str();
}

bool transition_allowed(RuntimeState from, RuntimeState to)
{
    if (to == RuntimeState::ShuttingDown)
        return true;

    switch (from)
    {
    case RuntimeState::Idle:
    case RuntimeState::Error:
        return to == RuntimeState::Starting;
    case RuntimeState::Starting:
        return to == RuntimeState::Ready || to == RuntimeState::Error;
    case RuntimeState::Ready:
        return to == RuntimeState::Prompting;
    case RuntimeState::Prompting:
        return to == RuntimeState::Ready;
    case RuntimeState::ShuttingDown:
        return to == RuntimeState::Idle;
    }
    return false;
}
} // namespace

// ============================================================================
// AcpRuntime::Impl
// ============================================================================

class AcpRuntime::Impl : public ClientHandler
{
  public:
    Impl(std::shared_ptr<CliAgent> agent, RuntimeOptions options, RuntimeHooks hooks,
         ConnectionFactory factory)
        : agent_(std::move(agent)), options_(std::move(options)), hooks_(std::move(hooks)),
          factory_(factory ? std::move(factory) : ConnectionFactory(create_stdio_connection))
    {
        if (!agent_)
            throw ConfigError("AcpRuntime requires an agent");
        display_name_ = agent_->display_name();
        stderr_token_ = stderr_prefix_token(agent_->command());
    }

    ~Impl() override
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        prewarm_timer_.cancel();

        // Closing the connection first unblocks a handshake running on the executor
        try
        {
            shutdown("runtime destroyed");
        }
        catch (const std::exception& e)
        {
            log::get()->warn("AcpRuntime shutdown during destruction failed: {}", e.what());
        }
        executor_.shutdown();

        std::vector<std::shared_ptr<AgentConnection>> retired;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            retired.swap(retired_);
        }
        for (auto& conn : retired)
            terminate_connection(conn, "runtime destroyed", {});
    }

    // ------------------------------------------------------------------------
    // Session lifecycle
    // ------------------------------------------------------------------------

    void ensure_session()
    {
        if (hooks_.ensure_memory_file)
            hooks_.ensure_memory_file();

        std::shared_future<void> in_flight;
        std::shared_ptr<std::promise<void>> handshake;
        uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
                throw SessionStateError("AcpRuntime is closed");
            if (healthy_locked())
                return;

            if (handshake_)
            {
                in_flight = *handshake_;
            }
            else
            {
                if (state_ != RuntimeState::Idle && state_ != RuntimeState::Error)
                {
                    log::get()->error("Cannot ensure session in state {}", to_string(state_));
                    throw SessionStateError(std::string("Cannot ensure session in state ") +
                                            to_string(state_));
                }
                set_state_locked(RuntimeState::Starting);
                handshake = std::make_shared<std::promise<void>>();
                handshake_ = handshake->get_future().share();
                generation = ++generation_;
            }
        }

        if (!handshake)
        {
            in_flight.get();
            return;
        }

        try
        {
            initialize_session(generation);
            handshake->set_value();
        }
        catch (...)
        {
            // Waiters get the same failure; the owner rethrows it
            handshake->set_exception(std::current_exception());
            clear_handshake();
            throw;
        }
        clear_handshake();
    }

    void schedule_prewarm(const std::string& reason)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || prewarm_running_ || healthy_locked() || handshake_ ||
                prewarm_timer_.pending())
                return;
            prewarm_running_ = true;
        }

        log::get()->info("Triggering ACP prewarm reason={}", reason);
        if (!executor_.post([this] { run_prewarm(); }))
        {
            std::lock_guard<std::mutex> lock(mutex_);
            prewarm_running_ = false;
        }
    }

    void shutdown(const std::string& reason)
    {
        std::shared_ptr<AgentConnection> conn;
        std::string session_id;
        uint64_t generation;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id = session_id_;
            conn = detach_locked(reason);
            generation = generation_;
            if (active_)
                settle_locked(active_, {},
                              std::make_exception_ptr(PromptFailedError(
                                  display_name_ + " ACP runtime shutting down (" + reason + ")")));
        }

        if (conn)
            terminate_connection(conn, reason, session_id);

        std::lock_guard<std::mutex> lock(mutex_);
        if (generation_ == generation)
            set_state_locked(RuntimeState::Idle);
    }

    // ------------------------------------------------------------------------
    // Prompts
    // ------------------------------------------------------------------------

    std::string run_prompt(const std::string& text, ChunkCallback on_chunk)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            check_can_prompt_locked();
        }

        try
        {
            ensure_session();
        }
        catch (const std::exception&)
        {
            schedule_prewarm("prompt handshake failure");
            throw;
        }

        auto invocation = std::make_shared<Invocation>();
        std::shared_ptr<AgentConnection> conn;
        bool fresh_session = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            check_can_prompt_locked();
            if (!healthy_locked())
                throw SessionStateError("ACP session is not ready");

            set_state_locked(RuntimeState::Prompting);
            invocation->id = new_invocation_id();
            invocation->session_id = session_id_;
            invocation->generation = generation_;
            invocation->on_chunk = std::move(on_chunk);
            invocation->started_at = Clock::now();
            invocation->last_activity = invocation->started_at;
            active_ = invocation;
            conn = connection_;
            fresh_session = session_fresh_;
            session_fresh_ = false;
        }

        log::get()->info("Starting ACP prompt invocationId={} sessionId={} promptLength={}",
                         invocation->id, invocation->session_id, text.size());

        try
        {
            std::string prompt_text = text;
            if (hooks_.build_prompt_with_memory)
                prompt_text = hooks_.build_prompt_with_memory(text, fresh_session);

            conn->prompt(invocation->session_id, protocol::build_text_prompt(prompt_text),
                         [this, invocation](const std::string& stop_reason, std::exception_ptr error)
                         { on_prompt_done(invocation, stop_reason, error); });
        }
        catch (const ConnectionClosedError& e)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (invocation->generation == generation_)
                begin_fault_reset_locked(e.what(), std::nullopt);
            else
                settle_locked(invocation, {}, std::current_exception());
        }
        catch (const std::exception&)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            settle_locked(invocation, {}, std::current_exception());
        }

        return wait_for_settle(invocation, conn);
    }

    void cancel_active_prompt()
    {
        std::shared_ptr<AgentConnection> conn;
        std::string session_id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            conn = connection_;
            session_id = session_id_;
        }
        send_cancel(conn, session_id);
    }

    bool has_active_prompt() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_ == RuntimeState::Prompting && active_ != nullptr;
    }

    void request_manual_abort()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        manual_abort_ = true;
    }

    RuntimeStateSnapshot runtime_state() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        RuntimeStateSnapshot snapshot;
        snapshot.session_ready = !session_id_.empty() && (state_ == RuntimeState::Ready ||
                                                          state_ == RuntimeState::Prompting);
        snapshot.process_running = connection_ && connection_->is_alive();
        snapshot.state = state_;
        return snapshot;
    }

    bool append_context(const std::string& text)
    {
        std::shared_ptr<AgentConnection> conn;
        std::string session_id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!healthy_locked() || (state_ == RuntimeState::Prompting && active_))
                return false;
            conn = connection_;
            session_id = session_id_;
        }

        log::get()->info("Appending context to ACP session sessionId={} textLength={}", session_id,
                         text.size());
        try
        {
            conn->prompt(session_id, protocol::build_text_prompt(CONTEXT_UPDATE_PREAMBLE + text),
                         [](const std::string&, std::exception_ptr error)
                         {
                             if (error)
                                 log::get()->warn("Context update fire-and-forget failed error={}",
                                                  describe(error));
                         });
        }
        catch (const std::exception& e)
        {
            log::get()->warn("Failed to append context to ACP session error={}", e.what());
        }
        return true;
    }

    std::vector<std::string> agent_args() const
    {
        return agent_->build_acp_args();
    }

    const CliAgent& agent() const
    {
        return *agent_;
    }

    // ------------------------------------------------------------------------
    // ClientHandler
    // ------------------------------------------------------------------------

    json request_permission(const json& params) override
    {
        return protocol::build_permission_response(protocol::parse_permission_options(params),
                                                   options_.permission_strategy);
    }

    void session_update(const protocol::SessionNotification& notification) override
    {
        std::string chunk;
        ChunkCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto invocation = active_;
            if (!invocation || invocation->settled || notification.session_id != session_id_)
                return;

            auto now = Clock::now();
            invocation->last_activity = now;

            if (auto* thought = std::get_if<protocol::ThoughtChunk>(&notification.update))
            {
                if (options_.debug_stream)
                    log::get()->debug(
                        "ACP thought chunk sessionId={} thoughtLength={} thoughtPreview={}",
                        session_id_, thought->text.size(), thought->text.substr(0, 100));
                return;
            }

            auto* message = std::get_if<protocol::MessageChunk>(&notification.update);
            if (!message || message->text.empty())
                return;

            ++invocation->chunk_count;
            if (!invocation->first_chunk_at)
                invocation->first_chunk_at = now;
            if (options_.debug_stream)
                log::get()->debug("ACP chunk received invocationId={} chunkIndex={} "
                                  "chunkLength={} elapsedMs={} bufferLengthBeforeAppend={}",
                                  invocation->id, invocation->chunk_count, message->text.size(),
                                  elapsed_ms(invocation->started_at, now),
                                  invocation->response.size());
            invocation->response += message->text;
            chunk = message->text;
            callback = invocation->on_chunk;
        }

        if (options_.stream_stdout)
            std::cout << chunk << std::flush;

        if (callback)
        {
            try
            {
                callback(chunk);
            }
            catch (const std::exception& e)
            {
                log::get()->warn("Chunk callback threw: {}", e.what());
            }
        }
    }

    json read_text_file(const json& params) override
    {
        return protocol::no_op_file_operation(params);
    }

    json write_text_file(const json& params) override
    {
        return protocol::no_op_file_operation(params);
    }

  private:
    struct Invocation
    {
        std::string id;
        std::string session_id;
        uint64_t generation = 0;
        ChunkCallback on_chunk;

        std::string response;
        int chunk_count = 0;
        Clock::time_point started_at;
        Clock::time_point last_activity;
        std::optional<Clock::time_point> first_chunk_at;

        bool settled = false;
        std::string result;
        std::exception_ptr error;
    };

    static long long elapsed_ms(Clock::time_point from, Clock::time_point to)
    {
        return std::chrono::duration_cast<milliseconds>(to - from).count();
    }

    // ------------------------------------------------------------------------
    // State helpers (mutex_ held)
    // ------------------------------------------------------------------------

    bool set_state_locked(RuntimeState next)
    {
        if (state_ == next)
            return true;
        if (!transition_allowed(state_, next))
        {
            log::get()->warn("Refusing AcpRuntime state transition from={} to={} session={}",
                             to_string(state_), to_string(next), session_id_);
            return false;
        }
        log::get()->info("AcpRuntime state transition from={} to={} session={}", to_string(state_),
                         to_string(next), session_id_);
        state_ = next;
        return true;
    }

    bool healthy_locked() const
    {
        return (state_ == RuntimeState::Ready || state_ == RuntimeState::Prompting) &&
               connection_ && !session_id_.empty() && connection_->is_alive();
    }

    void check_can_prompt_locked() const
    {
        if (state_ == RuntimeState::Prompting)
            throw ConcurrentPromptError(
                "Cannot start a new prompt while another is already in progress.");
        if (state_ == RuntimeState::ShuttingDown)
            throw SessionStateError("Cannot start a new prompt while shutting down.");
    }

    // Move to SHUTTING_DOWN and take the connection out; events from it become stale
    std::shared_ptr<AgentConnection> detach_locked(const std::string& reason)
    {
        set_state_locked(RuntimeState::ShuttingDown);
        ++generation_;
        auto conn = std::move(connection_);
        connection_.reset();
        session_id_.clear();
        stderr_tail_.clear();
        if (conn)
            log::get()->debug("Detached agent connection reason={}", reason);
        return conn;
    }

    // By value: callers may pass active_, which is reset here
    void settle_locked(std::shared_ptr<Invocation> invocation, std::string result,
                       std::exception_ptr error)
    {
        if (invocation->settled)
            return;
        invocation->settled = true;
        invocation->result = std::move(result);
        invocation->error = error;
        manual_abort_ = false;

        if (active_ == invocation)
            active_.reset();
        if (state_ == RuntimeState::Prompting && invocation->generation == generation_)
            set_state_locked(RuntimeState::Ready);

        auto now = Clock::now();
        std::string first_chunk_delay =
            invocation->first_chunk_at
                ? std::to_string(elapsed_ms(invocation->started_at, *invocation->first_chunk_at))
                : "null";
        if (error)
            log::get()->info("ACP prompt failed invocationId={} sessionId={} chunkCount={} "
                             "firstChunkDelayMs={} elapsedMs={} error={}",
                             invocation->id, invocation->session_id, invocation->chunk_count,
                             first_chunk_delay, elapsed_ms(invocation->started_at, now),
                             describe(error));
        else
            log::get()->info("ACP prompt completed invocationId={} sessionId={} chunkCount={} "
                             "firstChunkDelayMs={} elapsedMs={} responseLength={}",
                             invocation->id, invocation->session_id, invocation->chunk_count,
                             first_chunk_delay, elapsed_ms(invocation->started_at, now),
                             invocation->result.size());
        cv_.notify_all();
    }

    /**
     * The agent process died or its stream broke.
     *
     * Fails the prompt in flight and detaches the connection. The runtime
     * is IDLE again before this returns; the detached connection is torn
     * down by the executor since this runs on the connection's own threads,
     * which cannot join themselves.
     */
    void begin_fault_reset_locked(const std::string& reason, std::optional<int> exit_code)
    {
        log::get()->error("{} ACP process closed ({})", display_name_, reason);

        std::string session_id = session_id_;
        auto conn = detach_locked("runtime-reset");
        set_state_locked(RuntimeState::Idle);

        if (active_)
            settle_locked(active_, {},
                          std::make_exception_ptr(AgentProcessError(
                              display_name_ + " ACP process exited during prompt: " + reason,
                              exit_code.value_or(-1))));

        bool posted = executor_.post(
            [this, conn, session_id]
            {
                log::get()->info("Resetting ACP runtime state");
                if (conn)
                    terminate_connection(conn, "runtime-reset", session_id);
                schedule_prewarm("runtime reset");
            });
        if (!posted && conn)
            retired_.push_back(conn);
    }

    // ------------------------------------------------------------------------
    // Handshake
    // ------------------------------------------------------------------------

    json resolve_mcp_servers(std::string& source) const
    {
        json servers = agent_->mcp_servers();
        if (servers.is_array() && !servers.empty())
        {
            source = "agent-config";
            log::get()->info("Using MCP servers from agent configuration count={}", servers.size());
            return servers;
        }

        source = "default-empty";
        if (options_.mcp_servers_json.empty())
            return json::array();

        try
        {
            json parsed = json::parse(options_.mcp_servers_json);
            if (parsed.is_array())
            {
                source = "env";
                return parsed;
            }
            log::get()->warn("Invalid ACP_MCP_SERVERS_JSON; using empty mcpServers array "
                             "error=expected a JSON array");
        }
        catch (const json::exception& e)
        {
            log::get()->warn("Invalid ACP_MCP_SERVERS_JSON; using empty mcpServers array error={}",
                             e.what());
        }
        return json::array();
    }

    std::string session_cwd() const
    {
        if (!options_.working_directory.empty())
            return options_.working_directory;
        std::error_code ec;
        auto cwd = std::filesystem::current_path(ec);
        return ec ? std::string(".") : cwd.string();
    }

    void initialize_session(uint64_t generation)
    {
        const auto args = agent_->build_acp_args();
        std::string mcp_source;
        const json mcp_servers = resolve_mcp_servers(mcp_source);

        std::vector<std::string> mcp_names;
        for (const auto& server : mcp_servers)
            if (server.is_object() && server.contains("name") && server["name"].is_string() &&
                !server["name"].get<std::string>().empty())
                mcp_names.push_back(server["name"].get<std::string>());

        log::get()->info("Starting {} ACP process command={} args=[{}]", display_name_,
                         agent_->command(), join(args));

        SpawnSpec spec;
        spec.command = agent_->command();
        spec.args = args;
        spec.working_directory = options_.working_directory;
        spec.environment = options_.environment;
        spec.max_message_bytes = options_.max_message_bytes;

        ConnectionEvents events;
        events.on_stderr = [this, generation](const std::string& text)
        { on_stderr(generation, text); };
        events.on_closed = [this, generation](const ConnectionFault& fault)
        { on_connection_closed(generation, fault); };

        std::shared_ptr<AgentConnection> conn;
        try
        {
            conn = std::shared_ptr<AgentConnection>(factory_(spec, *this, std::move(events)));
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (generation_ != generation)
                    throw SessionStateError("ACP session start was superseded by shutdown");
                stderr_tail_.clear();
                connection_ = conn;
            }

            conn->start();
            conn->initialize(json::object(), options_.handshake_timeout_ms);
            log::get()->info("ACP connection initialized");

            std::string session_id =
                conn->new_session(session_cwd(), mcp_servers, options_.handshake_timeout_ms);

            std::lock_guard<std::mutex> lock(mutex_);
            if (generation_ != generation)
                throw SessionStateError("ACP session start was superseded by shutdown");
            session_id_ = session_id;
            session_fresh_ = true;
            set_state_locked(RuntimeState::Ready);

            std::string names = mcp_names.empty() ? std::string("none") : join(mcp_names);
            log::get()->info("ACP session ready sessionId={} mcpServersMode={} mcpServersCount={} "
                             "mcpServerNames=[{}]",
                             session_id_, mcp_source, mcp_servers.size(), names);
        }
        catch (const ProcessSpawnError& e)
        {
            fail_handshake(generation, conn, e.what());
            throw;
        }
        catch (const SessionStateError& e)
        {
            fail_handshake(generation, conn, e.what());
            throw;
        }
        catch (const std::exception& e)
        {
            std::string base = e.what();
            std::string tail = fail_handshake(generation, conn, base);
            std::string hint;
            if (base.find("Internal error") != std::string::npos)
                hint = display_name_ +
                       " ACP newSession returned Internal error. This is often caused by a local "
                       "MCP server or skill initialization issue. Try launching the CLI directly "
                       "and checking MCP/skills diagnostics.";
            throw HandshakeError(hint.empty() ? base : base + ". " + hint, tail, hint);
        }
    }

    // Returns the stderr tail collected during the attempt
    std::string fail_handshake(uint64_t generation, const std::shared_ptr<AgentConnection>& conn,
                               const std::string& error)
    {
        std::string tail;
        bool owned = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tail = stderr_tail_;
            if (generation_ == generation)
            {
                owned = true;
                set_state_locked(RuntimeState::Error);
                connection_.reset();
                session_id_.clear();
                stderr_tail_.clear();
                ++generation_;
            }
        }

        log::get()->warn("ACP initialization failed error={} stderrTail={}", error,
                         tail.empty() ? std::string("(empty)") : tail);

        // A superseded attempt's connection already belongs to whoever detached it
        if (conn && owned)
            terminate_connection(conn, "handshake-failure", {});
        return tail;
    }

    void clear_handshake()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handshake_.reset();
    }

    void run_prewarm()
    {
        try
        {
            ensure_session();
            std::lock_guard<std::mutex> lock(mutex_);
            prewarm_attempts_ = 0;
            prewarm_running_ = false;
            log::get()->info("{} ACP prewarm complete", display_name_);
        }
        catch (const std::exception& e)
        {
            log::get()->warn("{} ACP prewarm failed error={}", display_name_, e.what());

            std::lock_guard<std::mutex> lock(mutex_);
            prewarm_running_ = false;
            ++prewarm_attempts_;
            if (options_.prewarm_max_retries > 0 &&
                prewarm_attempts_ >= options_.prewarm_max_retries)
            {
                log::get()->warn(
                    "{} ACP prewarm retries exhausted; stopping automatic retries attempts={} "
                    "maxRetries={}",
                    display_name_, prewarm_attempts_, options_.prewarm_max_retries);
                return;
            }

            if (options_.prewarm_retry_ms > 0 && !closed_)
                prewarm_timer_.arm(milliseconds(options_.prewarm_retry_ms),
                                   [this] { schedule_prewarm("retry"); });
        }
    }

    // ------------------------------------------------------------------------
    // Connection events
    // ------------------------------------------------------------------------

    void on_stderr(uint64_t generation, const std::string& text)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (generation != generation_)
                return;
            stderr_tail_ += text;
            if (stderr_tail_.size() > options_.stderr_tail_max_chars)
                stderr_tail_.erase(0, stderr_tail_.size() - options_.stderr_tail_max_chars);
            if (active_)
                active_->last_activity = Clock::now();
        }

        std::string line = trim(text);
        if (!line.empty())
            log::get()->error("[{}] {}", stderr_token_, line);
    }

    void on_connection_closed(uint64_t generation, const ConnectionFault& fault)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_)
            return;

        // A failing handshake reports through its own request errors
        if (state_ == RuntimeState::Starting)
        {
            log::get()->error("{} ACP process closed during startup ({})", display_name_,
                              fault.reason);
            return;
        }
        if (state_ == RuntimeState::Idle || state_ == RuntimeState::ShuttingDown)
            return;

        begin_fault_reset_locked(fault.reason, fault.exit_code);
    }

    void on_prompt_done(const std::shared_ptr<Invocation>& invocation,
                        const std::string& stop_reason, std::exception_ptr error)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (invocation->settled)
            return;

        if (options_.debug_stream)
            log::get()->debug("ACP prompt stop reason invocationId={} stopReason={} chunkCount={} "
                              "bufferedLength={}",
                              invocation->id, error ? "(error)" : stop_reason,
                              invocation->chunk_count, invocation->response.size());

        if (error)
        {
            try
            {
                std::rethrow_exception(error);
            }
            catch (const ConnectionClosedError& e)
            {
                if (invocation->generation == generation_)
                    begin_fault_reset_locked(e.what(), std::nullopt);
                else
                    settle_locked(invocation, {},
                                  std::make_exception_ptr(AgentProcessError(
                                      display_name_ + " ACP process exited during prompt: " +
                                          e.what(),
                                      -1)));
            }
            catch (const std::exception& e)
            {
                std::string message = e.what();
                if (message.empty())
                    message = display_name_ + " ACP prompt failed";
                settle_locked(invocation, {}, std::make_exception_ptr(PromptFailedError(message)));
            }
            catch (...)
            {
                settle_locked(invocation, {},
                              std::make_exception_ptr(
                                  PromptFailedError(display_name_ + " ACP prompt failed")));
            }
            return;
        }

        if (stop_reason == protocol::STOP_REASON_CANCELLED && invocation->response.empty())
        {
            bool manual = manual_abort_;
            std::string message = manual ? display_name_ + " ACP prompt was aborted by user"
                                         : display_name_ + " ACP prompt was cancelled";
            settle_locked(invocation, {},
                          std::make_exception_ptr(PromptCancelledError(message, manual)));
            return;
        }

        std::string result = invocation->response.empty() ? NO_RESPONSE : invocation->response;
        settle_locked(invocation, std::move(result), nullptr);
    }

    // ------------------------------------------------------------------------
    // Waiting, cancelling, terminating
    // ------------------------------------------------------------------------

    std::string wait_for_settle(const std::shared_ptr<Invocation>& invocation,
                                const std::shared_ptr<AgentConnection>& conn)
    {
        const auto overall_timeout = milliseconds(options_.timeout_ms);
        const auto no_output_timeout = milliseconds(options_.no_output_timeout_ms);
        const bool watch_output = options_.no_output_timeout_ms > 0;

        std::unique_lock<std::mutex> lock(mutex_);
        while (!invocation->settled)
        {
            const auto overall_deadline = invocation->started_at + overall_timeout;
            auto deadline = overall_deadline;
            if (watch_output)
                deadline = std::min(deadline, invocation->last_activity + no_output_timeout);

            cv_.wait_until(lock, deadline);
            if (invocation->settled)
                break;

            // Activity may have pushed the no-output deadline out; recompute
            const auto now = Clock::now();
            std::exception_ptr timeout_error;
            if (now >= overall_deadline)
                timeout_error = std::make_exception_ptr(
                    PromptTimeoutError(display_name_ + " ACP timed out after " +
                                       std::to_string(options_.timeout_ms) + "ms"));
            else if (watch_output && now >= invocation->last_activity + no_output_timeout)
                timeout_error = std::make_exception_ptr(PromptNoOutputTimeoutError(
                    display_name_ + " ACP produced no output for " +
                    std::to_string(options_.no_output_timeout_ms) + "ms"));

            if (!timeout_error)
                continue;

            lock.unlock();
            send_cancel(conn, invocation->session_id);
            lock.lock();
            settle_locked(invocation, {}, timeout_error);
        }

        if (invocation->error)
            std::rethrow_exception(invocation->error);
        return invocation->result;
    }

    void send_cancel(const std::shared_ptr<AgentConnection>& conn, const std::string& session_id)
    {
        if (!conn || session_id.empty())
            return;
        try
        {
            conn->cancel(session_id);
        }
        catch (const std::exception& e)
        {
            log::get()->debug("session/cancel failed sessionId={} error={}", session_id, e.what());
        }
    }

    void terminate_connection(const std::shared_ptr<AgentConnection>& conn,
                              const std::string& reason, const std::string& session_id)
    {
        const long pid = conn->pid();
        const int grace_ms = std::max(0, agent_->kill_grace_ms());
        log::get()->info("Sending SIGTERM to {} process processLabel={} pid={} graceMs={}",
                         display_name_, PROCESS_LABEL, pid, grace_ms);
        try
        {
            TerminationOutcome outcome = conn->close(milliseconds(grace_ms));
            log::get()->info("{} process termination finalized processLabel={} reason={} pid={} "
                             "outcome={} sessionId={}",
                             display_name_, PROCESS_LABEL, reason, pid, to_string(outcome),
                             session_id);
        }
        catch (const std::exception& e)
        {
            log::get()->error("{} process termination failed pid={} error={}", display_name_, pid,
                              e.what());
        }
    }

    std::shared_ptr<CliAgent> agent_;
    RuntimeOptions options_;
    RuntimeHooks hooks_;
    ConnectionFactory factory_;
    std::string display_name_;
    std::string stderr_token_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    RuntimeState state_ = RuntimeState::Idle;
    uint64_t generation_ = 0;
    std::shared_ptr<AgentConnection> connection_;
    std::string session_id_;
    // No prompt has been sent on session_id_ yet
    bool session_fresh_ = false;
    std::optional<std::shared_future<void>> handshake_;
    std::shared_ptr<Invocation> active_;
    bool manual_abort_ = false;
    std::string stderr_tail_;
    int prewarm_attempts_ = 0;
    bool prewarm_running_ = false;
    bool closed_ = false;
    std::vector<std::shared_ptr<AgentConnection>> retired_;

    internal::SerialExecutor executor_;
    Timer prewarm_timer_; // after executor_: its callback posts to it
};

// ============================================================================
// AcpRuntime
// ============================================================================

AcpRuntime::AcpRuntime(std::shared_ptr<CliAgent> agent, RuntimeOptions options, RuntimeHooks hooks,
                       ConnectionFactory factory)
    : impl_(std::make_unique<Impl>(std::move(agent), std::move(options), std::move(hooks),
                                   std::move(factory)))
{
}

AcpRuntime::~AcpRuntime() = default;

void AcpRuntime::ensure_session()
{
    impl_->ensure_session();
}

std::string AcpRuntime::run_prompt(const std::string& text, ChunkCallback on_chunk)
{
    return impl_->run_prompt(text, std::move(on_chunk));
}

void AcpRuntime::cancel_active_prompt()
{
    impl_->cancel_active_prompt();
}

bool AcpRuntime::has_active_prompt() const
{
    return impl_->has_active_prompt();
}

void AcpRuntime::request_manual_abort()
{
    impl_->request_manual_abort();
}

RuntimeStateSnapshot AcpRuntime::runtime_state() const
{
    return impl_->runtime_state();
}

bool AcpRuntime::append_context(const std::string& text)
{
    return impl_->append_context(text);
}

void AcpRuntime::schedule_prewarm(const std::string& reason)
{
    impl_->schedule_prewarm(reason);
}

void AcpRuntime::shutdown(const std::string& reason)
{
    impl_->shutdown(reason);
}

std::vector<std::string> AcpRuntime::agent_args() const
{
    return impl_->agent_args();
}

const CliAgent& AcpRuntime::agent() const
{
    return impl_->agent();
}

} // namespace acpbridge
