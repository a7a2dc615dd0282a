#include "../test_utils.hpp"

#include <acpbridge/context_queue.hpp>
#include <acpbridge/errors.hpp>
#include <acpbridge/runtime.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>

using namespace acpbridge;
using acpbridge::test::wait_until;
using namespace std::chrono_literals;

namespace
{

// ============================================================================
// In-process agent connection
// ============================================================================

// State shared by one FakeConnection and the test driving it
class FakeSession
{
  public:
    FakeSession(ClientHandler& handler, ConnectionEvents events, std::string session_id)
        : handler_(handler), events_(std::move(events)), session_id_(std::move(session_id))
    {
    }

    ~FakeSession()
    {
        join_responder();
    }

    const std::string& session_id() const
    {
        return session_id_;
    }

    ClientHandler& handler()
    {
        return handler_;
    }

    void chunk(const std::string& text)
    {
        handler_.session_update({session_id_, protocol::MessageChunk{text}});
    }

    void thought(const std::string& text)
    {
        handler_.session_update({session_id_, protocol::ThoughtChunk{text}});
    }

    void stderr_text(const std::string& text)
    {
        if (events_.on_stderr)
            events_.on_stderr(text);
    }

    void finish(const std::string& stop_reason)
    {
        if (auto done = take_pending())
            done(stop_reason, nullptr);
    }

    void fail(std::exception_ptr error)
    {
        if (auto done = take_pending())
            done({}, error);
    }

    // Process exit as observed by the connection: on_closed, then pending requests fail
    void crash(int exit_code)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            alive_ = false;
        }
        cv_.notify_all();
        if (events_.on_closed)
            events_.on_closed({"Agent process exited with code " + std::to_string(exit_code),
                               exit_code});
        fail(std::make_exception_ptr(ConnectionClosedError("Agent connection closed")));
    }

    // True once session/cancel arrived; false on timeout or close
    bool wait_for_cancel(std::chrono::milliseconds timeout = 5000ms)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return cancel_count_ > 0 || !alive_; });
        return cancel_count_ > 0 && alive_;
    }

    // Sleep unless the connection closes first; false when closed
    bool pause(std::chrono::milliseconds duration)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, duration, [this] { return !alive_; });
    }

    void record_prompt(const std::string& text, AgentConnection::PromptCallback done)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        prompts_.push_back(text);
        pending_ = std::move(done);
    }

    void record_cancel()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++cancel_count_;
        }
        cv_.notify_all();
    }

    void start_responder(std::function<void()> body)
    {
        join_responder();
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::thread(std::move(body));
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            alive_ = false;
            ++close_count_;
        }
        cv_.notify_all();
        join_responder();
        fail(std::make_exception_ptr(ConnectionClosedError("Agent connection closed")));
    }

    bool alive() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return alive_;
    }

    std::vector<std::string> prompts() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return prompts_;
    }

    int cancel_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancel_count_;
    }

    int close_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_count_;
    }

    json mcp_servers;
    std::string cwd;

  private:
    AgentConnection::PromptCallback take_pending()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        AgentConnection::PromptCallback done = std::move(pending_);
        pending_ = nullptr;
        return done;
    }

    void join_responder()
    {
        std::thread responder;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            responder = std::move(responder_);
        }
        if (!responder.joinable())
            return;
        if (responder.get_id() == std::this_thread::get_id())
            responder.detach();
        else
            responder.join();
    }

    ClientHandler& handler_;
    ConnectionEvents events_;
    std::string session_id_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool alive_ = true;
    int cancel_count_ = 0;
    int close_count_ = 0;
    std::vector<std::string> prompts_;
    AgentConnection::PromptCallback pending_;
    std::thread responder_;
};

// How every connection created by one factory behaves
struct FakeAgent
{
    std::chrono::milliseconds handshake_delay{0};
    bool fail_start = false;
    int failing_handshakes = 0; // session/new answers "Internal error" this many times
    std::string stderr_on_start;
    // Runs on a responder thread for each session/prompt; no script leaves the prompt pending
    std::function<void(FakeSession&, const std::string& text)> on_prompt;

    int spawn_count() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return static_cast<int>(sessions.size());
    }

    std::shared_ptr<FakeSession> latest() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return sessions.empty() ? nullptr : sessions.back();
    }

    SpawnSpec last_spec() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return spec;
    }

    ConnectionFactory factory();

    mutable std::mutex mutex;
    std::vector<std::shared_ptr<FakeSession>> sessions;
    SpawnSpec spec;
};

class FakeConnection : public AgentConnection
{
  public:
    FakeConnection(FakeAgent& agent, std::shared_ptr<FakeSession> session)
        : agent_(agent), session_(std::move(session))
    {
    }

    ~FakeConnection() override
    {
        if (!closed_)
            session_->close();
    }

    void start() override
    {
        if (agent_.fail_start)
            throw ProcessSpawnError("Failed to start 'fake-agent': No such file or directory",
                                    "fake-agent");
        if (!agent_.stderr_on_start.empty())
            session_->stderr_text(agent_.stderr_on_start);
    }

    json initialize(const json&, int) override
    {
        if (agent_.handshake_delay.count() > 0)
            std::this_thread::sleep_for(agent_.handshake_delay);
        if (!session_->alive())
            throw ConnectionClosedError("Agent connection closed");
        return {{"protocolVersion", 1}};
    }

    std::string new_session(const std::string& cwd, const json& mcp_servers, int) override
    {
        {
            std::lock_guard<std::mutex> lock(agent_.mutex);
            if (agent_.failing_handshakes > 0)
            {
                --agent_.failing_handshakes;
                throw RpcError("Internal error", -32603);
            }
        }
        session_->cwd = cwd;
        session_->mcp_servers = mcp_servers;
        return session_->session_id();
    }

    void prompt(const std::string& session_id, const json& content, PromptCallback done) override
    {
        if (!session_->alive())
            throw ConnectionClosedError("Agent connection closed");
        EXPECT_EQ(session_id, session_->session_id());
        std::string text = content.at(0).at("text").get<std::string>();
        session_->record_prompt(text, std::move(done));

        if (agent_.on_prompt)
        {
            auto script = agent_.on_prompt;
            auto session = session_;
            session_->start_responder([script, session, text] { script(*session, text); });
        }
    }

    void cancel(const std::string&) override
    {
        session_->record_cancel();
    }

    bool is_alive() const override
    {
        return session_->alive();
    }

    long pid() const override
    {
        return 4242;
    }

    TerminationOutcome close(std::chrono::milliseconds) override
    {
        bool was_alive = session_->alive();
        closed_ = true;
        session_->close();
        return was_alive ? TerminationOutcome::Exit : TerminationOutcome::AlreadyExited;
    }

  private:
    FakeAgent& agent_;
    std::shared_ptr<FakeSession> session_;
    bool closed_ = false;
};

ConnectionFactory FakeAgent::factory()
{
    return [this](const SpawnSpec& spawn, ClientHandler& handler, ConnectionEvents events)
    {
        std::shared_ptr<FakeSession> session;
        {
            std::lock_guard<std::mutex> lock(mutex);
            spec = spawn;
            session = std::make_shared<FakeSession>(
                handler, std::move(events), "session-" + std::to_string(sessions.size() + 1));
            sessions.push_back(session);
        }
        return std::make_unique<FakeConnection>(*this, session);
    };
}

RuntimeOptions fast_options()
{
    RuntimeOptions options;
    options.working_directory = "/tmp";
    options.timeout_ms = 10000;
    options.no_output_timeout_ms = 0;
    options.handshake_timeout_ms = 2000;
    options.prewarm_retry_ms = 0;
    return options;
}

std::unique_ptr<AcpRuntime> make_runtime(FakeAgent& agent, RuntimeOptions options = fast_options(),
                                         RuntimeHooks hooks = {})
{
    CliAgentConfig config;
    config.command = "fake-agent";
    config.kill_grace_ms = 100;
    return std::make_unique<AcpRuntime>(create_cli_agent(AgentType::Gemini, config),
                                        std::move(options), std::move(hooks), agent.factory());
}

} // namespace

// ============================================================================
// Session lifecycle
// ============================================================================

TEST(RuntimeTest, StartsIdleWithoutProcess)
{
    FakeAgent agent;
    auto runtime = make_runtime(agent);

    auto snapshot = runtime->runtime_state();
    EXPECT_EQ(snapshot.state, RuntimeState::Idle);
    EXPECT_FALSE(snapshot.session_ready);
    EXPECT_FALSE(snapshot.process_running);
    EXPECT_EQ(agent.spawn_count(), 0);
}

TEST(RuntimeTest, EnsureSessionSpawnsAgentOnce)
{
    FakeAgent agent;
    agent.handshake_delay = 200ms;
    auto runtime = make_runtime(agent);

    std::vector<std::thread> callers;
    std::atomic<int> succeeded{0};
    for (int i = 0; i < 5; ++i)
    {
        callers.emplace_back(
            [&]
            {
                runtime->ensure_session();
                ++succeeded;
            });
    }
    for (auto& caller : callers)
        caller.join();

    EXPECT_EQ(succeeded.load(), 5);
    EXPECT_EQ(agent.spawn_count(), 1);

    auto snapshot = runtime->runtime_state();
    EXPECT_EQ(snapshot.state, RuntimeState::Ready);
    EXPECT_TRUE(snapshot.session_ready);
    EXPECT_TRUE(snapshot.process_running);

    // Already healthy: no new process
    runtime->ensure_session();
    EXPECT_EQ(agent.spawn_count(), 1);
}

TEST(RuntimeTest, SpawnSpecCarriesAgentCommandAndOptions)
{
    FakeAgent agent;
    RuntimeOptions options = fast_options();
    options.environment["FAKE_MODE"] = "echo";
    options.mcp_servers_json = R"([{"name":"files","command":"mcp-files","args":[],"env":[]}])";
    auto runtime = make_runtime(agent, options);

    runtime->ensure_session();

    SpawnSpec spec = agent.last_spec();
    EXPECT_EQ(spec.command, "fake-agent");
    EXPECT_EQ(spec.args, runtime->agent_args());
    EXPECT_EQ(spec.args.front(), "--experimental-acp");
    EXPECT_EQ(spec.working_directory, "/tmp");
    EXPECT_EQ(spec.environment.at("FAKE_MODE"), "echo");

    auto session = agent.latest();
    EXPECT_EQ(session->cwd, "/tmp");
    ASSERT_EQ(session->mcp_servers.size(), 1u);
    EXPECT_EQ(session->mcp_servers[0]["name"], "files");
}

TEST(RuntimeTest, InvalidMcpServersJsonFallsBackToEmpty)
{
    test::LogCapture logs;
    FakeAgent agent;
    RuntimeOptions options = fast_options();
    options.mcp_servers_json = R"({"name":"not-an-array"})";
    auto runtime = make_runtime(agent, options);

    runtime->ensure_session();

    EXPECT_EQ(agent.latest()->mcp_servers, json::array());
    EXPECT_TRUE(logs.contains("Invalid ACP_MCP_SERVERS_JSON"));
}

TEST(RuntimeTest, EnsureSessionRunsMemoryHook)
{
    FakeAgent agent;
    std::atomic<int> calls{0};
    RuntimeHooks hooks;
    hooks.ensure_memory_file = [&] { ++calls; };
    auto runtime = make_runtime(agent, fast_options(), hooks);

    runtime->ensure_session();
    runtime->ensure_session();
    EXPECT_EQ(calls.load(), 2);
}

TEST(RuntimeTest, SpawnFailureLeavesErrorState)
{
    FakeAgent agent;
    agent.fail_start = true;
    auto runtime = make_runtime(agent);

    EXPECT_THROW(runtime->ensure_session(), ProcessSpawnError);
    EXPECT_EQ(runtime->runtime_state().state, RuntimeState::Error);
    EXPECT_FALSE(runtime->runtime_state().process_running);

    // A direct ensure_session() failure schedules no retry of its own
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(agent.spawn_count(), 1);
    EXPECT_EQ(runtime->runtime_state().state, RuntimeState::Error);

    // ERROR allows a fresh attempt
    agent.fail_start = false;
    runtime->ensure_session();
    EXPECT_EQ(runtime->runtime_state().state, RuntimeState::Ready);
}

TEST(RuntimeTest, InternalErrorHandshakeCarriesHintAndStderr)
{
    test::LogCapture logs;
    FakeAgent agent;
    agent.failing_handshakes = 1;
    agent.stderr_on_start = "mcp server 'files' failed to start\n";
    auto runtime = make_runtime(agent);

    try
    {
        runtime->ensure_session();
        FAIL() << "expected HandshakeError";
    }
    catch (const HandshakeError& e)
    {
        EXPECT_NE(std::string(e.what()).find("Internal error"), std::string::npos);
        EXPECT_NE(e.hint().find("MCP server"), std::string::npos);
        EXPECT_NE(e.stderr_tail().find("failed to start"), std::string::npos);
    }

    EXPECT_EQ(runtime->runtime_state().state, RuntimeState::Error);
    EXPECT_EQ(agent.latest()->close_count(), 1);
    EXPECT_TRUE(logs.contains("ACP initialization failed"));
    EXPECT_TRUE(logs.contains("mcp server 'files' failed to start"));

    runtime->ensure_session();
    EXPECT_EQ(agent.spawn_count(), 2);
    EXPECT_EQ(runtime->runtime_state().state, RuntimeState::Ready);
}

// ============================================================================
// Prompts
// ============================================================================

TEST(RuntimeTest, PromptStreamsMessageChunksOnly)
{
    FakeAgent agent;
    agent.on_prompt = [](FakeSession& session, const std::string&)
    {
        session.chunk("Hello");
        session.thought("planning the answer");
        session.chunk(", world");
        session.finish("end_turn");
    };
    auto runtime = make_runtime(agent);

    std::vector<std::string> chunks;
    std::string reply = runtime->run_prompt(
        "hi", [&](const std::string& chunk) { chunks.push_back(chunk); });

    EXPECT_EQ(reply, "Hello, world");
    EXPECT_EQ(chunks, (std::vector<std::string>{"Hello", ", world"}));
    EXPECT_EQ(runtime->runtime_state().state, RuntimeState::Ready);
    EXPECT_FALSE(runtime->has_active_prompt());
}

TEST(RuntimeTest, PromptIsDecoratedByMemoryHook)
{
    FakeAgent agent;
    agent.on_prompt = [](FakeSession& session, const std::string& text)
    {
        session.chunk(text);
        session.finish("end_turn");
    };
    RuntimeHooks hooks;
    hooks.build_prompt_with_memory = [](const std::string& text, bool)
    { return "[memory]\n" + text; };
    auto runtime = make_runtime(agent, fast_options(), hooks);

    EXPECT_EQ(runtime->run_prompt("question"), "[memory]\nquestion");
    EXPECT_EQ(agent.latest()->prompts(), (std::vector<std::string>{"[memory]\nquestion"}));
}

TEST(RuntimeTest, MemoryHookSeesFreshSessionOncePerSession)
{
    FakeAgent agent;
    agent.on_prompt = [](FakeSession& session, const std::string& text)
    {
        if (text == "crash")
        {
            session.crash(1);
            return;
        }
        session.chunk("ok");
        session.finish("end_turn");
    };

    std::mutex mutex;
    std::vector<bool> fresh_flags;
    RuntimeHooks hooks;
    hooks.build_prompt_with_memory = [&](const std::string& text, bool fresh_session)
    {
        std::lock_guard<std::mutex> lock(mutex);
        fresh_flags.push_back(fresh_session);
        return text;
    };
    auto runtime = make_runtime(agent, fast_options(), hooks);

    runtime->run_prompt("first");
    runtime->run_prompt("second");
    EXPECT_THROW(runtime->run_prompt("crash"), AgentProcessError);
    runtime->run_prompt("after restart");

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(fresh_flags, (std::vector<bool>{true, false, false, true}));
}

TEST(RuntimeTest, QueuedContextReachesFirstPromptOfNewSession)
{
    test::TempDir home;
    ContextQueue pending(home.str());
    pending.append(make_context_entry("job-7", "nightly build finished"));

    FakeAgent agent;
    agent.on_prompt = [](FakeSession& session, const std::string&)
    {
        session.chunk("ok");
        session.finish("end_turn");
    };
    RuntimeHooks hooks;
    hooks.build_prompt_with_memory = [&pending](const std::string& text, bool fresh_session)
    {
        if (!fresh_session)
            return text;
        std::string queued = format_for_prompt(pending.load_and_clear());
        return queued.empty() ? text : queued + "\n\n" + text;
    };
    auto runtime = make_runtime(agent, fast_options(), hooks);

    // Prewarmed sessions still count as fresh until their first prompt
    runtime->ensure_session();
    runtime->run_prompt("status?");
    runtime->run_prompt("thanks");

    auto prompts = agent.latest()->prompts();
    ASSERT_EQ(prompts.size(), 2u);
    EXPECT_EQ(prompts[0].rfind("Pending context from recent background jobs:\n", 0), 0u);
    EXPECT_NE(prompts[0].find("nightly build finished"), std::string::npos);
    EXPECT_EQ(prompts[0].substr(prompts[0].size() - 9), "\n\nstatus?");
    EXPECT_EQ(prompts[1], "thanks");
    EXPECT_TRUE(pending.load_and_clear().empty());
}

TEST(RuntimeTest, EmptyResponseBecomesPlaceholder)
{
    FakeAgent agent;
    agent.on_prompt = [](FakeSession& session, const std::string&) { session.finish("end_turn"); };
    auto runtime = make_runtime(agent);

    EXPECT_EQ(runtime->run_prompt("hi"), "No response received.");
}

TEST(RuntimeTest, UpdatesForOtherSessionsAreIgnored)
{
    FakeAgent agent;
    agent.on_prompt = [](FakeSession& session, const std::string&)
    {
        session.handler().session_update({"stale-session", protocol::MessageChunk{"stale"}});
        session.chunk("fresh");
        session.finish("end_turn");
    };
    auto runtime = make_runtime(agent);

    EXPECT_EQ(runtime->run_prompt("hi"), "fresh");
}

TEST(RuntimeTest, ThrowingChunkCallbackDoesNotFailPrompt)
{
    test::LogCapture logs;
    FakeAgent agent;
    agent.on_prompt = [](FakeSession& session, const std::string&)
    {
        session.chunk("a");
        session.chunk("b");
        session.finish("end_turn");
    };
    auto runtime = make_runtime(agent);

    std::string reply =
        runtime->run_prompt("hi", [](const std::string&) { throw std::runtime_error("ui gone"); });

    EXPECT_EQ(reply, "ab");
    EXPECT_TRUE(logs.contains("Chunk callback threw: ui gone"));
}

TEST(RuntimeTest, SecondPromptIsRejectedWithoutStateChange)
{
    FakeAgent agent;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    agent.on_prompt = [released](FakeSession& session, const std::string&)
    {
        released.wait();
        session.chunk("done");
        session.finish("end_turn");
    };
    auto runtime = make_runtime(agent);

    auto first = std::async(std::launch::async, [&] { return runtime->run_prompt("first"); });
    ASSERT_TRUE(wait_until([&] { return runtime->has_active_prompt(); }));

    try
    {
        runtime->run_prompt("second");
        FAIL() << "expected ConcurrentPromptError";
    }
    catch (const ConcurrentPromptError& e)
    {
        EXPECT_STREQ(e.what(), "Cannot start a new prompt while another is already in progress.");
    }
    EXPECT_EQ(runtime->runtime_state().state, RuntimeState::Prompting);
    EXPECT_EQ(agent.latest()->prompts().size(), 1u);

    release.set_value();
    EXPECT_EQ(first.get(), "done");
    EXPECT_EQ(runtime->runtime_state().state, RuntimeState::Ready);
}

TEST(RuntimeTest, PromptRpcErrorFailsPromptButKeepsSession)
{
    FakeAgent agent;
    agent.on_prompt = [](FakeSession& session, const std::string&)
    { session.fail(std::make_exception_ptr(RpcError("quota exceeded", -32000))); };
    auto runtime = make_runtime(agent);

    try
    {
        runtime->run_prompt("hi");
        FAIL() << "expected PromptFailedError";
    }
    catch (const PromptFailedError& e)
    {
        EXPECT_STREQ(e.what(), "quota exceeded");
    }
    EXPECT_EQ(runtime->runtime_state().state, RuntimeState::Ready);
    EXPECT_EQ(agent.spawn_count(), 1);
}

TEST(RuntimeTest, PermissionRequestsFollowStrategy)
{
    FakeAgent agent;
    agent.on_prompt = [](FakeSession& session, const std::string&)
    {
        json params = {{"sessionId", session.session_id()},
                       {"options",
                        {{{"optionId", "no"}, {"kind", "reject_once"}, {"name", "Reject"}},
                         {{"optionId", "yes"}, {"kind", "allow_once"}, {"name", "Allow"}}}}};
        json response = session.handler().request_permission(params);
        session.chunk(response["outcome"].value("optionId", std::string("none")));
        session.finish("end_turn");
    };
    auto runtime = make_runtime(agent);

    EXPECT_EQ(runtime->run_prompt("write a file"), "yes");
}

// ============================================================================
// Timeouts
// ============================================================================

TEST(RuntimeTest, OverallTimeoutCancelsPrompt)
{
    FakeAgent agent;
    agent.on_prompt = [](FakeSession& session, const std::string&)
    {
        if (session.wait_for_cancel())
            session.finish("cancelled");
    };
    RuntimeOptions options = fast_options();
    options.timeout_ms = 300;
    auto runtime = make_runtime(agent, options);

    auto started = std::chrono::steady_clock::now();
    try
    {
        runtime->run_prompt("hi");
        FAIL() << "expected PromptTimeoutError";
    }
    catch (const PromptTimeoutError& e)
    {
        EXPECT_NE(std::string(e.what()).find("timed out after 300ms"), std::string::npos);
    }
    auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_GE(elapsed, 290ms);
    EXPECT_LT(elapsed, 3000ms);

    EXPECT_TRUE(wait_until([&] { return agent.latest()->cancel_count() == 1; }));
    EXPECT_EQ(runtime->runtime_state().state, RuntimeState::Ready);
}

TEST(RuntimeTest, SteadyOutputKeepsNoOutputTimerAlive)
{
    FakeAgent agent;
    agent.on_prompt = [](FakeSession& session, const std::string&)
    {
        for (int i = 1; i <= 4; ++i)
        {
            if (!session.pause(250ms))
                return;
            session.chunk(std::to_string(i));
        }
        session.finish("end_turn");
    };
    RuntimeOptions options = fast_options();
    options.no_output_timeout_ms = 500;
    auto runtime = make_runtime(agent, options);

    // Four fragments span about a second, twice the no-output window
    EXPECT_EQ(runtime->run_prompt("count"), "1234");
    EXPECT_EQ(agent.latest()->cancel_count(), 0);
}

TEST(RuntimeTest, SilenceAfterOutputTriggersNoOutputTimeout)
{
    FakeAgent agent;
    std::atomic<long long> last_chunk_ns{0};
    agent.on_prompt = [&last_chunk_ns](FakeSession& session, const std::string&)
    {
        session.chunk("partial");
        last_chunk_ns = std::chrono::steady_clock::now().time_since_epoch().count();
        if (session.wait_for_cancel())
            session.finish("cancelled");
    };
    RuntimeOptions options = fast_options();
    options.no_output_timeout_ms = 300;
    auto runtime = make_runtime(agent, options);

    try
    {
        runtime->run_prompt("hi");
        FAIL() << "expected PromptNoOutputTimeoutError";
    }
    catch (const PromptNoOutputTimeoutError& e)
    {
        EXPECT_NE(std::string(e.what()).find("produced no output for 300ms"), std::string::npos);
    }
    auto since_last_chunk = std::chrono::steady_clock::now().time_since_epoch() -
                            std::chrono::steady_clock::duration(last_chunk_ns.load());
    EXPECT_GE(since_last_chunk, 290ms);
    EXPECT_TRUE(wait_until([&] { return agent.latest()->cancel_count() == 1; }));
}

TEST(RuntimeTest, ThoughtsDoNotCountAsOutput)
{
    FakeAgent agent;
    agent.on_prompt = [](FakeSession& session, const std::string&)
    {
        session.thought("thinking");
        if (session.wait_for_cancel())
            session.finish("cancelled");
    };
    RuntimeOptions options = fast_options();
    options.no_output_timeout_ms = 200;
    auto runtime = make_runtime(agent, options);

    EXPECT_THROW(runtime->run_prompt("hi"), PromptNoOutputTimeoutError);
}

TEST(RuntimeTest, StderrActivityCountsAsOutput)
{
    FakeAgent agent;
    agent.on_prompt = [](FakeSession& session, const std::string&)
    {
        for (int i = 0; i < 4; ++i)
        {
            if (!session.pause(150ms))
                return;
            session.stderr_text("working...\n");
        }
        session.chunk("ok");
        session.finish("end_turn");
    };
    RuntimeOptions options = fast_options();
    options.no_output_timeout_ms = 300;
    auto runtime = make_runtime(agent, options);

    EXPECT_EQ(runtime->run_prompt("hi"), "ok");
}

// ============================================================================
// Cancellation
// ============================================================================

TEST(RuntimeTest, ExternalCancelWithoutOutput)
{
    FakeAgent agent;
    agent.on_prompt = [](FakeSession& session, const std::string&)
    {
        if (session.wait_for_cancel())
            session.finish("cancelled");
    };
    auto runtime = make_runtime(agent);

    auto prompt = std::async(std::launch::async, [&] { return runtime->run_prompt("hi"); });
    ASSERT_TRUE(wait_until([&] { return runtime->has_active_prompt(); }));
    runtime->cancel_active_prompt();

    try
    {
        prompt.get();
        FAIL() << "expected PromptCancelledError";
    }
    catch (const PromptCancelledError& e)
    {
        EXPECT_FALSE(e.is_manual());
        EXPECT_NE(std::string(e.what()).find("was cancelled"), std::string::npos);
    }
    EXPECT_EQ(runtime->runtime_state().state, RuntimeState::Ready);
}

TEST(RuntimeTest, ManualAbortIsReportedAsSuch)
{
    FakeAgent agent;
    agent.on_prompt = [](FakeSession& session, const std::string&)
    {
        if (session.wait_for_cancel())
            session.finish("cancelled");
    };
    auto runtime = make_runtime(agent);

    auto prompt = std::async(std::launch::async, [&] { return runtime->run_prompt("hi"); });
    ASSERT_TRUE(wait_until([&] { return runtime->has_active_prompt(); }));
    runtime->request_manual_abort();
    runtime->cancel_active_prompt();

    try
    {
        prompt.get();
        FAIL() << "expected PromptCancelledError";
    }
    catch (const PromptCancelledError& e)
    {
        EXPECT_TRUE(e.is_manual());
        EXPECT_NE(std::string(e.what()).find("aborted by user"), std::string::npos);
    }
}

TEST(RuntimeTest, CancelAfterPartialOutputReturnsText)
{
    FakeAgent agent;
    agent.on_prompt = [](FakeSession& session, const std::string&)
    {
        session.chunk("half an answer");
        if (session.wait_for_cancel())
            session.finish("cancelled");
    };
    auto runtime = make_runtime(agent);

    std::atomic<bool> got_chunk{false};
    auto prompt = std::async(std::launch::async,
                             [&]
                             {
                                 return runtime->run_prompt(
                                     "hi", [&](const std::string&) { got_chunk = true; });
                             });
    ASSERT_TRUE(wait_until([&] { return got_chunk.load(); }));
    runtime->cancel_active_prompt();

    EXPECT_EQ(prompt.get(), "half an answer");
}

TEST(RuntimeTest, CancelWithoutSessionIsNoOp)
{
    FakeAgent agent;
    auto runtime = make_runtime(agent);
    runtime->cancel_active_prompt();
    EXPECT_EQ(agent.spawn_count(), 0);
}

// ============================================================================
// Faults and recovery
// ============================================================================

TEST(RuntimeTest, ProcessExitDuringPromptResetsAndPrewarms)
{
    test::LogCapture logs;
    FakeAgent agent;
    agent.on_prompt = [](FakeSession& session, const std::string& text)
    {
        if (text != "crash")
        {
            session.chunk("fine");
            session.finish("end_turn");
            return;
        }
        session.chunk("partial");
        session.crash(3);
    };
    auto runtime = make_runtime(agent);

    try
    {
        runtime->run_prompt("crash");
        FAIL() << "expected AgentProcessError";
    }
    catch (const AgentProcessError& e)
    {
        EXPECT_EQ(e.exit_code(), 3);
        EXPECT_NE(std::string(e.what()).find("ACP process exited during prompt"),
                  std::string::npos);
    }

    // Torn down to IDLE, then a fresh process is prewarmed
    ASSERT_TRUE(wait_until(
        [&]
        {
            return agent.spawn_count() == 2 &&
                   runtime->runtime_state().state == RuntimeState::Ready;
        }));
    EXPECT_TRUE(logs.contains("Resetting ACP runtime state"));
    EXPECT_TRUE(logs.contains("from=SHUTTING_DOWN to=IDLE"));
    {
        std::lock_guard<std::mutex> lock(agent.mutex);
        EXPECT_EQ(agent.sessions.front()->close_count(), 1);
    }

    EXPECT_EQ(runtime->run_prompt("again"), "fine");
    EXPECT_EQ(agent.latest()->session_id(), "session-2");
}

TEST(RuntimeTest, ProcessExitLeavesRuntimeIdleWithoutWaiting)
{
    FakeAgent agent;
    agent.on_prompt = [](FakeSession& session, const std::string& text)
    {
        if (text == "crash")
        {
            session.crash(3);
            return;
        }
        session.chunk("fine");
        session.finish("end_turn");
    };
    auto runtime = make_runtime(agent);

    EXPECT_THROW(runtime->run_prompt("crash"), AgentProcessError);

    // Already out of SHUTTING_DOWN; a prewarm may have started meanwhile
    auto state = runtime->runtime_state().state;
    EXPECT_TRUE(state == RuntimeState::Idle || state == RuntimeState::Starting ||
                state == RuntimeState::Ready)
        << to_string(state);
    EXPECT_FALSE(runtime->runtime_state().session_ready && state == RuntimeState::Idle);

    // The next queued message goes straight through
    try
    {
        EXPECT_EQ(runtime->run_prompt("next"), "fine");
    }
    catch (const SessionStateError& e)
    {
        FAIL() << "next prompt rejected: " << e.what();
    }
}

TEST(RuntimeTest, ProcessExitWhileIdleAlsoRecovers)
{
    FakeAgent agent;
    auto runtime = make_runtime(agent);
    runtime->ensure_session();

    agent.latest()->crash(1);

    ASSERT_TRUE(wait_until(
        [&]
        {
            return agent.spawn_count() == 2 &&
                   runtime->runtime_state().state == RuntimeState::Ready;
        }));
}

TEST(RuntimeTest, ShutdownFailsActivePrompt)
{
    FakeAgent agent;
    agent.on_prompt = [](FakeSession& session, const std::string&) { session.wait_for_cancel(); };
    auto runtime = make_runtime(agent);

    auto prompt = std::async(std::launch::async, [&] { return runtime->run_prompt("hi"); });
    ASSERT_TRUE(wait_until([&] { return runtime->has_active_prompt(); }));

    runtime->shutdown("test");

    try
    {
        prompt.get();
        FAIL() << "expected PromptFailedError";
    }
    catch (const PromptFailedError& e)
    {
        EXPECT_NE(std::string(e.what()).find("shutting down (test)"), std::string::npos);
    }

    auto snapshot = runtime->runtime_state();
    EXPECT_EQ(snapshot.state, RuntimeState::Idle);
    EXPECT_FALSE(snapshot.process_running);
    EXPECT_EQ(agent.latest()->close_count(), 1);

    // The runtime can start again after shutdown
    runtime->ensure_session();
    EXPECT_EQ(agent.spawn_count(), 2);
}

// ============================================================================
// Context injection
// ============================================================================

TEST(RuntimeTest, AppendContextNeedsIdleSession)
{
    FakeAgent agent;
    auto runtime = make_runtime(agent);

    EXPECT_FALSE(runtime->append_context("build finished"));

    runtime->ensure_session();
    EXPECT_TRUE(runtime->append_context("build finished"));

    auto prompts = agent.latest()->prompts();
    ASSERT_EQ(prompts.size(), 1u);
    EXPECT_EQ(prompts[0].rfind("[SYSTEM: CONTEXT UPDATE]", 0), 0u);
    EXPECT_NE(prompts[0].find("build finished"), std::string::npos);
    EXPECT_EQ(runtime->runtime_state().state, RuntimeState::Ready);
}

TEST(RuntimeTest, AppendContextRefusedWhilePrompting)
{
    FakeAgent agent;
    agent.on_prompt = [](FakeSession& session, const std::string&)
    {
        if (session.wait_for_cancel())
            session.finish("cancelled");
    };
    auto runtime = make_runtime(agent);

    auto prompt = std::async(std::launch::async, [&] { return runtime->run_prompt("hi"); });
    ASSERT_TRUE(wait_until([&] { return runtime->has_active_prompt(); }));

    EXPECT_FALSE(runtime->append_context("late news"));

    runtime->cancel_active_prompt();
    EXPECT_THROW(prompt.get(), PromptCancelledError);
}

// ============================================================================
// Prewarm
// ============================================================================

TEST(RuntimeTest, PrewarmStartsSessionInBackground)
{
    FakeAgent agent;
    auto runtime = make_runtime(agent);

    runtime->schedule_prewarm("startup");
    runtime->schedule_prewarm("startup again");

    ASSERT_TRUE(wait_until([&] { return runtime->runtime_state().session_ready; }));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(agent.spawn_count(), 1);

    // Healthy session: nothing to do
    runtime->schedule_prewarm("noop");
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(agent.spawn_count(), 1);
}

TEST(RuntimeTest, PrewarmRetriesUntilSuccess)
{
    FakeAgent agent;
    agent.failing_handshakes = 2;
    RuntimeOptions options = fast_options();
    options.prewarm_retry_ms = 50;
    auto runtime = make_runtime(agent, options);

    runtime->schedule_prewarm("startup");

    ASSERT_TRUE(wait_until([&] { return runtime->runtime_state().session_ready; }));
    EXPECT_EQ(agent.spawn_count(), 3);
}

TEST(RuntimeTest, PrewarmStopsAfterMaxRetries)
{
    test::LogCapture logs;
    FakeAgent agent;
    agent.failing_handshakes = 100;
    RuntimeOptions options = fast_options();
    options.prewarm_retry_ms = 30;
    options.prewarm_max_retries = 3;
    auto runtime = make_runtime(agent, options);

    runtime->schedule_prewarm("startup");

    ASSERT_TRUE(wait_until([&] { return logs.contains("retries exhausted"); }));
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(agent.spawn_count(), 3);
    EXPECT_EQ(runtime->runtime_state().state, RuntimeState::Error);
}

TEST(RuntimeTest, PromptHandshakeFailureSchedulesPrewarm)
{
    FakeAgent agent;
    agent.failing_handshakes = 1;
    auto runtime = make_runtime(agent);

    EXPECT_THROW(runtime->run_prompt("hi"), HandshakeError);

    ASSERT_TRUE(wait_until([&] { return runtime->runtime_state().session_ready; }));
    EXPECT_EQ(agent.spawn_count(), 2);
}
